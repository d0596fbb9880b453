/**
 * @file shared_test_helpers.cpp
 */
#include "shared_test_helpers.h"

#include "wk_platform.hpp"

#include <fmt/format.h>

#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace walkie::tests::helper
{

std::optional<std::string> read_file(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const fs::path &path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot write " + path.string());
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
}

size_t count_lines(std::string_view text, std::string_view needle)
{
    size_t hits = 0;
    while (!text.empty())
    {
        const size_t eol = text.find('\n');
        const std::string_view line = text.substr(0, eol);
        if (line.find(needle) != std::string_view::npos)
            ++hits;
        if (eol == std::string_view::npos)
            break;
        text.remove_prefix(eol + 1);
    }
    return hits;
}

bool wait_for_string_in_file(const fs::path &path, std::string_view needle,
                             std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        if (auto text = read_file(path); text && text->find(needle) != std::string::npos)
            return true;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
}

TempDir::TempDir(std::string_view prefix)
{
    static std::atomic<unsigned> serial{0};
    m_path = fs::temp_directory_path() /
             fmt::format("{}-{}-{}", prefix, platform::get_pid(), serial.fetch_add(1));
    fs::remove_all(m_path);
    fs::create_directories(m_path);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(m_path, ec);
}

} // namespace walkie::tests::helper
