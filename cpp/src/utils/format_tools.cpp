/**
 * @file format_tools.cpp
 */
#include "utils/format_tools.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace walkie::format_tools
{

namespace
{

int nibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    using namespace std::chrono;
    const auto whole = floor<seconds>(timestamp);
    const auto micros = duration_cast<microseconds>(timestamp - whole).count();

    const std::time_t t = system_clock::to_time_t(whole);
    std::tm local{};
    ::localtime_r(&t, &local);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", local, micros);
}

std::string bytes_to_hex(const uint8_t *data, size_t len)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i)
    {
        out[2 * i] = kDigits[data[i] >> 4];
        out[2 * i + 1] = kDigits[data[i] & 0x0F];
    }
    return out;
}

bool hex_to_bytes(std::string_view hex, uint8_t *out, size_t len) noexcept
{
    if (hex.size() != len * 2)
        return false;
    for (size_t i = 0; i < len; ++i)
    {
        const int hi = nibble(hex[2 * i]);
        const int lo = nibble(hex[2 * i + 1]);
        if ((hi | lo) < 0)
            return false;
        out[i] = static_cast<uint8_t>(hi << 4 | lo);
    }
    return true;
}

} // namespace walkie::format_tools
