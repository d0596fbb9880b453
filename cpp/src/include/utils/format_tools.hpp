#pragma once
/**
 * @file format_tools.hpp
 * @brief Small string helpers shared by log lines and wire encoders.
 */
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "walkie_utils_export.h"

namespace walkie::format_tools
{

/// Local time as "YYYY-MM-DD HH:MM:SS.uuuuuu".
WALKIE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/// Lowercase hex, two digits per byte.
WALKIE_UTILS_EXPORT std::string bytes_to_hex(const uint8_t *data, size_t len);

/// Decodes exactly @p len bytes. False unless @p hex holds 2 * len hex digits.
WALKIE_UTILS_EXPORT bool hex_to_bytes(std::string_view hex, uint8_t *out, size_t len) noexcept;

/// Leading @p n characters of an id; log lines never print full topic hashes or keys.
constexpr std::string_view short_id(std::string_view id, size_t n = 8) noexcept
{
    return id.size() <= n ? id : id.substr(0, n);
}

/// Part after the last '/', for `std::source_location::file_name()`.
constexpr std::string_view filename_only(std::string_view path) noexcept
{
    const size_t slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

constexpr std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const size_t begin = str.find_first_not_of(kSpace);
    if (begin == std::string_view::npos)
        return {};
    return str.substr(begin, str.find_last_not_of(kSpace) - begin + 1);
}

} // namespace walkie::format_tools
