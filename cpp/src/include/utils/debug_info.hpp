/**
 * @file debug_info.hpp
 * @brief `WK_DEBUG`: developer diagnostics written straight to stderr.
 *
 * These bypass the Logger on purpose: the lifecycle and file-lock code that uses them
 * runs before the Logger starts and after it stops. Compiled out unless the build
 * defines WALKIE_ENABLE_DEBUG_MESSAGES.
 */
#pragma once

#include <cstdio>

#include <fmt/format.h>

namespace walkie::debug
{

template <typename... Args>
inline void write_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[walkie-dbg] {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[walkie-dbg] <unformattable message: %s>\n", e.what());
    }
}

} // namespace walkie::debug

#ifndef WK_DEBUG
#if defined(WALKIE_ENABLE_DEBUG_MESSAGES)
#define WK_DEBUG(fmt, ...) ::walkie::debug::write_stderr(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define WK_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
