#pragma once
/**
 * @file wk_platform.hpp
 * @brief Layer 0: platform checks and the handful of OS queries the rest of walkie needs.
 *
 * Local clients reach the daemon over a Unix domain socket and the singleton is
 * enforced with flock(2), so only POSIX targets build.
 */
#include <cstdint>
#include <string>

#if defined(__linux__)
#define WALKIE_PLATFORM_LINUX 1
#elif defined(__APPLE__) && defined(__MACH__)
#define WALKIE_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define WALKIE_PLATFORM_FREEBSD 1
#endif

#if !defined(__unix__) && !defined(__APPLE__)
#error "walkie needs Unix domain sockets and flock(2)."
#endif

#if __cplusplus < 202002L
#error "walkie is written against C++20."
#endif

#include "walkie_utils_export.h"

namespace walkie::platform
{

WALKIE_UTILS_EXPORT uint64_t get_pid() noexcept;

/// Kernel thread id where the OS exposes one, else a hash of std::thread::id.
WALKIE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/// Basename of the running binary, or its absolute path with @p include_path.
/// Returns "unknown" when it cannot be determined.
WALKIE_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/// "major.minor.patch" as configured by CMake.
WALKIE_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief kill(pid, 0) liveness check. EPERM counts as alive: the process exists under
 *        another user. PID 0 is never alive.
 */
WALKIE_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/// Wall-clock milliseconds since the Unix epoch.
WALKIE_UTILS_EXPORT int64_t epoch_time_ms() noexcept;

/// $HOME, else the passwd entry of the real uid, else an empty string.
WALKIE_UTILS_EXPORT std::string get_home_directory();

} // namespace walkie::platform
