/**
 * @file platform.cpp
 * @brief POSIX implementations of walkie::platform.
 */
#include "wk_platform.hpp"
#include "walkie_version.h"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <thread>
#include <vector>

#include <pwd.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(WALKIE_PLATFORM_LINUX)
#include <sys/syscall.h>
#elif defined(WALKIE_PLATFORM_APPLE)
#include <mach-o/dyld.h>
#include <pthread.h>
#endif

namespace walkie::platform
{

namespace
{

std::string executable_path()
{
#if defined(WALKIE_PLATFORM_LINUX)
    std::error_code ec;
    auto target = std::filesystem::read_symlink("/proc/self/exe", ec);
    return ec ? std::string{} : target.string();
#elif defined(WALKIE_PLATFORM_APPLE)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buf(size + 1, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0)
        return {};
    return std::string(buf.data());
#else
    return {};
#endif
}

} // namespace

uint64_t get_pid() noexcept
{
    return static_cast<uint64_t>(::getpid());
}

uint64_t get_native_thread_id() noexcept
{
#if defined(WALKIE_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#elif defined(WALKIE_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    return std::hash<std::thread::id>{}(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        const std::string path = executable_path();
        if (path.empty())
            return "unknown";
        return include_path ? path : std::filesystem::path(path).filename().string();
    }
    catch (const std::exception &)
    {
        return "unknown";
    }
}

const char *get_version_string() noexcept
{
    return WALKIE_VERSION_STRING;
}

bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0 || pid > static_cast<uint64_t>(INT_MAX))
        return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno == EPERM;
}

int64_t epoch_time_ms() noexcept
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string get_home_directory()
{
    const char *home = std::getenv("HOME");
    if (home != nullptr && *home != '\0')
        return home;

    long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(hint > 0 ? static_cast<size_t>(hint) : 16384);
    struct passwd entry{};
    struct passwd *found = nullptr;
    if (::getpwuid_r(::getuid(), &entry, buf.data(), buf.size(), &found) != 0 ||
        found == nullptr || found->pw_dir == nullptr)
    {
        return {};
    }
    return found->pw_dir;
}

} // namespace walkie::platform
