/**
 * @file file_lock.cpp
 */
#include "wk_base.hpp"
#include "utils/file_lock.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace walkie::utils
{

namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollInterval{20};

std::atomic<bool> g_module_running{false};

// Lock files currently held by a FileLock of this process.
std::mutex g_held_mutex;
std::condition_variable g_held_cv;
std::set<std::string> g_held;

std::error_code errno_code(int err)
{
    return {err, std::generic_category()};
}

bool claim_in_process(const std::string &key, LockMode mode,
                      std::optional<Clock::time_point> deadline, std::error_code &ec)
{
    std::unique_lock<std::mutex> lock(g_held_mutex);
    const auto is_free = [&key] { return !g_held.contains(key); };
    if (!is_free())
    {
        if (mode == LockMode::NonBlocking)
        {
            ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        if (!deadline)
        {
            g_held_cv.wait(lock, is_free);
        }
        else if (!g_held_cv.wait_until(lock, *deadline, is_free))
        {
            ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
    }
    g_held.insert(key);
    return true;
}

void unclaim_in_process(const std::string &key) noexcept
{
    {
        std::lock_guard<std::mutex> lock(g_held_mutex);
        g_held.erase(key);
    }
    g_held_cv.notify_all();
}

/// flock(LOCK_EX) on @p fd: waits forever, not at all, or until @p deadline.
std::error_code lock_fd(int fd, LockMode mode, std::optional<Clock::time_point> deadline)
{
    if (mode == LockMode::Blocking && !deadline)
    {
        while (::flock(fd, LOCK_EX) != 0)
        {
            if (errno != EINTR)
                return errno_code(errno);
        }
        return {};
    }

    for (;;)
    {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0)
            return {};
        const int err = errno;
        if (err != EWOULDBLOCK && err != EINTR)
            return errno_code(err);
        if (mode == LockMode::NonBlocking)
            return std::make_error_code(std::errc::resource_unavailable_try_again);
        if (Clock::now() >= *deadline)
            return std::make_error_code(std::errc::timed_out);
        std::this_thread::sleep_for(kPollInterval);
    }
}

void module_start()
{
    g_module_running.store(true, std::memory_order_release);
}

void module_stop()
{
    g_module_running.store(false, std::memory_order_release);
}

} // namespace

std::filesystem::path FileLock::get_expected_lock_fullname_for(const std::filesystem::path &path,
                                                               ResourceType type) noexcept
{
    namespace fs = std::filesystem;
    if (path.empty())
        return {};
    for (unsigned char c : path.native())
    {
        if (c < 0x20)
            return {};
    }

    try
    {
        std::error_code ec;
        fs::path target = fs::weakly_canonical(path, ec);
        if (ec)
            target = fs::absolute(path).lexically_normal();

        if (type == ResourceType::File)
            return target += ".lock";

        if (!target.has_filename())
            target = target.parent_path();
        fs::path name = target.filename();
        if (name.empty() || name == "." || name == "..")
            name = "walkie_root";
        name += ".dir.lock";
        return target.parent_path() / name;
    }
    catch (const std::exception &)
    {
        return {};
    }
}

FileLock::FileLock(const std::filesystem::path &path, ResourceType type, LockMode mode)
{
    acquire(path, type, mode, std::nullopt);
}

FileLock::FileLock(const std::filesystem::path &path, ResourceType type,
                   std::chrono::milliseconds timeout)
{
    acquire(path, type, LockMode::Blocking, timeout);
}

FileLock::FileLock(FileLock &&other) noexcept
    : m_lock_path(std::move(other.m_lock_path)), m_fd(std::exchange(other.m_fd, -1)),
      m_error(other.m_error)
{
}

FileLock &FileLock::operator=(FileLock &&other) noexcept
{
    if (this != &other)
    {
        release();
        m_lock_path = std::move(other.m_lock_path);
        m_fd = std::exchange(other.m_fd, -1);
        m_error = other.m_error;
    }
    return *this;
}

FileLock::~FileLock()
{
    release();
}

void FileLock::acquire(const std::filesystem::path &path, ResourceType type, LockMode mode,
                       std::optional<std::chrono::milliseconds> timeout)
{
    if (!lifecycle_initialized())
        throw std::logic_error("FileLock used before the FileLock module was started");

    std::optional<Clock::time_point> deadline;
    if (timeout)
        deadline = Clock::now() + *timeout;

    m_lock_path = get_expected_lock_fullname_for(path, type);
    if (m_lock_path.empty())
    {
        m_error = std::make_error_code(std::errc::invalid_argument);
        return;
    }
    const std::string key = m_lock_path.string();
    if (!claim_in_process(key, mode, deadline, m_error))
        return;
    auto unclaim = basics::make_scope_guard([&key]() noexcept { unclaim_in_process(key); });

    std::error_code ec;
    std::filesystem::create_directories(m_lock_path.parent_path(), ec);
    if (ec)
    {
        m_error = ec;
        return;
    }

    const int fd = ::open(m_lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (fd < 0)
    {
        m_error = errno_code(errno);
        return;
    }
    m_error = lock_fd(fd, mode, deadline);
    if (m_error)
    {
        ::close(fd);
        return;
    }

    WK_DEBUG("FileLock: pid {} holds {}", platform::get_pid(), key);
    m_fd = fd;
    unclaim.dismiss();
}

std::optional<std::filesystem::path> FileLock::get_lock_file_path() const noexcept
{
    if (!valid())
        return std::nullopt;
    return m_lock_path;
}

void FileLock::release(bool remove_file) noexcept
{
    if (m_fd < 0)
        return;
    if (remove_file)
        ::unlink(m_lock_path.c_str());
    ::flock(m_fd, LOCK_UN);
    ::close(m_fd);
    m_fd = -1;
    unclaim_in_process(m_lock_path.string());
}

bool FileLock::lifecycle_initialized() noexcept
{
    return g_module_running.load(std::memory_order_acquire);
}

ModuleDef FileLock::GetLifecycleModule()
{
    ModuleDef module("walkie::utils::FileLock");
    module.set_startup(&module_start);
    module.set_shutdown(&module_stop, std::chrono::milliseconds(2000));
    return module;
}

} // namespace walkie::utils
