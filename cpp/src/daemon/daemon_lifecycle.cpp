#include "daemon_lifecycle.hpp"

#include "wk_service.hpp"

#include <fstream>
#include <system_error>

namespace walkie::daemon
{

namespace fs = std::filesystem;
using StartupResult = utils::Result<uint64_t, DaemonError>;

DaemonLifecycle::DaemonLifecycle(DaemonPaths paths) : m_paths(std::move(paths)) {}

DaemonLifecycle::~DaemonLifecycle()
{
    shutdown();
}

std::optional<uint64_t> DaemonLifecycle::read_pid_file(const fs::path &pid_file)
{
    std::ifstream in(pid_file);
    if (!in)
    {
        return std::nullopt;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    text = std::string(format_tools::trim_whitespace(text));
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
        text.size() > 19)
    {
        return std::nullopt;
    }
    const uint64_t pid = std::stoull(text);
    if (pid == 0)
    {
        return std::nullopt;
    }
    return pid;
}

StartupResult DaemonLifecycle::startup()
{
    if (active())
    {
        return StartupResult::ok(platform::get_pid());
    }

    // 1. Private directory.
    std::error_code ec;
    const bool created = fs::create_directories(m_paths.dir, ec);
    if (ec)
    {
        LOGGER_ERROR("Cannot create {}: {}", m_paths.dir.string(), ec.message());
        return StartupResult::error(DaemonError::StartupFailed);
    }
    if (created)
    {
        fs::permissions(m_paths.dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
        {
            LOGGER_WARN("Cannot restrict permissions of {}: {}", m_paths.dir.string(),
                        ec.message());
        }
    }

    const auto recorded_pid = read_pid_file(m_paths.pid);
    const int other_pid = recorded_pid ? static_cast<int>(*recorded_pid) : 0;

    // 2. Advisory lock. "<dir>/daemon" resolves to "<dir>/daemon.lock".
    auto lock = std::make_unique<utils::FileLock>(m_paths.dir / "daemon", utils::ResourceType::File,
                                                  utils::LockMode::NonBlocking);
    if (!lock->valid())
    {
        if (lock->error_code() == std::errc::resource_unavailable_try_again)
        {
            LOGGER_ERROR("Another walkie daemon holds {}", m_paths.lock.string());
            return StartupResult::error(DaemonError::AlreadyRunning, other_pid);
        }
        LOGGER_ERROR("Cannot lock {}: {}", m_paths.lock.string(), lock->error_code().message());
        return StartupResult::error(DaemonError::StartupFailed);
    }

    // 3. A live PID we do not own means another daemon that skipped the lock.
    const uint64_t own_pid = platform::get_pid();
    if (recorded_pid && *recorded_pid != own_pid && platform::is_process_alive(*recorded_pid))
    {
        LOGGER_ERROR("Daemon already running (pid {})", *recorded_pid);
        lock->release(false);
        return StartupResult::error(DaemonError::AlreadyRunning, other_pid);
    }
    if (recorded_pid)
    {
        LOGGER_INFO("Removing stale pid file (pid {})", *recorded_pid);
    }

    // 4. Our PID.
    {
        std::ofstream out(m_paths.pid, std::ios::trunc);
        out << own_pid << '\n';
        out.flush();
        if (!out)
        {
            LOGGER_ERROR("Cannot write {}", m_paths.pid.string());
            lock->release(true);
            return StartupResult::error(DaemonError::StartupFailed);
        }
    }

    // 5. Leftover socket from a crashed instance.
    if (fs::remove(m_paths.socket, ec))
    {
        LOGGER_INFO("Removed stale socket {}", m_paths.socket.string());
    }
    else if (ec)
    {
        LOGGER_ERROR("Cannot remove stale socket {}: {}", m_paths.socket.string(), ec.message());
        fs::remove(m_paths.pid, ec);
        lock->release(true);
        return StartupResult::error(DaemonError::StartupFailed);
    }

    m_lock = std::move(lock);
    LOGGER_INFO("Daemon lifecycle started: pid={} dir={}", own_pid, m_paths.dir.string());
    return StartupResult::ok(own_pid);
}

void DaemonLifecycle::shutdown() noexcept
{
    if (!m_lock)
    {
        return;
    }
    std::error_code ec;
    fs::remove(m_paths.socket, ec);
    fs::remove(m_paths.pid, ec);
    m_lock->release(/*remove_file=*/true);
    m_lock.reset();
    LOGGER_INFO("Daemon lifecycle released {}", m_paths.dir.string());
}

} // namespace walkie::daemon
