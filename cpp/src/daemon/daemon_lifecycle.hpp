#pragma once
/**
 * @file daemon_lifecycle.hpp
 * @brief Singleton enforcement and on-disk state of one daemon instance.
 *
 * Startup claims the private directory in this order:
 *  1. create the directory (0700) if missing;
 *  2. take a non-blocking advisory lock on `daemon.lock`;
 *  3. refuse to start if `daemon.pid` names another live process;
 *  4. write our PID;
 *  5. remove a leftover `daemon.sock`.
 *
 * Shutdown removes the socket path and PID file, then unlinks and releases the lock.
 */
#include "daemon_config.hpp"
#include "daemon_error.hpp"

#include "utils/file_lock.hpp"
#include "utils/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace walkie::daemon
{

class DaemonLifecycle
{
  public:
    explicit DaemonLifecycle(DaemonPaths paths);
    ~DaemonLifecycle();

    DaemonLifecycle(const DaemonLifecycle &) = delete;
    DaemonLifecycle &operator=(const DaemonLifecycle &) = delete;

    /**
     * @brief Claims the directory for this process.
     * @return Our PID; `AlreadyRunning` (error code = the other PID when known) or
     *         `StartupFailed` for filesystem errors, which are logged.
     */
    [[nodiscard]] utils::Result<uint64_t, DaemonError> startup();

    /// Removes socket, PID and lock files. Idempotent; a no-op if startup failed.
    void shutdown() noexcept;

    [[nodiscard]] bool active() const noexcept { return m_lock != nullptr; }
    [[nodiscard]] const DaemonPaths &paths() const noexcept { return m_paths; }

    /// PID recorded in @p pid_file, if it holds a positive integer.
    [[nodiscard]] static std::optional<uint64_t>
    read_pid_file(const std::filesystem::path &pid_file);

  private:
    DaemonPaths m_paths;
    std::unique_ptr<utils::FileLock> m_lock;
};

} // namespace walkie::daemon
