#pragma once
/**
 * @file file_lock.hpp
 * @brief Scoped advisory lock on a sibling lock file (flock(2)).
 *
 * ```cpp
 * FileLock lock(state_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
 * if (!lock.valid())
 *     return lock.error_code(); // resource_unavailable_try_again: someone holds it
 * ```
 *
 * The target is never opened. `/a/daemon` locks `/a/daemon.lock`; the directory
 * `/a/dir` locks `/a/dir.dir.lock`. The lock also excludes other FileLocks in the
 * same process, which flock alone does not do across separate open() calls.
 *
 * @see tests/test_layer2_service/test_filelock_singleprocess.cpp
 */
#include <chrono>
#include <filesystem>
#include <optional>
#include <system_error>

#include "utils/module_def.hpp"
#include "walkie_utils_export.h"

namespace walkie::utils
{

enum class LockMode
{
    Blocking,
    NonBlocking,
};

enum class ResourceType
{
    File,
    Directory,
};

class WALKIE_UTILS_EXPORT FileLock
{
  public:
    /// Absolute lock-file path for @p path, or an empty path if @p path is unusable.
    static std::filesystem::path get_expected_lock_fullname_for(const std::filesystem::path &path,
                                                                ResourceType type) noexcept;

    /**
     * Failure to acquire does not throw; see valid() and error_code().
     * @throws std::logic_error if the FileLock module is not running.
     */
    FileLock(const std::filesystem::path &path, ResourceType type,
             LockMode mode = LockMode::Blocking);

    /// Waits at most @p timeout; error_code() is `timed_out` when it expires.
    FileLock(const std::filesystem::path &path, ResourceType type,
             std::chrono::milliseconds timeout);

    FileLock(FileLock &&other) noexcept;
    FileLock &operator=(FileLock &&other) noexcept;
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;
    ~FileLock();

    [[nodiscard]] bool valid() const noexcept { return m_fd >= 0; }
    [[nodiscard]] std::error_code error_code() const noexcept { return m_error; }
    [[nodiscard]] std::optional<std::filesystem::path> get_lock_file_path() const noexcept;

    /// With @p remove_file the lock file is unlinked before the lock is dropped.
    void release(bool remove_file = false) noexcept;

    static ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

  private:
    void acquire(const std::filesystem::path &path, ResourceType type, LockMode mode,
                 std::optional<std::chrono::milliseconds> timeout);

    std::filesystem::path m_lock_path;
    int m_fd = -1;
    std::error_code m_error;
};

} // namespace walkie::utils
