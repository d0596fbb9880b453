#pragma once
/**
 * @file lifecycle.hpp
 * @brief Ordered startup and shutdown of the process-wide services.
 *
 * Each service (logger, file-lock registry, libsodium, ZeroMQ context) hands the
 * manager a ModuleDef. `initialize()` starts them so that every module runs after
 * its dependencies; `finalize()` stops the started ones in the opposite order, each
 * within its own shutdown timeout.
 *
 * ```cpp
 * int main()
 * {
 *     walkie::utils::LifecycleGuard lifecycle(walkie::utils::MakeModDefList(
 *         walkie::utils::Logger::GetLifecycleModule(),
 *         walkie::utils::GetZMQContextModule()));
 *     LOGGER_INFO("up");
 * } // stopped here
 * ```
 *
 * If a startup hook throws, the modules already running are stopped and
 * `initialize()` throws std::runtime_error. The manager counts as finalized then.
 */
#include "utils/module_def.hpp"
#include "walkie_utils_export.h"

#include <memory>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace walkie::utils
{

template <typename... Mods> std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::remove_cvref_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList takes ModuleDef rvalues only");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(Mods));
    (list.push_back(std::forward<Mods>(mods)), ...);
    return list;
}

class WALKIE_UTILS_EXPORT LifecycleManager
{
  public:
    /// The process-wide manager used by LifecycleGuard and the free functions below.
    static LifecycleManager &instance();

    /// A standalone manager with its own modules, unrelated to instance().
    LifecycleManager();
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

    /// @throws std::logic_error once initialize() has run.
    void register_module(ModuleDef &&def);

    /**
     * @brief Starts every registered module. Later calls do nothing.
     * @throws std::runtime_error on a duplicate name, an unknown dependency, a
     *         dependency cycle or a throwing startup hook.
     */
    void initialize(std::source_location caller);

    /// Stops started modules in reverse start order. Later calls do nothing.
    void finalize(std::source_location caller);

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] bool is_finalized() const noexcept;
    [[nodiscard]] bool is_module_started(std::string_view name) const;

    /// True for the first caller in the process only.
    [[nodiscard]] bool claim_ownership() noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

inline void RegisterModule(ModuleDef &&def)
{
    LifecycleManager::instance().register_module(std::move(def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline bool IsModuleStarted(std::string_view name)
{
    return LifecycleManager::instance().is_module_started(name);
}

/**
 * @class LifecycleGuard
 * @brief Scope owner of the process lifecycle.
 *
 * Only the first guard in a process registers its modules and initializes; it
 * finalizes when destroyed. Any later guard ignores its modules and does nothing.
 */
class WALKIE_UTILS_EXPORT LifecycleGuard
{
  public:
    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location caller = std::source_location::current());
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location caller = std::source_location::current());
    ~LifecycleGuard();

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;

    [[nodiscard]] bool is_owner() const noexcept { return m_owner; }

  private:
    std::source_location m_caller;
    bool m_owner = false;
};

} // namespace walkie::utils
