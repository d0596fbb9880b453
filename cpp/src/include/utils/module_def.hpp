#pragma once
/**
 * @file module_def.hpp
 * @brief Description of one process-wide service handed to the LifecycleManager.
 */
#include "walkie_utils_export.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace walkie::utils
{

/// Plain function pointer so module hooks carry no captured state across the library boundary.
using LifecycleCallback = void (*)();

/**
 * @class ModuleDef
 * @brief Name, dependencies and start/stop hooks of a lifecycle module.
 *
 * ```cpp
 * ModuleDef module("ZMQContext");
 * module.add_dependency("walkie::utils::Logger");
 * module.set_startup(&start_context);
 * module.set_shutdown(&stop_context, std::chrono::milliseconds(2000));
 * ```
 */
class WALKIE_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name` is longer than MAX_MODULE_NAME_LEN.
     */
    explicit ModuleDef(std::string_view name);

    ModuleDef(ModuleDef &&) noexcept = default;
    ModuleDef &operator=(ModuleDef &&) noexcept = default;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// Started before this module, stopped after it. Empty names are ignored.
    /// @throws std::length_error if the name is longer than MAX_MODULE_NAME_LEN.
    void add_dependency(std::string_view name);

    void set_startup(LifecycleCallback fn) noexcept { m_startup = fn; }

    /// @param timeout Longest wait for @p fn; zero waits forever.
    void set_shutdown(LifecycleCallback fn, std::chrono::milliseconds timeout) noexcept
    {
        m_shutdown = fn;
        m_shutdown_timeout = timeout;
    }

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }
    [[nodiscard]] const std::vector<std::string> &dependencies() const noexcept
    {
        return m_dependencies;
    }
    [[nodiscard]] LifecycleCallback startup() const noexcept { return m_startup; }
    [[nodiscard]] LifecycleCallback shutdown() const noexcept { return m_shutdown; }
    [[nodiscard]] std::chrono::milliseconds shutdown_timeout() const noexcept
    {
        return m_shutdown_timeout;
    }

  private:
    std::string m_name;
    std::vector<std::string> m_dependencies;
    LifecycleCallback m_startup = nullptr;
    LifecycleCallback m_shutdown = nullptr;
    std::chrono::milliseconds m_shutdown_timeout{0};
};

} // namespace walkie::utils
