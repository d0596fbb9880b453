#pragma once
/**
 * @file logger.hpp
 * @brief fmt-based logger with a background writer thread.
 *
 * The calling thread formats the line; a single worker owns the active Sink and
 * writes records in arrival order, so a slow disk never stalls the event loop.
 * `set_logfile`, `set_console` and `flush` run on the worker too and return once
 * it has carried them out.
 *
 * The worker exists between the lifecycle module's startup and shutdown
 * (`Logger::GetLifecycleModule()`). Outside that window records go straight to
 * stderr.
 *
 * ```cpp
 * LOGGER_INFO("Joined channel '{}' topic={}", name, format_tools::short_id(topic_hex));
 * ```
 */
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "utils/module_def.hpp"
#include "walkie_utils_export.h"

namespace walkie::utils
{

class WALKIE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    ~Logger();

    static ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

    /// trace, debug, info, warn, warning, error or system; case-insensitive.
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    /// False if the worker is not running; the current sink is kept then.
    bool set_console();
    /// Appends to @p path (created 0600). False if it cannot be opened or the worker is
    /// not running; the current sink is kept then.
    bool set_logfile(const std::filesystem::path &path);

    /// Returns once everything queued before the call is written and synced.
    void flush();

    void set_level(Level lvl) noexcept;
    [[nodiscard]] Level level() const noexcept;

    template <Level L, typename... Args>
    void write(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        if (!enabled(L))
            return;
        std::string text;
        try
        {
            text = fmt::format(fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &e)
        {
            text = std::string("[format error] ") + e.what();
        }
        submit(L, std::move(text));
    }

  private:
    Logger();

    [[nodiscard]] bool enabled(Level lvl) const noexcept;
    void submit(Level lvl, std::string &&text) noexcept;

    static void lifecycle_start();
    static void lifecycle_stop();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace walkie::utils

#define WALKIE_LOG_AT(lvl, fmt, ...)                                                               \
    ::walkie::utils::Logger::instance().write<::walkie::utils::Logger::Level::lvl>(                \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) WALKIE_LOG_AT(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) WALKIE_LOG_AT(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) WALKIE_LOG_AT(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) WALKIE_LOG_AT(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) WALKIE_LOG_AT(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) WALKIE_LOG_AT(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)
