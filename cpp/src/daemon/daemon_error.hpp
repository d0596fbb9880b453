#pragma once
/**
 * @file daemon_error.hpp
 * @brief Expected, caller-visible failures of daemon operations.
 *
 * Carried in `walkie::utils::Result<T, DaemonError>`. The control server renders the
 * client-facing message; `to_string()` gives the canonical name for logs.
 */
#include <string_view>

namespace walkie::daemon
{

enum class DaemonError
{
    NotInChannel,
    MessageTooLarge,
    UnknownAction,
    InvalidRequest,
    RequestTooLarge,
    AlreadyRunning,
    StartupFailed,
};

constexpr std::string_view to_string(DaemonError err) noexcept
{
    switch (err)
    {
    case DaemonError::NotInChannel:
        return "NotInChannel";
    case DaemonError::MessageTooLarge:
        return "MessageTooLarge";
    case DaemonError::UnknownAction:
        return "UnknownAction";
    case DaemonError::InvalidRequest:
        return "InvalidRequest";
    case DaemonError::RequestTooLarge:
        return "RequestTooLarge";
    case DaemonError::AlreadyRunning:
        return "AlreadyRunning";
    case DaemonError::StartupFailed:
        return "StartupFailed";
    }
    return "Unknown";
}

} // namespace walkie::daemon
