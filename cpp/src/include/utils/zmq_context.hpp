#pragma once
/**
 * @file zmq_context.hpp
 * @brief The process's single zmq::context_t, owned by the lifecycle module "ZMQContext".
 */
#include "walkie_utils_export.h"

#include <zmq.hpp>

#include "utils/module_def.hpp"

namespace walkie::utils
{

/// @throws std::logic_error outside the ZMQContext module's lifetime.
[[nodiscard]] WALKIE_UTILS_EXPORT zmq::context_t &get_zmq_context();

[[nodiscard]] WALKIE_UTILS_EXPORT bool zmq_context_available() noexcept;

/// Depends on the Logger. Its shutdown blocks until every socket of the context is closed.
WALKIE_UTILS_EXPORT ModuleDef GetZMQContextModule();

} // namespace walkie::utils
