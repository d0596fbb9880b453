#pragma once
/**
 * @file wk_service.hpp
 * @brief Layer 2: Service modules built on wk_base.
 *
 * Provides lifecycle management, logging, file locking, libsodium helpers, the shared
 * ZeroMQ context, and the single-threaded event loop the daemon runs on.
 */
#include "wk_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/file_lock.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/zmq_context.hpp"
#include "utils/event_loop.hpp"
#include "utils/line_framer.hpp"
