#pragma once
/**
 * @file zmq_context.hpp
 * @brief Shared ZeroMQ context as a lifecycle module.
 *
 * All ZMQ sockets in the process are created from this context. Register
 * GetZMQContextModule() with the LifecycleGuard, then call get_zmq_context().
 */
#include "zonechat_core_export.h"
#include "utils/module_def.hpp"

#include <zmq.hpp>

namespace zonechat::utils
{

/**
 * @brief Returns the global ZeroMQ context.
 * @throws std::logic_error if the context has not been started.
 */
[[nodiscard]] ZONECHAT_CORE_EXPORT zmq::context_t &get_zmq_context();

/** @brief Creates the global context. Idempotent. */
ZONECHAT_CORE_EXPORT void zmq_context_startup();

/** @brief Destroys the global context. Idempotent. */
ZONECHAT_CORE_EXPORT void zmq_context_shutdown();

/** @brief ModuleDef "ZMQContext" (depends on "Logger"). */
ZONECHAT_CORE_EXPORT ModuleDef GetZMQContextModule();

} // namespace zonechat::utils
