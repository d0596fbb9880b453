/**
 * @file zmq_context.cpp
 */
#include "utils/zmq_context.hpp"
#include "wk_service.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace walkie::utils
{

namespace
{

std::mutex g_mutex;
std::unique_ptr<zmq::context_t> g_context;

void start_context()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_context)
        return;
    g_context = std::make_unique<zmq::context_t>(1);
    int major = 0, minor = 0, patch = 0;
    zmq::version(&major, &minor, &patch);
    LOGGER_DEBUG("ZMQContext: libzmq {}.{}.{} context created", major, minor, patch);
}

void stop_context()
{
    std::unique_ptr<zmq::context_t> context;
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        context.swap(g_context);
    }
    // Terminating blocks until every socket is closed, so do it outside the lock.
    context.reset();
}

} // namespace

zmq::context_t &get_zmq_context()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_context)
        throw std::logic_error("ZMQContext module is not running");
    return *g_context;
}

bool zmq_context_available() noexcept
{
    std::lock_guard<std::mutex> lock(g_mutex);
    return static_cast<bool>(g_context);
}

ModuleDef GetZMQContextModule()
{
    ModuleDef module("ZMQContext");
    module.add_dependency("walkie::utils::Logger");
    module.set_startup(&start_context);
    module.set_shutdown(&stop_context, std::chrono::milliseconds(2000));
    return module;
}

} // namespace walkie::utils
