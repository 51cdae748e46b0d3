#include "utils/zmq_context.hpp"
#include "utils/logger.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace zonechat::utils
{

namespace
{
std::unique_ptr<zmq::context_t> g_context;
std::mutex g_context_mutex;

void do_zmq_context_startup(const char * /*arg*/)
{
    zmq_context_startup();
}

void do_zmq_context_shutdown(const char * /*arg*/)
{
    zmq_context_shutdown();
}
} // namespace

zmq::context_t &get_zmq_context()
{
    std::lock_guard<std::mutex> lock(g_context_mutex);
    if (!g_context)
    {
        throw std::logic_error("ZMQContext: context not initialized (register GetZMQContextModule)");
    }
    return *g_context;
}

void zmq_context_startup()
{
    std::lock_guard<std::mutex> lock(g_context_mutex);
    if (!g_context)
    {
        g_context = std::make_unique<zmq::context_t>(1);
        LOGGER_INFO("ZMQContext: ZeroMQ context created.");
    }
}

void zmq_context_shutdown()
{
    std::lock_guard<std::mutex> lock(g_context_mutex);
    if (!g_context)
    {
        return;
    }
    g_context.reset();
    LOGGER_INFO("ZMQContext: ZeroMQ context destroyed.");
}

ModuleDef GetZMQContextModule()
{
    ModuleDef module("ZMQContext");
    module.add_dependency("Logger");
    module.set_startup(&do_zmq_context_startup);
    module.set_shutdown(&do_zmq_context_shutdown);
    return module;
}

} // namespace zonechat::utils
