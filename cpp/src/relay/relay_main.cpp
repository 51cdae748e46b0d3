#include "zc_service.hpp"
#include "relay_service.hpp"
#include "utils/zmq_context.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>

namespace
{
zonechat::relay::RelayService *g_relay = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    if (g_relay != nullptr)
    {
        g_relay->stop();
    }
}
} // namespace

int main(int argc, char *argv[])
{
    zonechat::utils::LifecycleGuard lifecycle(zonechat::utils::MakeModDefList(
        zonechat::utils::Logger::GetLifecycleModule(), zonechat::utils::GetZMQContextModule()));

    if (const char *lvl = std::getenv("ZONECHAT_LOG_LEVEL"))
    {
        if (auto parsed = zonechat::utils::Logger::level_from_string(lvl))
        {
            zonechat::utils::Logger::instance().set_level(*parsed);
        }
        else
        {
            LOGGER_WARN("zonechat-relay: ignoring unknown ZONECHAT_LOG_LEVEL '{}'", lvl);
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    zonechat::relay::RelayService::Config cfg;
    if (argc >= 2) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    {
        cfg.frontend = argv[1]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (argc >= 3) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    {
        cfg.backend = argv[2]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    zonechat::relay::RelayService relay(cfg);
    g_relay = &relay;

    LOGGER_INFO("zonechat-relay starting on {} / {}", cfg.frontend, cfg.backend);
    try
    {
        relay.run();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("zonechat-relay: {}", e.what());
        g_relay = nullptr;
        return 1;
    }
    g_relay = nullptr;
    return 0;
}
