#pragma once
/**
 * @file relay_service.hpp
 * @brief zonechat relay: a ZeroMQ XSUB/XPUB forwarder.
 *
 * Clients' PUB sockets connect to the frontend (XSUB); their SUB sockets
 * connect to the backend (XPUB). Data frames flow frontend to backend and
 * subscription frames flow back. The relay knows nothing about zones and
 * adds no ordering, durability or delivery guarantee.
 */
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace zonechat::relay
{

class RelayService
{
  public:
    struct Config
    {
        std::string frontend{"tcp://0.0.0.0:5580"}; ///< XSUB, clients publish here
        std::string backend{"tcp://0.0.0.0:5581"};  ///< XPUB, clients subscribe here

        /// Called from run() after both sockets are bound, with the actual endpoints.
        std::function<void(const std::string &frontend, const std::string &backend)> on_ready;
    };

    struct Stats
    {
        uint64_t messages_forwarded{0};
        uint64_t subscription_frames{0};
    };

    explicit RelayService(Config cfg);

    /** @brief Binds and forwards until stop() is called. Requires "ZMQContext". */
    void run();

    /** @brief Thread-safe; run() returns within one poll interval. */
    void stop();

    [[nodiscard]] Stats stats() const;

  private:
    Config m_cfg;
    std::atomic<bool> m_stop_requested{false};
    std::atomic<uint64_t> m_forwarded{0};
    std::atomic<uint64_t> m_subscriptions{0};
};

} // namespace zonechat::relay
