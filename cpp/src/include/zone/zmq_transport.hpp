#pragma once
/**
 * @file zmq_transport.hpp
 * @brief ChannelTransport over a ZeroMQ relay (zonechat-relay).
 *
 * A PUB socket connects to the relay's XSUB frontend and a SUB socket to its
 * XPUB backend. Both sockets live on a private worker thread fed by a command
 * queue; the public API only enqueues commands. Frames are `[topic, json]`.
 *
 * A socket monitor on each socket drives the connection state: Connected once
 * both sockets report a connection, Reconnecting after any disconnect or retry.
 * ZeroMQ reconnects on its own; on the way back to Connected the base class
 * re-subscribes and raises `recovered`.
 *
 * Requires the "ZMQContext" lifecycle module.
 */
#include "zonechat_core_export.h"
#include "zone/channel_transport.hpp"

#include <memory>
#include <string>

namespace zonechat::zone
{

class ZmqTransportImpl;

class ZONECHAT_CORE_EXPORT ZmqTransport final : public ChannelTransport
{
  public:
    struct Config
    {
        std::string pub_endpoint{"tcp://127.0.0.1:5580"}; ///< relay XSUB (we publish here)
        std::string sub_endpoint{"tcp://127.0.0.1:5581"}; ///< relay XPUB (we receive here)
        int reconnect_ivl_ms{1000};
        int reconnect_ivl_max_ms{10000};
    };

    ZmqTransport(EventLoop &loop, Config cfg);
    ~ZmqTransport() override;

    /** @brief Starts the worker and connects both sockets. Idempotent. */
    void connect() override;
    /** @brief Stops the worker and closes both sockets. Idempotent. */
    void disconnect() override;

  protected:
    void do_subscribe(const std::string &topic) override;
    void do_unsubscribe(const std::string &topic) override;
    bool do_publish(const std::string &topic, const std::string &wire) override;

  private:
    friend class ZmqTransportImpl;

    Config m_cfg;
    std::unique_ptr<ZmqTransportImpl> pImpl;
};

} // namespace zonechat::zone
