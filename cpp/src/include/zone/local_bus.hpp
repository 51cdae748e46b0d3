#pragma once
/**
 * @file local_bus.hpp
 * @brief In-process relay for embedding several clients in one process.
 *
 * LocalBus forwards every published frame to every attached LocalTransport
 * subscribed to exactly that topic, including the publisher itself (the same
 * echo a real relay produces). Delivery is posted to each receiver's EventLoop.
 *
 * set_online(false) simulates a relay outage: attached transports move to
 * Reconnecting and nothing is delivered until set_online(true), after which
 * each transport re-subscribes and raises `recovered`.
 */
#include "zonechat_core_export.h"
#include "zone/channel_transport.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace zonechat::zone
{

class LocalTransport;

class ZONECHAT_CORE_EXPORT LocalBus
{
  public:
    LocalBus() = default;
    LocalBus(const LocalBus &) = delete;
    LocalBus &operator=(const LocalBus &) = delete;

    void set_online(bool online);
    [[nodiscard]] bool online() const;

    /** @brief Total frames accepted for forwarding since construction. */
    [[nodiscard]] size_t published_count() const;

  private:
    friend class LocalTransport;

    void attach(LocalTransport *t);
    void detach(LocalTransport *t);
    void add_subscription(LocalTransport *t, const std::string &topic);
    void remove_subscription(LocalTransport *t, const std::string &topic);
    bool publish(const std::string &topic, const std::string &wire);

    mutable std::mutex m_mutex;
    bool m_online{true};
    size_t m_published{0};
    std::set<LocalTransport *> m_attached;
    std::map<std::string, std::set<LocalTransport *>> m_subscribers;
};

class ZONECHAT_CORE_EXPORT LocalTransport final : public ChannelTransport
{
  public:
    LocalTransport(EventLoop &loop, LocalBus &bus);
    ~LocalTransport() override;

    void connect() override;
    void disconnect() override;

  protected:
    void do_subscribe(const std::string &topic) override;
    void do_unsubscribe(const std::string &topic) override;
    bool do_publish(const std::string &topic, const std::string &wire) override;

  private:
    friend class LocalBus;

    // Called by LocalBus (any thread).
    void on_bus_frame(const std::string &topic, const std::string &wire);
    void on_bus_online(bool online);

    LocalBus &m_bus;
    bool m_attached{false};
};

} // namespace zonechat::zone
