#include "zone/local_bus.hpp"
#include "utils/logger.hpp"

#include <vector>

namespace zonechat::zone
{

// ============================================================================
// LocalBus
// ============================================================================

void LocalBus::set_online(bool online)
{
    std::vector<LocalTransport *> attached;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_online == online)
        {
            return;
        }
        m_online = online;
        attached.assign(m_attached.begin(), m_attached.end());
    }
    LOGGER_INFO("LocalBus: {}", online ? "online" : "offline");
    for (auto *t : attached)
    {
        t->on_bus_online(online);
    }
}

bool LocalBus::online() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_online;
}

size_t LocalBus::published_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_published;
}

void LocalBus::attach(LocalTransport *t)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attached.insert(t);
}

void LocalBus::detach(LocalTransport *t)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attached.erase(t);
    for (auto &[topic, subs] : m_subscribers)
    {
        subs.erase(t);
    }
}

void LocalBus::add_subscription(LocalTransport *t, const std::string &topic)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers[topic].insert(t);
}

void LocalBus::remove_subscription(LocalTransport *t, const std::string &topic)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_subscribers.find(topic);
    if (it == m_subscribers.end())
    {
        return;
    }
    it->second.erase(t);
    if (it->second.empty())
    {
        m_subscribers.erase(it);
    }
}

bool LocalBus::publish(const std::string &topic, const std::string &wire)
{
    std::vector<LocalTransport *> receivers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_online)
        {
            return false;
        }
        ++m_published;
        auto it = m_subscribers.find(topic);
        if (it != m_subscribers.end())
        {
            receivers.assign(it->second.begin(), it->second.end());
        }
    }
    for (auto *t : receivers)
    {
        t->on_bus_frame(topic, wire);
    }
    return true;
}

// ============================================================================
// LocalTransport
// ============================================================================

LocalTransport::LocalTransport(EventLoop &loop, LocalBus &bus) : ChannelTransport(loop), m_bus(bus)
{
}

LocalTransport::~LocalTransport()
{
    if (m_attached)
    {
        m_bus.detach(this);
    }
}

void LocalTransport::connect()
{
    if (m_attached)
    {
        return;
    }
    m_bus.attach(this);
    m_attached = true;
    for (const auto &topic : subscriptions())
    {
        m_bus.add_subscription(this, topic);
    }
    set_state(m_bus.online() ? ConnectionState::Connected : ConnectionState::Reconnecting);
}

void LocalTransport::disconnect()
{
    if (!m_attached)
    {
        return;
    }
    m_bus.detach(this);
    m_attached = false;
    set_state(ConnectionState::Offline);
}

void LocalTransport::do_subscribe(const std::string &topic)
{
    if (m_attached)
    {
        m_bus.add_subscription(this, topic);
    }
}

void LocalTransport::do_unsubscribe(const std::string &topic)
{
    if (m_attached)
    {
        m_bus.remove_subscription(this, topic);
    }
}

bool LocalTransport::do_publish(const std::string &topic, const std::string &wire)
{
    return m_attached && m_bus.publish(topic, wire);
}

void LocalTransport::on_bus_frame(const std::string &topic, const std::string &wire)
{
    post_to_loop([this, topic, wire] { deliver(topic, wire); });
}

void LocalTransport::on_bus_online(bool online)
{
    post_to_loop(
        [this, online]
        {
            if (m_attached)
            {
                set_state(online ? ConnectionState::Connected : ConnectionState::Reconnecting);
            }
        });
}

} // namespace zonechat::zone
