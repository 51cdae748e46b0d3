#include "zone/channel_transport.hpp"
#include "utils/logger.hpp"

#include <vector>

namespace zonechat::zone
{

ChannelTransport::ChannelTransport(EventLoop &loop, size_t dedup_window)
    : m_loop(loop), m_dedup_window(dedup_window), m_alive(std::make_shared<bool>(true))
{
}

ChannelTransport::~ChannelTransport() = default;

void ChannelTransport::subscribe(const std::string &topic)
{
    if (!m_topics.insert(topic).second)
    {
        return;
    }
    LOGGER_DEBUG("Transport: subscribe '{}'", topic);
    do_subscribe(topic);
}

void ChannelTransport::unsubscribe(const std::string &topic)
{
    if (m_topics.erase(topic) == 0)
    {
        return;
    }
    LOGGER_DEBUG("Transport: unsubscribe '{}'", topic);
    do_unsubscribe(topic);
}

PublishStatus ChannelTransport::publish(const std::string &topic, const Envelope &env,
                                        PublishAck ack)
{
    PublishStatus status = PublishStatus::Accepted;
    if (m_state != ConnectionState::Connected)
    {
        status = env.is_ephemeral() ? PublishStatus::Dropped : PublishStatus::Offline;
        LOGGER_DEBUG("Transport: {} '{}' while {} ({})", env.kind(), topic, to_string(m_state),
                     to_string(status));
    }
    else if (!do_publish(topic, encode_envelope(env)))
    {
        status = PublishStatus::Failed;
        LOGGER_WARN("Transport: publish of {} on '{}' failed", env.kind(), topic);
    }

    if (ack)
    {
        post_to_loop([ack = std::move(ack), status] { ack(status); });
    }
    return status;
}

ListenerId ChannelTransport::add_listener(TransportListener listener)
{
    const ListenerId id = m_next_listener++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void ChannelTransport::remove_listener(ListenerId id)
{
    m_listeners.erase(id);
}

void ChannelTransport::deliver(const std::string &topic, const std::string &wire)
{
    if (m_topics.count(topic) == 0)
    {
        LOGGER_TRACE("Transport: ignoring frame for unsubscribed topic '{}'", topic);
        return;
    }
    auto env = decode_envelope(wire);
    if (!env)
    {
        return;
    }
    if (const auto *msg = env->as<MessageEvent>(); msg != nullptr && is_duplicate(msg->message.id))
    {
        LOGGER_DEBUG("Transport: duplicate message {} suppressed", msg->message.id);
        return;
    }

    // Listeners may add or remove listeners while being called.
    std::vector<TransportListener> snapshot;
    snapshot.reserve(m_listeners.size());
    for (const auto &[id, l] : m_listeners)
    {
        snapshot.push_back(l);
    }
    for (const auto &l : snapshot)
    {
        if (l.on_envelope)
        {
            l.on_envelope(topic, *env);
        }
    }
}

void ChannelTransport::set_state(ConnectionState state)
{
    if (state == m_state)
    {
        return;
    }
    const bool recovering = state == ConnectionState::Connected && m_was_connected;
    m_state = state;
    LOGGER_INFO("Transport: state -> {}", to_string(state));

    if (recovering)
    {
        for (const auto &topic : m_topics)
        {
            do_unsubscribe(topic);
            do_subscribe(topic);
        }
    }
    if (state == ConnectionState::Connected)
    {
        m_was_connected = true;
    }

    std::vector<TransportListener> snapshot;
    snapshot.reserve(m_listeners.size());
    for (const auto &[id, l] : m_listeners)
    {
        snapshot.push_back(l);
    }
    for (const auto &l : snapshot)
    {
        if (l.on_state)
        {
            l.on_state(state);
        }
    }
    if (recovering)
    {
        LOGGER_INFO("Transport: recovered, {} topic(s) re-subscribed", m_topics.size());
        for (const auto &l : snapshot)
        {
            if (l.on_recovered)
            {
                l.on_recovered();
            }
        }
    }
}

void ChannelTransport::post_to_loop(std::function<void()> task)
{
    std::weak_ptr<bool> alive = m_alive;
    m_loop.post(
        [alive = std::move(alive), task = std::move(task)]
        {
            if (alive.lock())
            {
                task();
            }
        });
}

bool ChannelTransport::is_duplicate(const std::string &message_id)
{
    if (m_dedup_window == 0)
    {
        return false;
    }
    if (m_seen.count(message_id) != 0)
    {
        return true;
    }
    m_seen.insert(message_id);
    m_seen_order.push_back(message_id);
    if (m_seen_order.size() > m_dedup_window)
    {
        m_seen.erase(m_seen_order.front());
        m_seen_order.pop_front();
    }
    return false;
}

} // namespace zonechat::zone
