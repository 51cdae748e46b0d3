#pragma once
/**
 * @file channel_transport.hpp
 * @brief Abstract connection to the pub/sub relay.
 *
 * ChannelTransport owns everything that does not depend on the wire:
 *
 * - **Subscriptions**: every subscribed topic is remembered. When the state
 *   returns to Connected after having been Connected before, every topic is
 *   re-subscribed and listeners receive `on_recovered`.
 * - **Offline policy**: while not Connected, `typing` and `presence` are
 *   dropped (PublishStatus::Dropped); every other kind is refused
 *   (PublishStatus::Offline). While Connected a publish that the implementation
 *   accepted is reported as Accepted. This is not a delivery confirmation.
 * - **Duplicate suppression**: a `message` envelope whose id was seen within the
 *   last `dedup_window` inbound messages is delivered at most once.
 * - **Threading**: listeners and publish acks always run on the EventLoop.
 *   Implementations running their own threads must hand inbound data and state
 *   changes over with post_to_loop().
 *
 * Implementations: ZmqTransport (relay over ZeroMQ) and LocalTransport (in-process
 * LocalBus).
 */
#include "zonechat_core_export.h"
#include "zone/envelope.hpp"
#include "zone/event_loop.hpp"
#include "zone/types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>

namespace zonechat::zone
{

struct TransportListener
{
    std::function<void(const std::string &topic, const Envelope &env)> on_envelope;
    std::function<void(ConnectionState state)> on_state;
    std::function<void()> on_recovered;
};

using ListenerId = uint64_t;
using PublishAck = std::function<void(PublishStatus status)>;

class ZONECHAT_CORE_EXPORT ChannelTransport
{
  public:
    static constexpr size_t kDefaultDedupWindow = 512;

    explicit ChannelTransport(EventLoop &loop, size_t dedup_window = kDefaultDedupWindow);
    virtual ~ChannelTransport();

    ChannelTransport(const ChannelTransport &) = delete;
    ChannelTransport &operator=(const ChannelTransport &) = delete;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    void subscribe(const std::string &topic);
    void unsubscribe(const std::string &topic);

    /**
     * @brief Publishes @p env on @p topic under the offline policy.
     * @param ack Optional; invoked on the event loop with the same status that
     *            is returned.
     */
    PublishStatus publish(const std::string &topic, const Envelope &env, PublishAck ack = {});

    /** @brief Registers a listener; virtual so test doubles can observe registrations. */
    virtual ListenerId add_listener(TransportListener listener);
    void remove_listener(ListenerId id);

    [[nodiscard]] ConnectionState state() const noexcept { return m_state; }
    [[nodiscard]] const std::set<std::string> &subscriptions() const noexcept
    {
        return m_topics;
    }
    [[nodiscard]] EventLoop &loop() noexcept { return m_loop; }

  protected:
    virtual void do_subscribe(const std::string &topic) = 0;
    virtual void do_unsubscribe(const std::string &topic) = 0;
    /** @return false if the wire could not be handed to the relay. */
    virtual bool do_publish(const std::string &topic, const std::string &wire) = 0;

    /** @brief Decodes and dispatches one inbound frame. Loop thread only. */
    void deliver(const std::string &topic, const std::string &wire);

    /** @brief Records a state change and notifies listeners. Loop thread only. */
    void set_state(ConnectionState state);

    /**
     * @brief Posts @p task to the loop; the task is skipped if this transport
     *        has been destroyed by the time it runs.
     */
    void post_to_loop(std::function<void()> task);

  private:
    bool is_duplicate(const std::string &message_id);

    EventLoop &m_loop;
    ConnectionState m_state{ConnectionState::Offline};
    bool m_was_connected{false};
    std::set<std::string> m_topics;
    std::map<ListenerId, TransportListener> m_listeners;
    ListenerId m_next_listener{1};

    size_t m_dedup_window;
    std::deque<std::string> m_seen_order;
    std::unordered_set<std::string> m_seen;

    std::shared_ptr<bool> m_alive;
};

} // namespace zonechat::zone
