#include "zone/zmq_transport.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"

#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

namespace zonechat::zone
{

namespace
{
/// How long the worker sleeps on the command queue before polling sockets.
constexpr std::chrono::milliseconds kWorkerPollInterval{20};
/// Upper bound of frames drained from the SUB socket per iteration.
constexpr int kMaxFramesPerIteration = 256;
constexpr size_t kWireFrameCount = 2;

std::atomic<uint64_t> g_monitor_seq{0};

/// Socket monitor that records connect/disconnect transitions.
class LinkMonitor : public zmq::monitor_t
{
  public:
    bool connected{false};
    bool changed{false};

    void on_event_connected(const zmq_event_t & /*event*/, const char *addr) override
    {
        LOGGER_DEBUG("ZmqTransport: connected to {}", addr);
        connected = true;
        changed = true;
    }
    void on_event_disconnected(const zmq_event_t & /*event*/, const char *addr) override
    {
        LOGGER_DEBUG("ZmqTransport: disconnected from {}", addr);
        connected = false;
        changed = true;
    }
    void on_event_connect_retried(const zmq_event_t & /*event*/, const char *addr) override
    {
        LOGGER_TRACE("ZmqTransport: retrying {}", addr);
        if (connected)
        {
            connected = false;
            changed = true;
        }
    }
};
} // namespace

// ============================================================================
// Worker commands
// ============================================================================

struct SubscribeCmd
{
    std::string topic;
};
struct UnsubscribeCmd
{
    std::string topic;
};
struct PublishCmd
{
    std::string topic;
    std::string wire;
};
struct StopCmd
{
};

using TransportCommand = std::variant<SubscribeCmd, UnsubscribeCmd, PublishCmd, StopCmd>;

// ============================================================================
// ZmqTransportImpl
// ============================================================================

class ZmqTransportImpl
{
  public:
    explicit ZmqTransportImpl(ZmqTransport &owner) : m_owner(owner) {}

    ~ZmqTransportImpl() { stop_worker(); }

    ZmqTransportImpl(const ZmqTransportImpl &) = delete;
    ZmqTransportImpl &operator=(const ZmqTransportImpl &) = delete;

    void enqueue(TransportCommand cmd)
    {
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_queue.push_back(std::move(cmd));
        }
        m_queue_cv.notify_one();
    }

    [[nodiscard]] bool running() const { return m_running.load(std::memory_order_acquire); }

    void start_worker(const std::set<std::string> &topics)
    {
        if (running())
        {
            return;
        }
        if (m_worker.joinable())
        {
            m_worker.join(); // previous worker exited on a setup failure
        }
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_queue.clear();
            for (const auto &topic : topics)
            {
                m_queue.emplace_back(SubscribeCmd{topic});
            }
        }
        m_running.store(true, std::memory_order_release);
        m_worker = std::thread(&ZmqTransportImpl::worker_loop, this);
    }

    void stop_worker()
    {
        if (!m_worker.joinable())
        {
            return;
        }
        enqueue(StopCmd{});
        m_worker.join();
        m_running.store(false, std::memory_order_release);
    }

  private:
    void worker_loop()
    {
        const auto &cfg = m_owner.m_cfg;
        const uint64_t seq = g_monitor_seq.fetch_add(1);

        std::optional<zmq::socket_t> pub;
        std::optional<zmq::socket_t> sub;
        LinkMonitor pub_monitor;
        LinkMonitor sub_monitor;
        try
        {
            auto &ctx = utils::get_zmq_context();
            pub.emplace(ctx, zmq::socket_type::pub);
            sub.emplace(ctx, zmq::socket_type::sub);
            for (auto *s : {&*pub, &*sub})
            {
                s->set(zmq::sockopt::linger, 0);
                s->set(zmq::sockopt::reconnect_ivl, cfg.reconnect_ivl_ms);
                s->set(zmq::sockopt::reconnect_ivl_max, cfg.reconnect_ivl_max_ms);
            }
            pub_monitor.init(*pub, "inproc://zonechat-transport-pub-" + std::to_string(seq),
                             ZMQ_EVENT_CONNECTED | ZMQ_EVENT_DISCONNECTED |
                                 ZMQ_EVENT_CONNECT_RETRIED);
            sub_monitor.init(*sub, "inproc://zonechat-transport-sub-" + std::to_string(seq),
                             ZMQ_EVENT_CONNECTED | ZMQ_EVENT_DISCONNECTED |
                                 ZMQ_EVENT_CONNECT_RETRIED);
            pub->connect(cfg.pub_endpoint);
            sub->connect(cfg.sub_endpoint);
            LOGGER_INFO("ZmqTransport: connecting pub={} sub={}", cfg.pub_endpoint,
                        cfg.sub_endpoint);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("ZmqTransport: socket setup failed: {}", e.what());
            m_owner.post_to_loop([this] { m_owner.set_state(ConnectionState::Offline); });
            m_running.store(false, std::memory_order_release);
            return;
        }

        bool was_up = false;
        while (true)
        {
            std::deque<TransportCommand> batch;
            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);
                m_queue_cv.wait_for(lock, kWorkerPollInterval, [this] { return !m_queue.empty(); });
                std::swap(batch, m_queue);
            }

            bool stop = false;
            for (auto &cmd : batch)
            {
                stop = std::visit([&](auto &c) { return handle_command(c, *pub, *sub); }, cmd);
                if (stop)
                {
                    break;
                }
            }
            if (stop)
            {
                break;
            }

            drain_inbound(*sub);

            while (pub_monitor.check_event(0))
            {
            }
            while (sub_monitor.check_event(0))
            {
            }
            const bool up = pub_monitor.connected && sub_monitor.connected;
            if (up != was_up)
            {
                was_up = up;
                const auto state = up ? ConnectionState::Connected : ConnectionState::Reconnecting;
                m_owner.post_to_loop([this, state] { m_owner.set_state(state); });
            }
        }

        pub_monitor.abort();
        sub_monitor.abort();
        pub->close();
        sub->close();
        LOGGER_INFO("ZmqTransport: worker stopped");
    }

    bool handle_command(SubscribeCmd &cmd, zmq::socket_t & /*pub*/, zmq::socket_t &sub)
    {
        sub.set(zmq::sockopt::subscribe, cmd.topic);
        return false;
    }

    bool handle_command(UnsubscribeCmd &cmd, zmq::socket_t & /*pub*/, zmq::socket_t &sub)
    {
        sub.set(zmq::sockopt::unsubscribe, cmd.topic);
        return false;
    }

    bool handle_command(PublishCmd &cmd, zmq::socket_t &pub, zmq::socket_t & /*sub*/)
    {
        try
        {
            std::array<zmq::const_buffer, kWireFrameCount> frames = {zmq::buffer(cmd.topic),
                                                                     zmq::buffer(cmd.wire)};
            if (!zmq::send_multipart(pub, frames, zmq::send_flags::dontwait))
            {
                LOGGER_WARN("ZmqTransport: send on '{}' would block; frame dropped", cmd.topic);
            }
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_WARN("ZmqTransport: send on '{}' failed: {}", cmd.topic, e.what());
        }
        return false;
    }

    bool handle_command(StopCmd & /*cmd*/, zmq::socket_t & /*pub*/, zmq::socket_t & /*sub*/)
    {
        return true;
    }

    void drain_inbound(zmq::socket_t &sub)
    {
        for (int i = 0; i < kMaxFramesPerIteration; ++i)
        {
            std::vector<zmq::message_t> frames;
            std::optional<size_t> got;
            try
            {
                got = zmq::recv_multipart(sub, std::back_inserter(frames),
                                          zmq::recv_flags::dontwait);
            }
            catch (const zmq::error_t &e)
            {
                LOGGER_WARN("ZmqTransport: receive failed: {}", e.what());
                return;
            }
            if (!got)
            {
                return;
            }
            if (frames.size() != kWireFrameCount)
            {
                LOGGER_DEBUG("ZmqTransport: dropped frame set of size {}", frames.size());
                continue;
            }
            m_owner.post_to_loop([this, topic = frames[0].to_string(),
                                  wire = frames[1].to_string()] { m_owner.deliver(topic, wire); });
        }
    }

    ZmqTransport &m_owner;
    std::deque<TransportCommand> m_queue;
    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::thread m_worker;
    std::atomic<bool> m_running{false};
};

// ============================================================================
// ZmqTransport
// ============================================================================

ZmqTransport::ZmqTransport(EventLoop &loop, Config cfg)
    : ChannelTransport(loop), m_cfg(std::move(cfg)),
      pImpl(std::make_unique<ZmqTransportImpl>(*this))
{
}

ZmqTransport::~ZmqTransport()
{
    pImpl->stop_worker();
}

void ZmqTransport::connect()
{
    if (pImpl->running())
    {
        return;
    }
    set_state(ConnectionState::Reconnecting);
    pImpl->start_worker(subscriptions());
}

void ZmqTransport::disconnect()
{
    pImpl->stop_worker();
    set_state(ConnectionState::Offline);
}

void ZmqTransport::do_subscribe(const std::string &topic)
{
    if (pImpl->running())
    {
        pImpl->enqueue(SubscribeCmd{topic});
    }
}

void ZmqTransport::do_unsubscribe(const std::string &topic)
{
    if (pImpl->running())
    {
        pImpl->enqueue(UnsubscribeCmd{topic});
    }
}

bool ZmqTransport::do_publish(const std::string &topic, const std::string &wire)
{
    if (!pImpl->running())
    {
        return false;
    }
    pImpl->enqueue(PublishCmd{topic, wire});
    return true;
}

} // namespace zonechat::zone
