#include "relay_service.hpp"

#include "zc_service.hpp"
#include "utils/zmq_context.hpp"

#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <vector>

namespace zonechat::relay
{

namespace
{
// Relay poll timeout in milliseconds
constexpr std::chrono::milliseconds kPollTimeout{100};

/// Moves every pending multipart message from @p from to @p to. Returns the count.
uint64_t forward_pending(zmq::socket_t &from, zmq::socket_t &to)
{
    uint64_t count = 0;
    while (true)
    {
        std::vector<zmq::message_t> frames;
        auto got = zmq::recv_multipart(from, std::back_inserter(frames), zmq::recv_flags::dontwait);
        if (!got)
        {
            return count;
        }
        static_cast<void>(zmq::send_multipart(to, frames, zmq::send_flags::dontwait));
        ++count;
    }
}
} // namespace

RelayService::RelayService(Config cfg) : m_cfg(std::move(cfg)) {}

void RelayService::stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

RelayService::Stats RelayService::stats() const
{
    return Stats{m_forwarded.load(std::memory_order_relaxed),
                 m_subscriptions.load(std::memory_order_relaxed)};
}

void RelayService::run()
{
    auto &ctx = utils::get_zmq_context();
    zmq::socket_t frontend(ctx, zmq::socket_type::xsub);
    zmq::socket_t backend(ctx, zmq::socket_type::xpub);
    frontend.set(zmq::sockopt::linger, 0);
    backend.set(zmq::sockopt::linger, 0);

    frontend.bind(m_cfg.frontend);
    backend.bind(m_cfg.backend);
    const std::string bound_front = frontend.get(zmq::sockopt::last_endpoint);
    const std::string bound_back = backend.get(zmq::sockopt::last_endpoint);
    if (m_cfg.on_ready)
    {
        m_cfg.on_ready(bound_front, bound_back);
    }
    LOGGER_INFO("Relay: publishers -> {}, subscribers -> {}", bound_front, bound_back);

    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        std::array<zmq::pollitem_t, 2> items = {{{frontend.handle(), 0, ZMQ_POLLIN, 0},
                                                  {backend.handle(), 0, ZMQ_POLLIN, 0}}};
        try
        {
            zmq::poll(items.data(), items.size(), kPollTimeout);
            if ((items[0].revents & ZMQ_POLLIN) != 0)
            {
                m_forwarded.fetch_add(forward_pending(frontend, backend), std::memory_order_relaxed);
            }
            if ((items[1].revents & ZMQ_POLLIN) != 0)
            {
                m_subscriptions.fetch_add(forward_pending(backend, frontend),
                                          std::memory_order_relaxed);
            }
        }
        catch (const zmq::error_t &e)
        {
            if (e.num() == EINTR)
            {
                continue;
            }
            LOGGER_ERROR("Relay: {}", e.what());
            break;
        }
    }

    frontend.close();
    backend.close();
    const Stats s = stats();
    LOGGER_INFO("Relay: stopped ({} message(s), {} subscription frame(s) forwarded)",
                s.messages_forwarded, s.subscription_frames);
}

} // namespace zonechat::relay
