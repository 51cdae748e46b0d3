#include "zone/history_sync.hpp"
#include "utils/logger.hpp"

#include <algorithm>

namespace zonechat::zone
{

bool MessageLog::append(ChatMessage msg)
{
    if (m_ids.count(msg.id) != 0)
    {
        return false;
    }
    m_ids.insert(msg.id);
    auto pos = std::upper_bound(m_messages.begin(), m_messages.end(), msg.timestamp,
                                [](int64_t ts, const ChatMessage &m) { return ts < m.timestamp; });
    m_messages.insert(pos, std::move(msg));
    return true;
}

size_t MessageLog::merge(const std::vector<ChatMessage> &messages)
{
    size_t added = 0;
    for (const auto &m : messages)
    {
        if (append(m))
        {
            ++added;
        }
    }
    return added;
}

void MessageLog::clear() noexcept
{
    m_messages.clear();
    m_ids.clear();
}

HistorySynchronizer::HistorySynchronizer(std::string self_fingerprint, MessageLog &log)
    : m_self(std::move(self_fingerprint)), m_log(log)
{
}

Envelope HistorySynchronizer::make_request() const
{
    return Envelope{m_self, std::nullopt, HistoryRequest{}};
}

std::optional<Envelope> HistorySynchronizer::on_request(const Envelope &request) const
{
    if (request.from == m_self || m_log.empty())
    {
        return std::nullopt;
    }
    LOGGER_DEBUG("History: answering {} with {} message(s)", request.from, m_log.size());
    return Envelope{m_self, request.from, HistoryResponse{m_log.messages()}};
}

size_t HistorySynchronizer::on_response(const Envelope &response)
{
    const auto *res = response.as<HistoryResponse>();
    if (res == nullptr || !response.to.has_value() || *response.to != m_self)
    {
        return 0;
    }
    const size_t added = m_log.merge(res->messages);
    LOGGER_DEBUG("History: merged {} of {} message(s) from {}", added, res->messages.size(),
                 response.from);
    return added;
}

} // namespace zonechat::zone
