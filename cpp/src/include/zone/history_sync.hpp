#pragma once
/**
 * @file history_sync.hpp
 * @brief Ordered chat log and peer-to-peer history replay.
 *
 * There is no canonical store. A client entering a zone asks with
 * `history_req`; every peer holding a non-empty log answers with its whole log
 * addressed to the requester. The requester merges each answer:
 * union by id, ordered by timestamp, stable for equal timestamps.
 */
#include "zonechat_core_export.h"
#include "zone/envelope.hpp"
#include "zone/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace zonechat::zone
{

class ZONECHAT_CORE_EXPORT MessageLog
{
  public:
    /**
     * @brief Inserts @p msg after every message with timestamp <= its own.
     * @return false if a message with the same id is already present.
     */
    bool append(ChatMessage msg);

    /** @brief Appends each message in order. Returns the number added. */
    size_t merge(const std::vector<ChatMessage> &messages);

    [[nodiscard]] const std::vector<ChatMessage> &messages() const noexcept { return m_messages; }
    [[nodiscard]] bool contains(const std::string &id) const { return m_ids.count(id) != 0; }
    [[nodiscard]] size_t size() const noexcept { return m_messages.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_messages.empty(); }
    void clear() noexcept;

  private:
    std::vector<ChatMessage> m_messages;
    std::unordered_set<std::string> m_ids;
};

class ZONECHAT_CORE_EXPORT HistorySynchronizer
{
  public:
    HistorySynchronizer(std::string self_fingerprint, MessageLog &log);

    /** @brief The `history_req` to publish on entering a zone. */
    [[nodiscard]] Envelope make_request() const;

    /**
     * @brief Reply to a peer's `history_req`, or nullopt when the request is our
     *        own or there is nothing to share.
     */
    [[nodiscard]] std::optional<Envelope> on_request(const Envelope &request) const;

    /**
     * @brief Merges a `history_res` addressed to us.
     * @return Number of messages added; 0 for responses addressed to others.
     */
    size_t on_response(const Envelope &response);

  private:
    std::string m_self;
    MessageLog &m_log;
};

} // namespace zonechat::zone
