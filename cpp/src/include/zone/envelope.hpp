#pragma once
/**
 * @file envelope.hpp
 * @brief The only type that crosses the transport boundary.
 *
 * ## Wire format
 *
 * @code{.json}
 * { "kind": "message", "from": "<fingerprint>", "to": "<fingerprint>", "payload": { ... } }
 * @endcode
 *
 * | kind              | payload                      |
 * |-------------------|------------------------------|
 * | `message`         | ChatMessage object           |
 * | `typing`          | `{"handle": "..."}`          |
 * | `presence`        | `{"handle": "..."}`          |
 * | `count_sync`      | `{"count": N}`               |
 * | `history_req`     | `{}`                         |
 * | `history_res`     | array of ChatMessage         |
 * | `zone_descriptor` | Zone object                  |
 * | `zone_sync_req`   | `{}`                         |
 *
 * `to` is present only on addressed envelopes (`history_res`). An unrecognized
 * `kind` decodes to UnknownPayload, which every consumer ignores.
 */
#include "zonechat_core_export.h"
#include "zone/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zonechat::zone
{

struct MessageEvent
{
    ChatMessage message;
};

struct TypingEvent
{
    std::string handle;
};

struct PresenceEvent
{
    std::string handle;
};

struct CountSyncEvent
{
    int count{0};
};

struct HistoryRequest
{
};

struct HistoryResponse
{
    std::vector<ChatMessage> messages;
};

struct ZoneDescriptor
{
    Zone zone;
};

struct ZoneSyncRequest
{
};

struct UnknownPayload
{
    std::string kind;
};

using Payload = std::variant<MessageEvent, TypingEvent, PresenceEvent, CountSyncEvent,
                             HistoryRequest, HistoryResponse, ZoneDescriptor, ZoneSyncRequest,
                             UnknownPayload>;

struct Envelope
{
    std::string from;              ///< sender fingerprint
    std::optional<std::string> to; ///< addressee fingerprint, if any
    Payload payload;

    /** @brief Wire name of the payload arm (`"message"`, `"typing"`, ...). */
    [[nodiscard]] ZONECHAT_CORE_EXPORT std::string kind() const;

    /** @brief True for envelopes that may be dropped silently while offline. */
    [[nodiscard]] ZONECHAT_CORE_EXPORT bool is_ephemeral() const noexcept;

    template <typename T> [[nodiscard]] const T *as() const noexcept
    {
        return std::get_if<T>(&payload);
    }
};

/** @brief Serializes @p env to its JSON wire form. */
[[nodiscard]] ZONECHAT_CORE_EXPORT std::string encode_envelope(const Envelope &env);

/**
 * @brief Parses the JSON wire form.
 * @return std::nullopt for invalid JSON, a missing `kind`/`from`, or a payload that
 *         does not match its kind. Failures are logged at debug level.
 */
[[nodiscard]] ZONECHAT_CORE_EXPORT std::optional<Envelope> decode_envelope(std::string_view json);

} // namespace zonechat::zone
