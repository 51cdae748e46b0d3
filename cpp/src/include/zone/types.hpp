#pragma once
/**
 * @file types.hpp
 * @brief Value types shared by every zonechat component.
 *
 * All timestamps are epoch milliseconds (int64_t). JSON field names are the
 * wire names used inside envelopes (see envelope.hpp).
 */
#include "zonechat_core_export.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zonechat::zone
{

struct GeoPoint
{
    double lat{0.0};
    double lng{0.0};
};

enum class Visibility
{
    Public,
    Private,
};

/**
 * @brief A short-lived chat zone advertised on the discovery topic.
 *
 * Created by its host; every re-broadcast replaces the cached copy wholesale.
 * Meaningful only while `now < expires_at`.
 */
struct Zone
{
    std::string id;
    std::string name;
    Visibility visibility{Visibility::Public};
    std::string host_fingerprint;
    std::optional<std::string> password_digest; ///< lower-case hex, private zones only
    GeoPoint center;
    int64_t created_at{0};
    int64_t expires_at{0};
    int member_count{1};

    [[nodiscard]] bool is_expired(int64_t now_ms) const noexcept { return expires_at <= now_ms; }
};

enum class MessageKind
{
    Text,
    Image,
    Audio,
    Video,
    SystemJoin,
    SystemLeave,
};

/** @brief One chat line. Never mutated after creation. */
struct ChatMessage
{
    std::string id;
    std::string sender;
    std::string sender_fingerprint;
    int64_t timestamp{0};
    MessageKind kind{MessageKind::Text};
    std::optional<std::string> text;
    std::optional<std::string> media; ///< opaque payload (e.g. a data URL)
    std::optional<std::string> color;

    [[nodiscard]] bool is_system() const noexcept
    {
        return kind == MessageKind::SystemJoin || kind == MessageKind::SystemLeave;
    }
};

/**
 * @brief Per-process identity, passed explicitly to every component.
 */
struct ClientIdentity
{
    std::string fingerprint;
    std::string handle;
    std::string color;

    /**
     * @brief Fresh identity with a random fingerprint and color.
     * @param handle Display handle; upper-cased. Empty generates one.
     */
    ZONECHAT_CORE_EXPORT static ClientIdentity generate(std::string_view handle = {});
};

// ============================================================================
// Outcome enums
// ============================================================================

enum class ZoneError
{
    InvalidArgument,
    LocationRequired,
    AccessDenied,
    AlreadyActive,
    NotActive,
    ZoneExpired,
    Throttled,
    Blocked,
};

enum class PublishStatus
{
    Accepted, ///< handed to the relay; not a delivery confirmation
    Dropped,  ///< non-critical envelope discarded while disconnected
    Offline,  ///< critical envelope refused while disconnected
    Failed,   ///< transport error while connected
};

enum class ConnectionState
{
    Connected,
    Reconnecting,
    Offline,
};

enum class ExitReason
{
    UserRequested,
    Expired,
    Shutdown,
};

enum class SessionState
{
    Idle,
    Creating,
    Joining,
    Active,
};

ZONECHAT_CORE_EXPORT const char *to_string(Visibility v) noexcept;
ZONECHAT_CORE_EXPORT const char *to_string(MessageKind k) noexcept;
ZONECHAT_CORE_EXPORT const char *to_string(ZoneError e) noexcept;
ZONECHAT_CORE_EXPORT const char *to_string(PublishStatus s) noexcept;
ZONECHAT_CORE_EXPORT const char *to_string(ConnectionState s) noexcept;
ZONECHAT_CORE_EXPORT const char *to_string(ExitReason r) noexcept;
ZONECHAT_CORE_EXPORT const char *to_string(SessionState s) noexcept;

ZONECHAT_CORE_EXPORT std::optional<Visibility> visibility_from_string(std::string_view s) noexcept;
ZONECHAT_CORE_EXPORT std::optional<MessageKind> message_kind_from_string(std::string_view s) noexcept;

// ============================================================================
// JSON (nlohmann ADL hooks). from_json throws nlohmann::json::exception on
// missing or mistyped fields, std::invalid_argument on unknown enum strings.
// ============================================================================

ZONECHAT_CORE_EXPORT void to_json(nlohmann::json &j, const GeoPoint &p);
ZONECHAT_CORE_EXPORT void from_json(const nlohmann::json &j, GeoPoint &p);
ZONECHAT_CORE_EXPORT void to_json(nlohmann::json &j, const Zone &z);
ZONECHAT_CORE_EXPORT void from_json(const nlohmann::json &j, Zone &z);
ZONECHAT_CORE_EXPORT void to_json(nlohmann::json &j, const ChatMessage &m);
ZONECHAT_CORE_EXPORT void from_json(const nlohmann::json &j, ChatMessage &m);

} // namespace zonechat::zone
