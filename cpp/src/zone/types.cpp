#include "zone/types.hpp"
#include "utils/uid_utils.hpp"

#include <stdexcept>

namespace zonechat::zone
{

namespace
{
template <typename T>
void read_optional(const nlohmann::json &j, const char *key, std::optional<T> &out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
    {
        out.reset();
        return;
    }
    out = it->get<T>();
}

template <typename T>
void write_optional(nlohmann::json &j, const char *key, const std::optional<T> &value)
{
    if (value.has_value())
    {
        j[key] = *value;
    }
}
} // namespace

ClientIdentity ClientIdentity::generate(std::string_view handle)
{
    ClientIdentity id;
    id.fingerprint = uid::generate_fingerprint();
    id.handle = handle.empty() ? uid::generate_handle() : uid::to_upper_ascii(handle);
    id.color = uid::pick_color();
    return id;
}

const char *to_string(Visibility v) noexcept
{
    return v == Visibility::Private ? "private" : "public";
}

const char *to_string(MessageKind k) noexcept
{
    switch (k)
    {
    case MessageKind::Text:        return "text";
    case MessageKind::Image:       return "image";
    case MessageKind::Audio:       return "audio";
    case MessageKind::Video:       return "video";
    case MessageKind::SystemJoin:  return "system-join";
    case MessageKind::SystemLeave: return "system-leave";
    }
    return "text";
}

const char *to_string(ZoneError e) noexcept
{
    switch (e)
    {
    case ZoneError::InvalidArgument:  return "InvalidArgument";
    case ZoneError::LocationRequired: return "LocationRequired";
    case ZoneError::AccessDenied:     return "AccessDenied";
    case ZoneError::AlreadyActive:    return "AlreadyActive";
    case ZoneError::NotActive:        return "NotActive";
    case ZoneError::ZoneExpired:      return "ZoneExpired";
    case ZoneError::Throttled:        return "Throttled";
    case ZoneError::Blocked:          return "Blocked";
    }
    return "Unknown";
}

const char *to_string(PublishStatus s) noexcept
{
    switch (s)
    {
    case PublishStatus::Accepted: return "Accepted";
    case PublishStatus::Dropped:  return "Dropped";
    case PublishStatus::Offline:  return "Offline";
    case PublishStatus::Failed:   return "Failed";
    }
    return "Unknown";
}

const char *to_string(ConnectionState s) noexcept
{
    switch (s)
    {
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Reconnecting: return "reconnecting";
    case ConnectionState::Offline:      return "offline";
    }
    return "unknown";
}

const char *to_string(ExitReason r) noexcept
{
    switch (r)
    {
    case ExitReason::UserRequested: return "UserRequested";
    case ExitReason::Expired:       return "Expired";
    case ExitReason::Shutdown:      return "Shutdown";
    }
    return "Unknown";
}

const char *to_string(SessionState s) noexcept
{
    switch (s)
    {
    case SessionState::Idle:     return "Idle";
    case SessionState::Creating: return "Creating";
    case SessionState::Joining:  return "Joining";
    case SessionState::Active:   return "Active";
    }
    return "Unknown";
}

std::optional<Visibility> visibility_from_string(std::string_view s) noexcept
{
    if (s == "public")  return Visibility::Public;
    if (s == "private") return Visibility::Private;
    return std::nullopt;
}

std::optional<MessageKind> message_kind_from_string(std::string_view s) noexcept
{
    if (s == "text")         return MessageKind::Text;
    if (s == "image")        return MessageKind::Image;
    if (s == "audio")        return MessageKind::Audio;
    if (s == "video")        return MessageKind::Video;
    if (s == "system-join")  return MessageKind::SystemJoin;
    if (s == "system-leave") return MessageKind::SystemLeave;
    return std::nullopt;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json &j, const GeoPoint &p)
{
    j = nlohmann::json{{"lat", p.lat}, {"lng", p.lng}};
}

void from_json(const nlohmann::json &j, GeoPoint &p)
{
    j.at("lat").get_to(p.lat);
    j.at("lng").get_to(p.lng);
}

void to_json(nlohmann::json &j, const Zone &z)
{
    j = nlohmann::json{{"id", z.id},
                       {"name", z.name},
                       {"visibility", to_string(z.visibility)},
                       {"hostFingerprint", z.host_fingerprint},
                       {"center", z.center},
                       {"createdAt", z.created_at},
                       {"expiresAt", z.expires_at},
                       {"memberCount", z.member_count}};
    write_optional(j, "passwordDigest", z.password_digest);
}

void from_json(const nlohmann::json &j, Zone &z)
{
    j.at("id").get_to(z.id);
    j.at("name").get_to(z.name);
    const auto vis = visibility_from_string(j.at("visibility").get<std::string>());
    if (!vis)
    {
        throw std::invalid_argument("zone: unknown visibility '" +
                                    j.at("visibility").get<std::string>() + "'");
    }
    z.visibility = *vis;
    j.at("hostFingerprint").get_to(z.host_fingerprint);
    read_optional(j, "passwordDigest", z.password_digest);
    j.at("center").get_to(z.center);
    j.at("createdAt").get_to(z.created_at);
    j.at("expiresAt").get_to(z.expires_at);
    if (z.expires_at <= z.created_at)
    {
        throw std::invalid_argument("zone: expiresAt must be after createdAt");
    }
    z.member_count = j.value("memberCount", 1);
}

void to_json(nlohmann::json &j, const ChatMessage &m)
{
    j = nlohmann::json{{"id", m.id},
                       {"sender", m.sender},
                       {"senderFingerprint", m.sender_fingerprint},
                       {"timestamp", m.timestamp},
                       {"kind", to_string(m.kind)}};
    write_optional(j, "text", m.text);
    write_optional(j, "media", m.media);
    write_optional(j, "color", m.color);
}

void from_json(const nlohmann::json &j, ChatMessage &m)
{
    j.at("id").get_to(m.id);
    j.at("sender").get_to(m.sender);
    m.sender_fingerprint = j.value("senderFingerprint", std::string{});
    j.at("timestamp").get_to(m.timestamp);
    const auto kind = message_kind_from_string(j.value("kind", std::string{"text"}));
    if (!kind)
    {
        throw std::invalid_argument("message: unknown kind '" +
                                    j.value("kind", std::string{}) + "'");
    }
    m.kind = *kind;
    read_optional(j, "text", m.text);
    read_optional(j, "media", m.media);
    read_optional(j, "color", m.color);
}

} // namespace zonechat::zone
