#include "zone/envelope.hpp"
#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <type_traits>

namespace zonechat::zone
{

namespace
{
constexpr const char *kKindMessage = "message";
constexpr const char *kKindTyping = "typing";
constexpr const char *kKindPresence = "presence";
constexpr const char *kKindCountSync = "count_sync";
constexpr const char *kKindHistoryReq = "history_req";
constexpr const char *kKindHistoryRes = "history_res";
constexpr const char *kKindZoneDescriptor = "zone_descriptor";
constexpr const char *kKindZoneSyncReq = "zone_sync_req";

nlohmann::json payload_to_json(const Payload &payload)
{
    return std::visit(
        [](const auto &p) -> nlohmann::json
        {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, MessageEvent>)
                return p.message;
            else if constexpr (std::is_same_v<T, TypingEvent> || std::is_same_v<T, PresenceEvent>)
                return nlohmann::json{{"handle", p.handle}};
            else if constexpr (std::is_same_v<T, CountSyncEvent>)
                return nlohmann::json{{"count", p.count}};
            else if constexpr (std::is_same_v<T, HistoryResponse>)
                return p.messages;
            else if constexpr (std::is_same_v<T, ZoneDescriptor>)
                return p.zone;
            else
                return nlohmann::json::object();
        },
        payload);
}

Payload payload_from_json(const std::string &kind, const nlohmann::json &j)
{
    if (kind == kKindMessage)
        return MessageEvent{j.get<ChatMessage>()};
    if (kind == kKindTyping)
        return TypingEvent{j.at("handle").get<std::string>()};
    if (kind == kKindPresence)
        return PresenceEvent{j.at("handle").get<std::string>()};
    if (kind == kKindCountSync)
        return CountSyncEvent{j.at("count").get<int>()};
    if (kind == kKindHistoryReq)
        return HistoryRequest{};
    if (kind == kKindHistoryRes)
        return HistoryResponse{j.get<std::vector<ChatMessage>>()};
    if (kind == kKindZoneDescriptor)
        return ZoneDescriptor{j.get<Zone>()};
    if (kind == kKindZoneSyncReq)
        return ZoneSyncRequest{};
    return UnknownPayload{kind};
}
} // namespace

std::string Envelope::kind() const
{
    return std::visit(
        [](const auto &p) -> std::string
        {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, MessageEvent>)         return kKindMessage;
            else if constexpr (std::is_same_v<T, TypingEvent>)     return kKindTyping;
            else if constexpr (std::is_same_v<T, PresenceEvent>)   return kKindPresence;
            else if constexpr (std::is_same_v<T, CountSyncEvent>)  return kKindCountSync;
            else if constexpr (std::is_same_v<T, HistoryRequest>)  return kKindHistoryReq;
            else if constexpr (std::is_same_v<T, HistoryResponse>) return kKindHistoryRes;
            else if constexpr (std::is_same_v<T, ZoneDescriptor>)  return kKindZoneDescriptor;
            else if constexpr (std::is_same_v<T, ZoneSyncRequest>) return kKindZoneSyncReq;
            else                                                   return p.kind;
        },
        payload);
}

bool Envelope::is_ephemeral() const noexcept
{
    return std::holds_alternative<TypingEvent>(payload) ||
           std::holds_alternative<PresenceEvent>(payload);
}

std::string encode_envelope(const Envelope &env)
{
    nlohmann::json j;
    j["kind"] = env.kind();
    j["from"] = env.from;
    if (env.to.has_value())
    {
        j["to"] = *env.to;
    }
    j["payload"] = payload_to_json(env.payload);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<Envelope> decode_envelope(std::string_view json)
{
    try
    {
        const nlohmann::json j = nlohmann::json::parse(json.begin(), json.end());
        if (!j.is_object())
        {
            LOGGER_DEBUG("Envelope: dropped non-object payload");
            return std::nullopt;
        }
        Envelope env;
        const std::string kind = j.at("kind").get<std::string>();
        env.from = j.at("from").get<std::string>();
        if (auto it = j.find("to"); it != j.end() && it->is_string())
        {
            env.to = it->get<std::string>();
        }
        static const nlohmann::json kEmpty = nlohmann::json::object();
        auto payload_it = j.find("payload");
        env.payload = payload_from_json(kind, payload_it != j.end() ? *payload_it : kEmpty);
        return env;
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_DEBUG("Envelope: dropped malformed envelope: {}", e.what());
    }
    catch (const std::invalid_argument &e)
    {
        LOGGER_DEBUG("Envelope: dropped envelope with invalid field: {}", e.what());
    }
    return std::nullopt;
}

} // namespace zonechat::zone
