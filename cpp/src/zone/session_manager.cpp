#include "zone/session_manager.hpp"
#include "zone/geo.hpp"
#include "zone/topics.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace zonechat::zone
{

namespace
{
using ZoneResult = utils::Result<Zone, ZoneError>;
using MessageResult = utils::Result<ChatMessage, ZoneError>;

std::string trim(const std::string &s)
{
    auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    auto first = std::find_if(s.begin(), s.end(), not_space);
    auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return first < last ? std::string(first, last) : std::string{};
}

ClientConfig validated(ClientConfig cfg)
{
    cfg.validate();
    return cfg;
}

ClientIdentity checked(ClientIdentity id, const ClientConfig &cfg)
{
    if (id.fingerprint.empty())
    {
        throw std::invalid_argument("SessionManager: identity has no fingerprint");
    }
    if (id.handle.empty())
    {
        id.handle = cfg.handle.empty() ? uid::generate_handle() : cfg.handle;
    }
    id.handle = uid::to_upper_ascii(id.handle);
    return id;
}
} // namespace

SessionManager::SessionManager(EventLoop &loop, ChannelTransport &transport,
                               ClientIdentity identity, ClientConfig config,
                               PositionProvider *position, ContentModerator *moderator)
    : m_loop(loop), m_transport(transport), m_config(validated(std::move(config))),
      m_position_provider(position), m_moderator(moderator), m_access(m_config.password_salt),
      m_discovery(loop, transport, identity.fingerprint,
                  DiscoveryService::Config{m_config.radius_km, m_config.discovery_sweep_ms,
                                           discovery_topic(m_config.topic_prefix)}),
      m_history(identity.fingerprint, m_log), m_typing(m_config.typing_expiry_ms),
      m_presence(identity.fingerprint)
{
    m_identity = checked(std::move(identity), m_config);
}

SessionManager::~SessionManager()
{
    try
    {
        stop();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Session: error during shutdown: {}", e.what());
    }
}

// ============================================================================
// Start / stop
// ============================================================================

void SessionManager::start()
{
    if (m_started)
    {
        return;
    }
    m_started = true;

    m_global_listener = m_transport.add_listener(
        {{},
         [this](ConnectionState s)
         {
             if (s == ConnectionState::Connected)
                 on_connected();
             if (m_cb.on_connection_state)
                 m_cb.on_connection_state(s);
         },
         {}});

    m_discovery.set_on_changed(
        [this]
        {
            if (m_cb.on_discovery_changed)
                m_cb.on_discovery_changed();
        });
    m_discovery.set_on_sync_request(
        [this](const std::string &from)
        {
            if (is_active() && m_is_host)
            {
                LOGGER_DEBUG("Session: re-announcing zone {} for {}", m_zone->id, from);
                publish_descriptor();
            }
        });
    m_discovery.start();

    update_location();
    m_location_timer = m_loop.schedule_every(m_config.location_check_ms, [this] { update_location(); });
    LOGGER_INFO("Session: started as {} ({})", m_identity.handle, m_identity.fingerprint);
}

void SessionManager::stop()
{
    exit(ExitReason::Shutdown);
    if (!m_started)
    {
        return;
    }
    m_started = false;
    m_loop.cancel(m_location_timer);
    m_location_timer = kInvalidTimer;
    m_discovery.stop();
    m_transport.remove_listener(m_global_listener);
    LOGGER_INFO("Session: stopped");
}

// ============================================================================
// Create / join / exit
// ============================================================================

utils::Result<Zone, ZoneError> SessionManager::create_zone(const std::string &name,
                                                           Visibility visibility,
                                                           const std::string &handle,
                                                           const std::optional<std::string> &password)
{
    if (m_state == SessionState::Active)
    {
        return ZoneResult::error(ZoneError::AlreadyActive);
    }
    set_state(SessionState::Creating);
    auto fail = [this](ZoneError e, std::string detail)
    {
        LOGGER_INFO("Session: create failed: {} {}", to_string(e), detail);
        set_state(SessionState::Idle);
        return ZoneResult::error(e, std::move(detail));
    };

    const std::string zone_name = uid::to_upper_ascii(trim(name));
    if (zone_name.empty())
    {
        return fail(ZoneError::InvalidArgument, "zone name is empty");
    }
    if (visibility == Visibility::Private && (!password || password->empty()))
    {
        return fail(ZoneError::InvalidArgument, "private zone requires a password");
    }
    if (m_position_provider == nullptr)
    {
        return fail(ZoneError::LocationRequired, "no position provider");
    }
    auto pos = m_position_provider->current_position();
    if (pos.is_error())
    {
        return fail(ZoneError::LocationRequired, to_string(pos.error()));
    }
    m_discovery.set_position(pos.content());

    if (!trim(handle).empty())
    {
        m_identity.handle = uid::to_upper_ascii(trim(handle));
    }

    const int64_t now = m_loop.now_ms();
    Zone zone;
    zone.id = uid::generate_zone_id();
    zone.name = zone_name;
    zone.visibility = visibility;
    zone.host_fingerprint = m_identity.fingerprint;
    if (visibility == Visibility::Private)
    {
        zone.password_digest = m_access.digest(*password);
    }
    zone.center = pos.content();
    zone.created_at = now;
    zone.expires_at = now + m_config.session_duration_ms;
    zone.member_count = 1;

    LOGGER_INFO("Session: created {} zone {} '{}'", to_string(visibility), zone.id, zone.name);
    enter_active(std::move(zone), true);
    return ZoneResult::ok(*m_zone);
}

utils::Result<Zone, ZoneError> SessionManager::join_zone(const Zone &zone, const std::string &handle,
                                                         const std::optional<std::string> &password)
{
    if (m_state == SessionState::Active)
    {
        return ZoneResult::error(ZoneError::AlreadyActive);
    }
    set_state(SessionState::Joining);
    auto fail = [this, &zone](ZoneError e, std::string detail)
    {
        LOGGER_INFO("Session: join {} failed: {} {}", zone.id, to_string(e), detail);
        set_state(SessionState::Idle);
        return ZoneResult::error(e, std::move(detail));
    };

    if (zone.id.empty())
    {
        return fail(ZoneError::InvalidArgument, "zone has no id");
    }
    if (zone.is_expired(m_loop.now_ms()))
    {
        return fail(ZoneError::ZoneExpired, {});
    }
    if (zone.visibility == Visibility::Private && zone.password_digest.has_value())
    {
        if (!password || !m_access.verify(*password, *zone.password_digest))
        {
            return fail(ZoneError::AccessDenied, {});
        }
    }

    if (!trim(handle).empty())
    {
        m_identity.handle = uid::to_upper_ascii(trim(handle));
    }
    LOGGER_INFO("Session: joining zone {} '{}'", zone.id, zone.name);
    enter_active(zone, zone.host_fingerprint == m_identity.fingerprint);
    return ZoneResult::ok(*m_zone);
}

void SessionManager::enter_active(Zone zone, bool is_host)
{
    const uint64_t gen = ++m_generation;
    const int64_t now = m_loop.now_ms();

    m_zone = std::move(zone);
    m_zone_topic = zone_topic(m_config.topic_prefix, m_zone->id);
    m_is_host = is_host;
    m_log.clear();
    m_typing.clear_all();
    m_presence.reset();
    if (!is_host)
    {
        m_presence.set_displayed(std::max(1, m_zone->member_count));
    }
    m_remaining_ms = std::max<int64_t>(0, m_zone->expires_at - now);
    m_warning_raised = false;
    m_last_send_ms.reset();
    m_last_typing_ms.reset();

    set_state(SessionState::Active);

    m_zone_listener = m_transport.add_listener(
        {[this, gen](const std::string &topic, const Envelope &env)
         {
             if (gen != m_generation || topic != m_zone_topic)
             {
                 return;
             }
             on_zone_envelope(env);
         },
         {},
         {}});
    m_transport.subscribe(m_zone_topic);

    if (is_host)
    {
        publish_descriptor();
    }
    ChatMessage join = make_message(MessageKind::SystemJoin);
    join.text = m_identity.handle + " joined the zone";
    publish_chat(join, {});
    publish_presence();
    publish_history_request();

    m_session_timers.push_back(m_loop.schedule_every(
        m_config.countdown_tick_ms, guarded(gen, [this] { on_countdown_tick(); })));
    m_session_timers.push_back(m_loop.schedule_every(
        m_config.pulse_interval_ms / 2, guarded(gen, [this] { publish_presence(); })));
    m_session_timers.push_back(m_loop.schedule_every(
        m_config.typing_sweep_ms, guarded(gen,
                                          [this]
                                          {
                                              if (m_typing.sweep(m_loop.now_ms()) > 0)
                                                  notify_typing_changed();
                                          })));
    if (is_host)
    {
        m_session_timers.push_back(m_loop.schedule_every(
            m_config.pulse_interval_ms, guarded(gen, [this] { on_host_pulse(); })));
    }

    if (m_cb.on_member_count)
    {
        m_cb.on_member_count(m_presence.displayed());
    }
}

bool SessionManager::exit(ExitReason reason)
{
    if (m_state != SessionState::Active || !m_zone)
    {
        return false;
    }
    const Zone zone = *m_zone;

    ChatMessage leave = make_message(MessageKind::SystemLeave);
    leave.text = m_identity.handle + " left the zone";
    const PublishStatus status = m_transport.publish(
        m_zone_topic, Envelope{m_identity.fingerprint, std::nullopt, MessageEvent{leave}});
    LOGGER_DEBUG("Session: leave notice {}", to_string(status));

    m_transport.unsubscribe(m_zone_topic);
    m_transport.remove_listener(m_zone_listener);
    m_zone_listener = 0;
    for (TimerId id : m_session_timers)
    {
        m_loop.cancel(id);
    }
    m_session_timers.clear();

    m_log.clear();
    m_typing.clear_all();
    m_presence.reset();
    m_zone.reset();
    m_zone_topic.clear();
    m_is_host = false;
    m_remaining_ms = 0;
    ++m_generation;

    LOGGER_INFO("Session: left zone {} ({})", zone.id, to_string(reason));
    set_state(SessionState::Idle);
    if (reason == ExitReason::Expired)
    {
        LOGGER_INFO("Session: zone {} '{}' expired", zone.id, zone.name);
        if (m_cb.on_expired)
        {
            m_cb.on_expired(zone);
        }
    }
    return true;
}

// ============================================================================
// Sending
// ============================================================================

utils::Result<ChatMessage, ZoneError> SessionManager::send_text(const std::string &text,
                                                                SendCallback cb)
{
    if (!is_active())
    {
        return MessageResult::error(ZoneError::NotActive);
    }
    const std::string body = trim(text);
    if (body.empty())
    {
        return MessageResult::error(ZoneError::InvalidArgument, "empty message");
    }
    const int64_t now = m_loop.now_ms();
    if (m_last_send_ms && now - *m_last_send_ms < m_config.message_throttle_ms)
    {
        return MessageResult::error(ZoneError::Throttled);
    }
    if (m_moderator != nullptr)
    {
        ModerationVerdict verdict = m_moderator->moderate(body);
        if (!verdict.safe)
        {
            LOGGER_INFO("Session: message blocked by moderator: {}", verdict.reason);
            return MessageResult::error(ZoneError::Blocked, std::move(verdict.reason));
        }
    }

    ChatMessage msg = make_message(MessageKind::Text);
    msg.text = body;
    m_last_send_ms = now;
    publish_chat(msg, std::move(cb));
    return MessageResult::ok(std::move(msg));
}

utils::Result<ChatMessage, ZoneError> SessionManager::send_media(MessageKind kind, std::string blob,
                                                                 SendCallback cb)
{
    if (!is_active())
    {
        return MessageResult::error(ZoneError::NotActive);
    }
    if (kind != MessageKind::Image && kind != MessageKind::Audio && kind != MessageKind::Video)
    {
        return MessageResult::error(ZoneError::InvalidArgument, "not a media kind");
    }
    if (blob.empty())
    {
        return MessageResult::error(ZoneError::InvalidArgument, "empty media payload");
    }
    const int64_t now = m_loop.now_ms();
    if (m_last_send_ms && now - *m_last_send_ms < m_config.message_throttle_ms)
    {
        return MessageResult::error(ZoneError::Throttled);
    }

    ChatMessage msg = make_message(kind);
    msg.media = std::move(blob);
    m_last_send_ms = now;
    publish_chat(msg, std::move(cb));
    return MessageResult::ok(std::move(msg));
}

bool SessionManager::notify_typing()
{
    if (!is_active())
    {
        return false;
    }
    const int64_t now = m_loop.now_ms();
    if (m_last_typing_ms && now - *m_last_typing_ms < m_config.typing_throttle_ms)
    {
        return false;
    }
    m_last_typing_ms = now;
    return m_transport.publish(m_zone_topic, Envelope{m_identity.fingerprint, std::nullopt,
                                                      TypingEvent{m_identity.handle}}) ==
           PublishStatus::Accepted;
}

PublishStatus SessionManager::refresh_discovery()
{
    return m_discovery.request_sync();
}

void SessionManager::update_location()
{
    if (m_position_provider == nullptr)
    {
        return;
    }
    auto pos = m_position_provider->current_position();
    if (pos.is_error())
    {
        LOGGER_DEBUG("Session: location unavailable ({})", to_string(pos.error()));
        return;
    }
    m_discovery.set_position(pos.content());
    if (auto d = distance_to_zone())
    {
        LOGGER_TRACE("Session: {:.3f} km from zone center", *d);
    }
}

std::optional<double> SessionManager::distance_to_zone() const
{
    const auto pos = m_discovery.position();
    if (!m_zone || !pos)
    {
        return std::nullopt;
    }
    return distance_km(*pos, m_zone->center);
}

bool SessionManager::is_in_range() const
{
    const auto d = distance_to_zone();
    return !d || *d <= m_config.radius_km;
}

// ============================================================================
// Inbound
// ============================================================================

void SessionManager::on_zone_envelope(const Envelope &env)
{
    if (const auto *msg = env.as<MessageEvent>())
    {
        if (m_is_host)
        {
            m_presence.observe(env.from);
        }
        if (m_typing.clear(msg->message.sender))
        {
            notify_typing_changed();
        }
        append_and_notify(msg->message);
    }
    else if (const auto *typing = env.as<TypingEvent>())
    {
        if (env.from != m_identity.fingerprint)
        {
            m_typing.touch(typing->handle, m_loop.now_ms());
            notify_typing_changed();
        }
    }
    else if (env.as<PresenceEvent>() != nullptr)
    {
        if (m_is_host)
        {
            m_presence.observe(env.from);
        }
    }
    else if (const auto *sync = env.as<CountSyncEvent>())
    {
        if (!m_is_host &&
            m_presence.accept_count_sync(env.from, m_zone->host_fingerprint, sync->count))
        {
            m_zone->member_count = sync->count;
            if (m_cb.on_member_count)
            {
                m_cb.on_member_count(sync->count);
            }
        }
    }
    else if (env.as<HistoryRequest>() != nullptr)
    {
        if (auto reply = m_history.on_request(env))
        {
            m_transport.publish(m_zone_topic, *reply);
        }
    }
    else if (env.as<HistoryResponse>() != nullptr)
    {
        const size_t added = m_history.on_response(env);
        if (added > 0 && m_cb.on_history_merged)
        {
            m_cb.on_history_merged(added);
        }
    }
    else
    {
        LOGGER_DEBUG("Session: ignoring '{}' on zone topic", env.kind());
    }
}

void SessionManager::on_connected()
{
    LOGGER_INFO("Session: transport connected, re-announcing");
    m_discovery.request_sync();
    if (is_active())
    {
        publish_presence();
        publish_history_request();
    }
}

// ============================================================================
// Periodic work
// ============================================================================

void SessionManager::on_countdown_tick()
{
    const int64_t left = m_zone->expires_at - m_loop.now_ms();
    m_remaining_ms = std::max<int64_t>(0, left);
    if (m_cb.on_tick)
    {
        m_cb.on_tick(m_remaining_ms);
    }
    if (left <= 0)
    {
        exit(ExitReason::Expired);
        return;
    }
    if (!m_warning_raised && left <= m_config.expiry_warning_ms)
    {
        m_warning_raised = true;
        LOGGER_INFO("Session: zone {} expires in {} ms", m_zone->id, left);
        if (m_cb.on_expiry_warning)
        {
            m_cb.on_expiry_warning(left);
        }
    }
}

void SessionManager::on_host_pulse()
{
    const int count = m_presence.close_window();
    m_zone->member_count = count;
    publish_descriptor();
    m_transport.publish(m_zone_topic,
                        Envelope{m_identity.fingerprint, std::nullopt, CountSyncEvent{count}});
    LOGGER_DEBUG("Session: pulse, {} member(s)", count);
    if (m_cb.on_member_count)
    {
        m_cb.on_member_count(count);
    }
}

void SessionManager::publish_presence()
{
    m_transport.publish(m_zone_topic, Envelope{m_identity.fingerprint, std::nullopt,
                                               PresenceEvent{m_identity.handle}});
}

void SessionManager::publish_descriptor()
{
    m_transport.publish(m_discovery.config().topic,
                        Envelope{m_identity.fingerprint, std::nullopt, ZoneDescriptor{*m_zone}});
}

void SessionManager::publish_history_request()
{
    m_transport.publish(m_zone_topic, m_history.make_request());
}

// ============================================================================
// Helpers
// ============================================================================

void SessionManager::publish_chat(const ChatMessage &msg, SendCallback cb)
{
    const uint64_t gen = m_generation;
    m_transport.publish(m_zone_topic, Envelope{m_identity.fingerprint, std::nullopt, MessageEvent{msg}},
                        [this, gen, msg, cb = std::move(cb)](PublishStatus status)
                        {
                            if (gen != m_generation)
                            {
                                LOGGER_DEBUG("Session: ignoring ack for {} from a previous session",
                                             msg.id);
                                return;
                            }
                            if (status == PublishStatus::Accepted)
                            {
                                append_and_notify(msg);
                            }
                            else
                            {
                                LOGGER_WARN("Session: message {} not sent ({})", msg.id,
                                            to_string(status));
                                // A failed send gives the throttle window back.
                                if (msg.kind != MessageKind::SystemJoin && m_last_send_ms &&
                                    *m_last_send_ms == msg.timestamp)
                                {
                                    m_last_send_ms.reset();
                                }
                            }
                            if (cb)
                            {
                                cb(status);
                            }
                        });
}

ChatMessage SessionManager::make_message(MessageKind kind) const
{
    ChatMessage msg;
    switch (kind)
    {
    case MessageKind::SystemJoin:
        msg.id = uid::generate_system_message_id("join");
        break;
    case MessageKind::SystemLeave:
        msg.id = uid::generate_system_message_id("leave");
        break;
    default:
        msg.id = uid::generate_message_id();
        break;
    }
    msg.sender = m_identity.handle;
    msg.sender_fingerprint = m_identity.fingerprint;
    msg.timestamp = m_loop.now_ms();
    msg.kind = kind;
    msg.color = m_identity.color;
    return msg;
}

void SessionManager::append_and_notify(const ChatMessage &msg)
{
    if (m_log.append(msg) && m_cb.on_message)
    {
        m_cb.on_message(msg);
    }
}

void SessionManager::notify_typing_changed()
{
    if (m_cb.on_typing_changed)
    {
        m_cb.on_typing_changed(m_typing.active());
    }
}

void SessionManager::set_state(SessionState s)
{
    if (s == m_state)
    {
        return;
    }
    m_state = s;
    LOGGER_INFO("Session: state -> {}", to_string(s));
    if (m_cb.on_state_changed)
    {
        m_cb.on_state_changed(s);
    }
}

std::function<void()> SessionManager::guarded(uint64_t gen, std::function<void()> fn)
{
    return [this, gen, fn = std::move(fn)]
    {
        if (gen == m_generation)
        {
            fn();
        }
    };
}

} // namespace zonechat::zone
