#pragma once
/**
 * @file session_manager.hpp
 * @brief Top-level zone session state machine.
 *
 * ## States
 *
 *   Idle ──create_zone──▶ Creating ──▶ Active ──exit──▶ Idle
 *   Idle ──join_zone────▶ Joining  ──▶ Active
 *
 * Creating and Joining are left before the call returns: to Active on success,
 * back to Idle on any error.
 *
 * ## Entering Active
 *
 * Subscribe to the zone topic, publish `system-join`, `presence` and
 * `history_req`, then start the session timers: countdown, member presence
 * (every half pulse), typing sweep and, for the host, the pulse that
 * broadcasts the descriptor and `count_sync`. A host also publishes its
 * descriptor immediately on creation.
 *
 * ## Connectivity
 *
 * Every entry of the transport into Connected, the first included, re-sends
 * `zone_sync_req` and, while Active, `presence` and `history_req`. Anything
 * published before the link came up is therefore caught up.
 *
 * ## Generation guard
 *
 * Each entry into Active and each exit bump `generation()`. Every zone-topic
 * handler, session timer and publish ack captures the generation current when
 * it was created and does nothing once it no longer matches. Late deliveries
 * for a previous zone can therefore never touch the current one.
 *
 * All methods must be called on the EventLoop thread.
 */
#include "zonechat_core_export.h"
#include "utils/result.hpp"
#include "zone/access_control.hpp"
#include "zone/channel_transport.hpp"
#include "zone/client_config.hpp"
#include "zone/collaborators.hpp"
#include "zone/discovery_service.hpp"
#include "zone/event_loop.hpp"
#include "zone/history_sync.hpp"
#include "zone/presence_counter.hpp"
#include "zone/typing_tracker.hpp"
#include "zone/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace zonechat::zone
{

/** @brief Notifications to the embedding application. All optional. */
struct SessionCallbacks
{
    std::function<void(SessionState)> on_state_changed;
    std::function<void(const ChatMessage &)> on_message;
    std::function<void(size_t added)> on_history_merged;
    std::function<void(const std::vector<std::string> &handles)> on_typing_changed;
    std::function<void(int count)> on_member_count;
    std::function<void(int64_t remaining_ms)> on_tick;
    std::function<void(int64_t remaining_ms)> on_expiry_warning;
    std::function<void(const Zone &)> on_expired;
    std::function<void(ConnectionState)> on_connection_state;
    std::function<void()> on_discovery_changed;
};

class ZONECHAT_CORE_EXPORT SessionManager
{
  public:
    using SendCallback = std::function<void(PublishStatus)>;

    /**
     * @param position  Optional; without it create_zone() always fails with
     *                  LocationRequired and discovery shows nothing.
     * @param moderator Optional; consulted for every text message.
     * @throws std::runtime_error if @p config is invalid.
     */
    SessionManager(EventLoop &loop, ChannelTransport &transport, ClientIdentity identity,
                   ClientConfig config, PositionProvider *position = nullptr,
                   ContentModerator *moderator = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager &) = delete;
    SessionManager &operator=(const SessionManager &) = delete;

    void set_callbacks(SessionCallbacks callbacks) { m_cb = std::move(callbacks); }

    /** @brief Hooks into the transport, starts discovery and location polling. */
    void start();
    /** @brief exit(Shutdown), then detaches from the transport. Idempotent. */
    void stop();

    // --- Session operations ---

    [[nodiscard]] utils::Result<Zone, ZoneError>
    create_zone(const std::string &name, Visibility visibility, const std::string &handle = {},
                const std::optional<std::string> &password = std::nullopt);

    [[nodiscard]] utils::Result<Zone, ZoneError>
    join_zone(const Zone &zone, const std::string &handle = {},
              const std::optional<std::string> &password = std::nullopt);

    /**
     * @brief Leaves the active zone.
     * @return true if this call ended a session; false when already Idle.
     */
    bool exit(ExitReason reason = ExitReason::UserRequested);

    [[nodiscard]] utils::Result<ChatMessage, ZoneError> send_text(const std::string &text,
                                                                  SendCallback cb = {});
    [[nodiscard]] utils::Result<ChatMessage, ZoneError>
    send_media(MessageKind kind, std::string blob, SendCallback cb = {});

    /** @return true if a typing envelope was handed to the relay. */
    bool notify_typing();

    /** @brief User-initiated discovery refresh. */
    PublishStatus refresh_discovery();

    /** @brief Polls the position provider now (also runs on a timer). */
    void update_location();

    // --- Observers ---

    [[nodiscard]] SessionState state() const noexcept { return m_state; }
    [[nodiscard]] bool is_active() const noexcept { return m_state == SessionState::Active; }
    [[nodiscard]] bool is_host() const noexcept { return m_is_host; }
    [[nodiscard]] const std::optional<Zone> &zone() const noexcept { return m_zone; }
    [[nodiscard]] const ClientIdentity &identity() const noexcept { return m_identity; }
    [[nodiscard]] const ClientConfig &config() const noexcept { return m_config; }
    [[nodiscard]] uint64_t generation() const noexcept { return m_generation; }
    [[nodiscard]] const std::vector<ChatMessage> &messages() const noexcept
    {
        return m_log.messages();
    }
    [[nodiscard]] std::vector<std::string> typing_users() const { return m_typing.active(); }
    [[nodiscard]] int member_count() const noexcept { return m_presence.displayed(); }
    [[nodiscard]] int64_t remaining_ms() const noexcept { return m_remaining_ms; }
    [[nodiscard]] std::optional<GeoPoint> position() const { return m_discovery.position(); }
    /** @brief Distance to the active zone's center, if both are known. */
    [[nodiscard]] std::optional<double> distance_to_zone() const;
    /** @brief True unless the distance is known and beyond the radius. */
    [[nodiscard]] bool is_in_range() const;
    [[nodiscard]] ConnectionState connection_state() const noexcept { return m_transport.state(); }
    [[nodiscard]] DiscoveryService &discovery() noexcept { return m_discovery; }
    [[nodiscard]] const DiscoveryService &discovery() const noexcept { return m_discovery; }

  private:
    void set_state(SessionState s);
    void enter_active(Zone zone, bool is_host);
    void on_zone_envelope(const Envelope &env);
    void on_connected();

    void on_countdown_tick();
    void on_host_pulse();
    void publish_presence();
    void publish_descriptor();
    void publish_history_request();

    /**
     * @brief Publishes @p msg on the zone topic. On Accepted it is appended
     *        locally (the relay echo is deduplicated by id).
     */
    void publish_chat(const ChatMessage &msg, SendCallback cb);
    ChatMessage make_message(MessageKind kind) const;
    void append_and_notify(const ChatMessage &msg);
    void notify_typing_changed();

    /** @brief Wraps @p fn so it runs only while generation @p gen is current. */
    std::function<void()> guarded(uint64_t gen, std::function<void()> fn);

    EventLoop &m_loop;
    ChannelTransport &m_transport;
    ClientIdentity m_identity;
    ClientConfig m_config;
    PositionProvider *m_position_provider;
    ContentModerator *m_moderator;
    SessionCallbacks m_cb;

    AccessControl m_access;
    DiscoveryService m_discovery;
    MessageLog m_log;
    HistorySynchronizer m_history;
    TypingTracker m_typing;
    PresenceCounter m_presence;

    SessionState m_state{SessionState::Idle};
    std::optional<Zone> m_zone;
    std::string m_zone_topic;
    bool m_is_host{false};
    uint64_t m_generation{0};
    int64_t m_remaining_ms{0};
    bool m_warning_raised{false};
    std::optional<int64_t> m_last_send_ms;
    std::optional<int64_t> m_last_typing_ms;

    bool m_started{false};
    ListenerId m_global_listener{0};
    ListenerId m_zone_listener{0};
    TimerId m_location_timer{kInvalidTimer};
    std::vector<TimerId> m_session_timers;
};

} // namespace zonechat::zone
