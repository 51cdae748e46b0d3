#pragma once
/**
 * @file discovery_service.hpp
 * @brief Locally visible list of nearby, unexpired zones.
 *
 * Listens on the discovery topic. A `zone_descriptor` is kept (replacing any
 * earlier copy) only if the zone is unexpired and its center lies within
 * `radius_km` of our position, boundary included; otherwise any cached copy is
 * removed. Without a known position nothing is kept.
 *
 * Nothing ever announces a deletion: a periodic sweep drops zones whose
 * `expires_at` has passed.
 */
#include "zonechat_core_export.h"
#include "zone/channel_transport.hpp"
#include "zone/event_loop.hpp"
#include "zone/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zonechat::zone
{

struct DiscoveredZone
{
    Zone zone;
    double distance_km{0.0};
};

class ZONECHAT_CORE_EXPORT DiscoveryService
{
  public:
    struct Config
    {
        double radius_km{2.0};
        int64_t sweep_interval_ms{5000};
        std::string topic; ///< discovery topic
    };

    DiscoveryService(EventLoop &loop, ChannelTransport &transport, std::string self_fingerprint,
                     Config cfg);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService &) = delete;
    DiscoveryService &operator=(const DiscoveryService &) = delete;

    /** @brief Subscribes, starts the sweep timer and requests a sync. Idempotent. */
    void start();
    /** @brief Unsubscribes and cancels the sweep timer. The cache is kept. */
    void stop();

    /** @brief Publishes `zone_sync_req` so hosts re-announce their zones. */
    PublishStatus request_sync();

    /**
     * @brief New position (or loss of it). Re-filters the cache; the first
     *        known position also triggers request_sync().
     */
    void set_position(std::optional<GeoPoint> position);
    [[nodiscard]] const std::optional<GeoPoint> &position() const noexcept { return m_position; }

    /** @brief Applies one descriptor (also called for envelopes from the transport). */
    void on_descriptor(const Zone &zone);

    /** @brief Removes expired zones. Returns how many were removed. */
    size_t sweep();

    /** @brief Cached zones by ascending distance, ties by id. */
    [[nodiscard]] std::vector<DiscoveredZone> zones() const;
    [[nodiscard]] std::optional<Zone> find(const std::string &zone_id) const;
    [[nodiscard]] size_t size() const noexcept { return m_zones.size(); }

    void set_on_changed(std::function<void()> cb) { m_on_changed = std::move(cb); }
    /** @brief Invoked with the requester's fingerprint for every foreign `zone_sync_req`. */
    void set_on_sync_request(std::function<void(const std::string &from)> cb)
    {
        m_on_sync_request = std::move(cb);
    }

    [[nodiscard]] const Config &config() const noexcept { return m_cfg; }

  private:
    void on_envelope(const std::string &topic, const Envelope &env);
    void notify_changed();

    EventLoop &m_loop;
    ChannelTransport &m_transport;
    std::string m_self;
    Config m_cfg;

    std::optional<GeoPoint> m_position;
    std::map<std::string, DiscoveredZone> m_zones;

    bool m_started{false};
    ListenerId m_listener{0};
    TimerId m_sweep_timer{kInvalidTimer};

    std::function<void()> m_on_changed;
    std::function<void(const std::string &)> m_on_sync_request;
};

} // namespace zonechat::zone
