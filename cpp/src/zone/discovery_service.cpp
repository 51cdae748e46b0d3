#include "zone/discovery_service.hpp"
#include "zone/geo.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace zonechat::zone
{

DiscoveryService::DiscoveryService(EventLoop &loop, ChannelTransport &transport,
                                   std::string self_fingerprint, Config cfg)
    : m_loop(loop), m_transport(transport), m_self(std::move(self_fingerprint)),
      m_cfg(std::move(cfg))
{
    if (m_cfg.radius_km <= 0.0)
    {
        throw std::invalid_argument("DiscoveryService: radius_km must be positive");
    }
    if (m_cfg.topic.empty())
    {
        throw std::invalid_argument("DiscoveryService: topic must not be empty");
    }
}

DiscoveryService::~DiscoveryService()
{
    stop();
}

void DiscoveryService::start()
{
    if (m_started)
    {
        return;
    }
    m_started = true;
    m_listener = m_transport.add_listener(
        {[this](const std::string &topic, const Envelope &env) { on_envelope(topic, env); }, {},
         {}});
    m_transport.subscribe(m_cfg.topic);
    m_sweep_timer = m_loop.schedule_every(m_cfg.sweep_interval_ms, [this] { sweep(); });
    LOGGER_INFO("Discovery: started on '{}' (radius {} km)", m_cfg.topic, m_cfg.radius_km);
    request_sync();
}

void DiscoveryService::stop()
{
    if (!m_started)
    {
        return;
    }
    m_started = false;
    m_loop.cancel(m_sweep_timer);
    m_sweep_timer = kInvalidTimer;
    m_transport.remove_listener(m_listener);
    m_transport.unsubscribe(m_cfg.topic);
    LOGGER_INFO("Discovery: stopped");
}

PublishStatus DiscoveryService::request_sync()
{
    const PublishStatus status =
        m_transport.publish(m_cfg.topic, Envelope{m_self, std::nullopt, ZoneSyncRequest{}});
    LOGGER_DEBUG("Discovery: sync request {}", to_string(status));
    return status;
}

void DiscoveryService::set_position(std::optional<GeoPoint> position)
{
    const bool first_fix = position.has_value() && !m_position.has_value();
    m_position = position;

    size_t removed = 0;
    for (auto it = m_zones.begin(); it != m_zones.end();)
    {
        if (!m_position)
        {
            it = m_zones.erase(it);
            ++removed;
            continue;
        }
        it->second.distance_km = distance_km(*m_position, it->second.zone.center);
        if (it->second.distance_km > m_cfg.radius_km)
        {
            it = m_zones.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    if (removed > 0)
    {
        LOGGER_DEBUG("Discovery: {} zone(s) out of range after position change", removed);
    }
    // Distances changed even when nothing was removed.
    if (!m_zones.empty() || removed > 0)
    {
        notify_changed();
    }
    if (first_fix && m_started)
    {
        request_sync();
    }
}

void DiscoveryService::on_descriptor(const Zone &zone)
{
    const int64_t now = m_loop.now_ms();
    bool keep = false;
    double dist = 0.0;
    if (m_position && !zone.is_expired(now))
    {
        dist = distance_km(*m_position, zone.center);
        keep = dist <= m_cfg.radius_km;
    }

    if (keep)
    {
        const bool is_new = m_zones.count(zone.id) == 0;
        m_zones[zone.id] = DiscoveredZone{zone, dist};
        if (is_new)
        {
            LOGGER_INFO("Discovery: found zone {} '{}' at {:.2f} km", zone.id, zone.name, dist);
        }
        notify_changed();
    }
    else if (m_zones.erase(zone.id) != 0)
    {
        LOGGER_DEBUG("Discovery: dropped zone {} (expired or out of range)", zone.id);
        notify_changed();
    }
}

size_t DiscoveryService::sweep()
{
    const int64_t now = m_loop.now_ms();
    size_t removed = 0;
    for (auto it = m_zones.begin(); it != m_zones.end();)
    {
        if (it->second.zone.is_expired(now))
        {
            LOGGER_DEBUG("Discovery: zone {} expired", it->first);
            it = m_zones.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    if (removed > 0)
    {
        notify_changed();
    }
    return removed;
}

std::vector<DiscoveredZone> DiscoveryService::zones() const
{
    std::vector<DiscoveredZone> out;
    out.reserve(m_zones.size());
    for (const auto &[id, dz] : m_zones)
    {
        out.push_back(dz);
    }
    // m_zones iterates by id, so a stable sort keeps ties ordered by id.
    std::stable_sort(out.begin(), out.end(),
                     [](const DiscoveredZone &a, const DiscoveredZone &b)
                     { return a.distance_km < b.distance_km; });
    return out;
}

std::optional<Zone> DiscoveryService::find(const std::string &zone_id) const
{
    auto it = m_zones.find(zone_id);
    if (it == m_zones.end())
    {
        return std::nullopt;
    }
    return it->second.zone;
}

void DiscoveryService::on_envelope(const std::string &topic, const Envelope &env)
{
    if (topic != m_cfg.topic)
    {
        return;
    }
    if (const auto *desc = env.as<ZoneDescriptor>())
    {
        on_descriptor(desc->zone);
    }
    else if (env.as<ZoneSyncRequest>() != nullptr)
    {
        if (env.from != m_self && m_on_sync_request)
        {
            m_on_sync_request(env.from);
        }
    }
    else
    {
        LOGGER_DEBUG("Discovery: ignoring '{}' on discovery topic", env.kind());
    }
}

void DiscoveryService::notify_changed()
{
    if (m_on_changed)
    {
        m_on_changed();
    }
}

} // namespace zonechat::zone
