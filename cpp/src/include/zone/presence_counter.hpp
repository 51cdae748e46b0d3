#pragma once
/**
 * @file presence_counter.hpp
 * @brief Host-side membership aggregation.
 *
 * The host counts distinct sender fingerprints seen in `message` and
 * `presence` envelopes during a window, itself always included. At each
 * window boundary the count is broadcast and the window restarts. Everyone
 * else displays the last `count_sync` received from the zone's host.
 */
#include "zonechat_core_export.h"

#include <set>
#include <string>

namespace zonechat::zone
{

class ZONECHAT_CORE_EXPORT PresenceCounter
{
  public:
    explicit PresenceCounter(std::string self_fingerprint);

    void observe(const std::string &fingerprint);

    /** @brief Ends the window: returns its count and starts a new one. */
    int close_window();

    [[nodiscard]] int window_count() const noexcept { return static_cast<int>(m_window.size()); }

    /**
     * @brief Non-host path. Accepts @p count only if @p from is @p host_fingerprint.
     * @return true if the displayed count was updated.
     */
    bool accept_count_sync(const std::string &from, const std::string &host_fingerprint, int count);

    [[nodiscard]] int displayed() const noexcept { return m_displayed; }
    void set_displayed(int count) noexcept { m_displayed = count; }

    /** @brief Back to a fresh window containing only ourselves, displayed = 1. */
    void reset();

  private:
    std::string m_self;
    std::set<std::string> m_window;
    int m_displayed{1};
};

} // namespace zonechat::zone
