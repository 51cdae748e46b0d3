#include "zone/presence_counter.hpp"
#include "utils/logger.hpp"

namespace zonechat::zone
{

PresenceCounter::PresenceCounter(std::string self_fingerprint) : m_self(std::move(self_fingerprint))
{
    m_window.insert(m_self);
}

void PresenceCounter::observe(const std::string &fingerprint)
{
    if (!fingerprint.empty())
    {
        m_window.insert(fingerprint);
    }
}

int PresenceCounter::close_window()
{
    const int count = window_count();
    m_window.clear();
    m_window.insert(m_self);
    m_displayed = count;
    return count;
}

bool PresenceCounter::accept_count_sync(const std::string &from, const std::string &host_fingerprint,
                                        int count)
{
    if (from != host_fingerprint)
    {
        LOGGER_DEBUG("Presence: ignoring count_sync from non-host {}", from);
        return false;
    }
    if (count < 1)
    {
        LOGGER_DEBUG("Presence: ignoring invalid count {}", count);
        return false;
    }
    m_displayed = count;
    return true;
}

void PresenceCounter::reset()
{
    m_window.clear();
    m_window.insert(m_self);
    m_displayed = 1;
}

} // namespace zonechat::zone
