#include "zone/typing_tracker.hpp"

#include <stdexcept>

namespace zonechat::zone
{

TypingTracker::TypingTracker(int64_t expiry_ms) : m_expiry_ms(expiry_ms)
{
    if (expiry_ms <= 0)
    {
        throw std::invalid_argument("TypingTracker: expiry must be positive");
    }
}

void TypingTracker::touch(const std::string &handle, int64_t now_ms)
{
    m_last_seen[handle] = now_ms;
}

bool TypingTracker::clear(const std::string &handle)
{
    return m_last_seen.erase(handle) != 0;
}

size_t TypingTracker::sweep(int64_t now_ms)
{
    size_t removed = 0;
    for (auto it = m_last_seen.begin(); it != m_last_seen.end();)
    {
        if (now_ms - it->second > m_expiry_ms)
        {
            it = m_last_seen.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::vector<std::string> TypingTracker::active() const
{
    std::vector<std::string> out;
    out.reserve(m_last_seen.size());
    for (const auto &[handle, ts] : m_last_seen)
    {
        out.push_back(handle);
    }
    return out;
}

bool TypingTracker::contains(const std::string &handle) const
{
    return m_last_seen.count(handle) != 0;
}

} // namespace zonechat::zone
