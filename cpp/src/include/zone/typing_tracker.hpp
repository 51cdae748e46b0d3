#pragma once
/**
 * @file typing_tracker.hpp
 * @brief Who is typing right now, by handle.
 */
#include "zonechat_core_export.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace zonechat::zone
{

/**
 * @brief Last-activity timestamps per handle with sweep expiry.
 *
 * An entry is removed by sweep() once `now - last_seen > expiry`. An entry seen
 * exactly `expiry` ms ago survives one more tick.
 */
class ZONECHAT_CORE_EXPORT TypingTracker
{
  public:
    explicit TypingTracker(int64_t expiry_ms);

    void touch(const std::string &handle, int64_t now_ms);
    /** @return true if @p handle had an entry. */
    bool clear(const std::string &handle);
    void clear_all() noexcept { m_last_seen.clear(); }

    /** @brief Removes expired entries. Returns how many were removed. */
    size_t sweep(int64_t now_ms);

    /** @brief Handles currently typing, sorted. */
    [[nodiscard]] std::vector<std::string> active() const;
    [[nodiscard]] bool contains(const std::string &handle) const;
    [[nodiscard]] size_t size() const noexcept { return m_last_seen.size(); }
    [[nodiscard]] int64_t expiry_ms() const noexcept { return m_expiry_ms; }

  private:
    int64_t m_expiry_ms;
    std::map<std::string, int64_t> m_last_seen;
};

} // namespace zonechat::zone
