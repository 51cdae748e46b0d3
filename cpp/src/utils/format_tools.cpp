#include "utils/format_tools.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace zonechat::format_tools
{

namespace
{
constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kSecondsPerMinute = 60;
constexpr int64_t kSecondsPerHour = 3600;
constexpr int kMicrosPerSecond = 1000000;
} // namespace

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % kMicrosPerSecond);
    if (fractional_us < 0)
        fractional_us += kMicrosPerSecond;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string format_countdown(int64_t remaining_ms)
{
    if (remaining_ms <= 0)
        return "00:00";
    // Round up so "00:00" is only shown once the zone has actually expired.
    const int64_t total_s = (remaining_ms + kMsPerSecond - 1) / kMsPerSecond;
    const int64_t hours = total_s / kSecondsPerHour;
    const int64_t minutes = (total_s % kSecondsPerHour) / kSecondsPerMinute;
    const int64_t seconds = total_s % kSecondsPerMinute;
    if (hours > 0)
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

} // namespace zonechat::format_tools
