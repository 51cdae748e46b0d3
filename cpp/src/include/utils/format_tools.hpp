// Tools for formatting strings
#pragma once
#include "zonechat_core_export.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace zonechat::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
ZONECHAT_CORE_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a millisecond duration as a countdown string.
 * @return "HH:MM:SS" when at least one hour remains, "MM:SS" otherwise.
 *         Negative input is clamped to "00:00".
 */
ZONECHAT_CORE_EXPORT std::string format_countdown(int64_t remaining_ms);

} // namespace zonechat::format_tools
