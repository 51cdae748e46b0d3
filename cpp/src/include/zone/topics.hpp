#pragma once
/**
 * @file topics.hpp
 * @brief Relay topic names.
 *
 *   <prefix>/discovery        zone descriptors and sync requests
 *   <prefix>/zones/<zone id>  everything inside one zone
 */
#include <string>
#include <string_view>

namespace zonechat::zone
{

inline constexpr const char *kDefaultTopicPrefix = "zonechat/v1";

inline std::string discovery_topic(std::string_view prefix)
{
    std::string t(prefix);
    t += "/discovery";
    return t;
}

inline std::string zone_topic(std::string_view prefix, std::string_view zone_id)
{
    std::string t(prefix);
    t += "/zones/";
    t += zone_id;
    return t;
}

} // namespace zonechat::zone
