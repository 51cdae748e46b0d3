#pragma once
/**
 * @file client_config.hpp
 * @brief zonechat client configuration, loaded from JSON.
 *
 * ## JSON format (every key optional)
 *
 * @code{.json}
 * {
 *   "handle":              "",
 *   "log_level":           "info",
 *   "radius_km":           2.0,
 *   "session_duration_ms": 3600000,
 *   "pulse_interval_ms":   10000,
 *   "discovery_sweep_ms":  5000,
 *   "typing_expiry_ms":    4000,
 *   "typing_sweep_ms":     1000,
 *   "typing_throttle_ms":  1500,
 *   "countdown_tick_ms":   1000,
 *   "expiry_warning_ms":   300000,
 *   "location_check_ms":   10000,
 *   "message_throttle_ms": 1000,
 *   "topic_prefix":        "zonechat/v1",
 *   "password_salt":       "zonechat-salt",
 *   "relay": {
 *     "pub_endpoint": "tcp://127.0.0.1:5580",
 *     "sub_endpoint": "tcp://127.0.0.1:5581"
 *   }
 * }
 * @endcode
 *
 * Layering: built-in defaults, then the file, then environment variables
 * `ZONECHAT_RELAY_PUB`, `ZONECHAT_RELAY_SUB`, `ZONECHAT_HANDLE`,
 * `ZONECHAT_LOG_LEVEL`. Any invalid value throws std::runtime_error naming the key.
 */
#include "zonechat_core_export.h"
#include "zone/access_control.hpp"
#include "zone/topics.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace zonechat::zone
{

struct ClientConfig
{
    std::string handle; ///< empty: generated
    std::string log_level{"info"};

    double radius_km{2.0};
    int64_t session_duration_ms{3600000};
    int64_t pulse_interval_ms{10000};
    int64_t discovery_sweep_ms{5000};
    int64_t typing_expiry_ms{4000};
    int64_t typing_sweep_ms{1000};
    int64_t typing_throttle_ms{1500};
    int64_t countdown_tick_ms{1000};
    int64_t expiry_warning_ms{300000};
    int64_t location_check_ms{10000};
    int64_t message_throttle_ms{1000};
    std::string topic_prefix{kDefaultTopicPrefix};
    std::string password_salt{kDefaultPasswordSalt};

    struct Relay
    {
        std::string pub_endpoint{"tcp://127.0.0.1:5580"};
        std::string sub_endpoint{"tcp://127.0.0.1:5581"};
    } relay;

    /** @brief Defaults overlaid with @p j, then validated. */
    ZONECHAT_CORE_EXPORT static ClientConfig from_json(const nlohmann::json &j);

    /**
     * @brief Reads @p path and calls from_json().
     * @throws std::runtime_error if the file is missing or not valid JSON.
     */
    ZONECHAT_CORE_EXPORT static ClientConfig from_json_file(const std::string &path);

    /** @brief Applies `ZONECHAT_*` environment variables, then validates. */
    ZONECHAT_CORE_EXPORT void apply_env_overrides();

    /** @throws std::runtime_error naming the first invalid key. */
    ZONECHAT_CORE_EXPORT void validate() const;
};

} // namespace zonechat::zone
