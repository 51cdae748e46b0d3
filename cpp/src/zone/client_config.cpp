/**
 * @file client_config.cpp
 * @brief ClientConfig JSON parsing and environment overrides.
 */
#include "zone/client_config.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace zonechat::zone
{

namespace
{

[[noreturn]] void invalid(const std::string &key, const std::string &why)
{
    throw std::runtime_error("Client config: invalid '" + key + "' (" + why + ")");
}

int64_t read_ms(const nlohmann::json &j, const char *key, int64_t fallback)
{
    auto it = j.find(key);
    if (it == j.end())
        return fallback;
    if (!it->is_number_integer())
        invalid(key, "must be an integer number of milliseconds");
    return it->get<int64_t>();
}

double read_double(const nlohmann::json &j, const char *key, double fallback)
{
    auto it = j.find(key);
    if (it == j.end())
        return fallback;
    if (!it->is_number())
        invalid(key, "must be a number");
    return it->get<double>();
}

std::string read_string(const nlohmann::json &j, const char *key, const std::string &fallback)
{
    auto it = j.find(key);
    if (it == j.end())
        return fallback;
    if (!it->is_string())
        invalid(key, "must be a string");
    return it->get<std::string>();
}

void require_positive(const char *key, int64_t v)
{
    if (v <= 0)
        invalid(key, "must be > 0, got " + std::to_string(v));
}

const char *env_or_null(const char *name)
{
    const char *v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

} // namespace

ClientConfig ClientConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Client config: top level must be a JSON object");
    }
    ClientConfig c;
    c.handle = read_string(j, "handle", c.handle);
    c.log_level = read_string(j, "log_level", c.log_level);
    c.radius_km = read_double(j, "radius_km", c.radius_km);
    c.session_duration_ms = read_ms(j, "session_duration_ms", c.session_duration_ms);
    c.pulse_interval_ms = read_ms(j, "pulse_interval_ms", c.pulse_interval_ms);
    c.discovery_sweep_ms = read_ms(j, "discovery_sweep_ms", c.discovery_sweep_ms);
    c.typing_expiry_ms = read_ms(j, "typing_expiry_ms", c.typing_expiry_ms);
    c.typing_sweep_ms = read_ms(j, "typing_sweep_ms", c.typing_sweep_ms);
    c.typing_throttle_ms = read_ms(j, "typing_throttle_ms", c.typing_throttle_ms);
    c.countdown_tick_ms = read_ms(j, "countdown_tick_ms", c.countdown_tick_ms);
    c.expiry_warning_ms = read_ms(j, "expiry_warning_ms", c.expiry_warning_ms);
    c.location_check_ms = read_ms(j, "location_check_ms", c.location_check_ms);
    c.message_throttle_ms = read_ms(j, "message_throttle_ms", c.message_throttle_ms);
    c.topic_prefix = read_string(j, "topic_prefix", c.topic_prefix);
    c.password_salt = read_string(j, "password_salt", c.password_salt);

    if (auto it = j.find("relay"); it != j.end())
    {
        if (!it->is_object())
            invalid("relay", "must be an object");
        c.relay.pub_endpoint = read_string(*it, "pub_endpoint", c.relay.pub_endpoint);
        c.relay.sub_endpoint = read_string(*it, "sub_endpoint", c.relay.sub_endpoint);
    }

    c.handle = uid::to_upper_ascii(c.handle);
    c.validate();
    return c;
}

ClientConfig ClientConfig::from_json_file(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error("Client config: cannot open '" + path + "'");
    }
    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Client config: '" + path + "' is not valid JSON: " + e.what());
    }
    return from_json(j);
}

void ClientConfig::apply_env_overrides()
{
    if (const char *v = env_or_null("ZONECHAT_RELAY_PUB"))
        relay.pub_endpoint = v;
    if (const char *v = env_or_null("ZONECHAT_RELAY_SUB"))
        relay.sub_endpoint = v;
    if (const char *v = env_or_null("ZONECHAT_HANDLE"))
        handle = uid::to_upper_ascii(v);
    if (const char *v = env_or_null("ZONECHAT_LOG_LEVEL"))
        log_level = v;
    validate();
}

void ClientConfig::validate() const
{
    if (!(radius_km > 0.0))
        invalid("radius_km", "must be > 0");
    require_positive("session_duration_ms", session_duration_ms);
    // Members send presence every half pulse.
    if (pulse_interval_ms < 2)
        invalid("pulse_interval_ms", "must be >= 2");
    require_positive("discovery_sweep_ms", discovery_sweep_ms);
    require_positive("typing_expiry_ms", typing_expiry_ms);
    require_positive("typing_sweep_ms", typing_sweep_ms);
    if (typing_throttle_ms < 0)
        invalid("typing_throttle_ms", "must be >= 0");
    require_positive("countdown_tick_ms", countdown_tick_ms);
    if (expiry_warning_ms < 0)
        invalid("expiry_warning_ms", "must be >= 0");
    require_positive("location_check_ms", location_check_ms);
    if (message_throttle_ms < 0)
        invalid("message_throttle_ms", "must be >= 0");
    if (topic_prefix.empty())
        invalid("topic_prefix", "must not be empty");
    if (relay.pub_endpoint.empty())
        invalid("relay.pub_endpoint", "must not be empty");
    if (relay.sub_endpoint.empty())
        invalid("relay.sub_endpoint", "must not be empty");
    if (!utils::Logger::level_from_string(log_level))
        invalid("log_level", "unknown level '" + log_level + "'");
}

} // namespace zonechat::zone
