#pragma once
/**
 * @file collaborators.hpp
 * @brief Interfaces to services outside the protocol core.
 *
 * Geolocation and content moderation are supplied by the embedding
 * application. Both are called on the event loop and must not block for long.
 */
#include "zonechat_core_export.h"
#include "utils/result.hpp"
#include "zone/types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace zonechat::zone
{

enum class LocationError
{
    Unavailable,
    PermissionDenied,
    Timeout,
};

inline const char *to_string(LocationError e) noexcept
{
    switch (e)
    {
    case LocationError::Unavailable:      return "Unavailable";
    case LocationError::PermissionDenied: return "PermissionDenied";
    case LocationError::Timeout:          return "Timeout";
    }
    return "Unknown";
}

class ZONECHAT_CORE_EXPORT PositionProvider
{
  public:
    virtual ~PositionProvider() = default;
    [[nodiscard]] virtual utils::Result<GeoPoint, LocationError> current_position() = 0;
};

/** @brief Provider returning whatever was last set(); Unavailable until then. */
class ZONECHAT_CORE_EXPORT FixedPositionProvider final : public PositionProvider
{
  public:
    FixedPositionProvider() = default;
    explicit FixedPositionProvider(GeoPoint p) : m_position(p) {}

    void set(std::optional<GeoPoint> p)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_position = p;
    }

    [[nodiscard]] utils::Result<GeoPoint, LocationError> current_position() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_position)
        {
            return utils::Result<GeoPoint, LocationError>::error(LocationError::Unavailable);
        }
        return utils::Result<GeoPoint, LocationError>::ok(*m_position);
    }

  private:
    std::mutex m_mutex;
    std::optional<GeoPoint> m_position;
};

struct ModerationVerdict
{
    bool safe{true};
    std::string reason;
};

class ZONECHAT_CORE_EXPORT ContentModerator
{
  public:
    virtual ~ContentModerator() = default;
    [[nodiscard]] virtual ModerationVerdict moderate(std::string_view text) = 0;
};

} // namespace zonechat::zone
