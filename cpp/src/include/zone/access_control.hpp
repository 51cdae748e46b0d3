#pragma once
/**
 * @file access_control.hpp
 * @brief Salted password digests for private zones.
 *
 * `digest(p) = hex(SHA-256(p || salt))`. The digest is published on the
 * discovery topic with the zone, so anyone can attack it offline; it keeps
 * casual visitors out and nothing more.
 */
#include "zonechat_core_export.h"

#include <string>
#include <string_view>

namespace zonechat::zone
{

inline constexpr const char *kDefaultPasswordSalt = "zonechat-salt";

class ZONECHAT_CORE_EXPORT AccessControl
{
  public:
    explicit AccessControl(std::string salt = kDefaultPasswordSalt);

    /** @brief 64-char lower-case hex digest of @p password. */
    [[nodiscard]] std::string digest(std::string_view password) const;

    /** @brief Recomputes the digest and compares it in constant time. */
    [[nodiscard]] bool verify(std::string_view password, std::string_view expected_digest) const;

  private:
    std::string m_salt;
};

} // namespace zonechat::zone
