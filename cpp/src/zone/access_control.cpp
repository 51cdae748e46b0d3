#include "zone/access_control.hpp"
#include "utils/crypto_utils.hpp"

#include <stdexcept>

namespace zonechat::zone
{

AccessControl::AccessControl(std::string salt) : m_salt(std::move(salt)) {}

std::string AccessControl::digest(std::string_view password) const
{
    std::string salted;
    salted.reserve(password.size() + m_salt.size());
    salted.append(password);
    salted.append(m_salt);
    std::string hex = crypto::sha256_hex(salted);
    if (hex.empty())
    {
        throw std::runtime_error("AccessControl: SHA-256 failed");
    }
    return hex;
}

bool AccessControl::verify(std::string_view password, std::string_view expected_digest) const
{
    return crypto::constant_time_equals(digest(password), expected_digest);
}

} // namespace zonechat::zone
