#pragma once
/**
 * @file uid_utils.hpp
 * @brief Generators for zonechat identifiers and display handles.
 *
 * ## Formats
 *
 *   Fingerprint: 12 lower-case hex chars, one per running client
 *   Zone id:     "Z" + 16 lower-case hex chars
 *   Message id:  "M" + 16 lower-case hex chars; system notices use
 *                "sys_join_" / "sys_leave_" + 12 hex chars
 *   Handle:      {ADJECTIVE}{NOUN}{NN}, e.g. "NEONPULSE42"
 *
 * Randomness comes from libsodium (crypto::generate_random_bytes), so ids are
 * unpredictable as well as collision-resistant (64-bit suffix for zone and
 * message ids).
 */
#include "utils/crypto_utils.hpp"

#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace zonechat::uid
{

namespace detail
{
inline constexpr std::array<std::string_view, 10> kAdjectives = {
    "SILENT", "NEON", "ECHO", "PRISM", "GHOST", "NOVA", "SWIFT", "DEEP", "COLD", "ZENITH"};
inline constexpr std::array<std::string_view, 10> kNouns = {
    "WALKER", "SIGNAL", "NODE", "PULSE", "VERTEX", "SPARK", "VECTOR", "ORBIT", "WAVE", "GHOST"};
inline constexpr std::array<std::string_view, 8> kColors = {
    "blue", "green", "purple", "pink", "yellow", "cyan", "orange", "indigo"};
inline constexpr size_t kFingerprintBytes = 6;
inline constexpr size_t kIdBytes = 8;
inline constexpr uint32_t kHandleSuffixRange = 100;
} // namespace detail

/** @brief Process-scoped client fingerprint: 12 hex chars. */
inline std::string generate_fingerprint()
{
    return crypto::random_hex(detail::kFingerprintBytes);
}

/** @brief Zone id: @c "Z" + 16 hex chars. */
inline std::string generate_zone_id()
{
    return "Z" + crypto::random_hex(detail::kIdBytes);
}

/** @brief Chat message id: @c "M" + 16 hex chars. */
inline std::string generate_message_id()
{
    return "M" + crypto::random_hex(detail::kIdBytes);
}

/** @brief System notice id, e.g. @c "sys_join_3fa2c9d01b7e". */
inline std::string generate_system_message_id(std::string_view kind)
{
    return "sys_" + std::string(kind) + "_" + crypto::random_hex(detail::kFingerprintBytes);
}

/** @brief Random display handle such as @c "NOVAORBIT07". */
inline std::string generate_handle()
{
    std::string handle(detail::kAdjectives[crypto::random_uniform(detail::kAdjectives.size())]);
    handle += detail::kNouns[crypto::random_uniform(detail::kNouns.size())];
    const uint32_t n = crypto::random_uniform(detail::kHandleSuffixRange);
    handle += static_cast<char>('0' + n / 10);
    handle += static_cast<char>('0' + n % 10);
    return handle;
}

/** @brief Cosmetic color picked from a fixed palette. */
inline std::string pick_color()
{
    return std::string(detail::kColors[crypto::random_uniform(detail::kColors.size())]);
}

/** @brief Upper-cases ASCII letters; other bytes pass through unchanged. */
inline std::string to_upper_ascii(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        out += static_cast<char>(std::toupper(c));
    }
    return out;
}

} // namespace zonechat::uid
