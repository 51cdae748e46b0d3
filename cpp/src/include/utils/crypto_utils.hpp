#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Cryptographic utilities: hashing, constant-time comparison, randomness.
 *
 * Used throughout zonechat for:
 * - SHA-256 digests of private-zone passwords (access control)
 * - Random fingerprints, zone ids, message ids and handle suffixes
 *
 * All primitives are provided by libsodium, initialized via the Lifecycle module
 * (or lazily on first use).
 *
 * Design Rationale:
 * - Single point of libsodium initialization
 * - No libsodium types in the public API
 * - Thread-safe (libsodium is thread-safe after initialization)
 *
 * @see https://libsodium.gitbook.io/doc/
 */
#include "zonechat_core_export.h"
#include "utils/module_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace zonechat::crypto
{

/** SHA-256 output size in bytes. */
static constexpr size_t SHA256_HASH_BYTES = 32;

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief Computes the SHA-256 hash of the input data.
 *
 * @param out  Output buffer of at least SHA256_HASH_BYTES.
 * @param data Input data (may be null only when @p len is 0).
 * @param len  Input length in bytes.
 * @return True on success, false on null arguments or libsodium failure.
 */
ZONECHAT_CORE_EXPORT bool compute_sha256(uint8_t *out, const void *data, size_t len) noexcept;

/**
 * @brief SHA-256 of @p data as a 64-character lower-case hex string.
 * @return Empty string on failure.
 */
ZONECHAT_CORE_EXPORT std::string sha256_hex(std::string_view data);

/**
 * @brief Compares two strings in time independent of where they first differ.
 * @details Length mismatch returns false immediately (lengths are not secret here).
 *          Uses sodium_memcmp().
 */
ZONECHAT_CORE_EXPORT bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// Random Number Generation
// ============================================================================

/**
 * @brief Fills @p out with cryptographically secure random bytes (randombytes_buf).
 * @note Never fails once libsodium is initialized.
 */
ZONECHAT_CORE_EXPORT void generate_random_bytes(uint8_t *out, size_t len) noexcept;

/**
 * @brief Uniform random value in [0, upper_bound) without modulo bias.
 * @return 0 when @p upper_bound is 0 or 1.
 */
ZONECHAT_CORE_EXPORT uint32_t random_uniform(uint32_t upper_bound) noexcept;

/** @brief @p num_bytes random bytes rendered as lower-case hex (2 chars per byte). */
ZONECHAT_CORE_EXPORT std::string random_hex(size_t num_bytes);

// ============================================================================
// Lifecycle Integration
// ============================================================================

/**
 * @brief ModuleDef "CryptoUtils": calls sodium_init() at startup.
 * @note Depends on "Logger".
 */
ZONECHAT_CORE_EXPORT zonechat::utils::ModuleDef GetLifecycleModule();

} // namespace zonechat::crypto
