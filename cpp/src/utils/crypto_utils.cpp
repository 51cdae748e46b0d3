/**
 * @file crypto_utils.cpp
 * @brief Implementation of cryptographic utilities using libsodium.
 */
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"

#include <sodium.h>

#include <atomic>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace zonechat::crypto
{

namespace
{
std::atomic<bool> g_sodium_initialized{false};

/**
 * @brief Ensures libsodium is initialized, calling sodium_init() if needed.
 * @return True if libsodium is initialized, false on catastrophic failure.
 */
bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    // sodium_init() is thread-safe and idempotent: 0 = first init, 1 = already done.
    const int result = sodium_init();
    if (result == -1)
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: sodium_init() failed!");
        return false;
    }
    g_sodium_initialized.store(true, std::memory_order_release);
    if (result == 0)
    {
        LOGGER_DEBUG("[CryptoUtils] libsodium initialized");
    }
    return true;
}

constexpr char kHexChars[] = "0123456789abcdef";
constexpr unsigned int kNibbleMask = 0x0FU;

std::string to_hex(const uint8_t *data, size_t len)
{
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i)
    {
        out += kHexChars[(data[i] >> 4U) & kNibbleMask];
        out += kHexChars[data[i] & kNibbleMask];
    }
    return out;
}
} // anonymous namespace

// ============================================================================
// Hashing
// ============================================================================

bool compute_sha256(uint8_t *out, const void *data, size_t len) noexcept
{
    if (!ensure_sodium_init())
    {
        return false;
    }
    if (out == nullptr || (data == nullptr && len > 0))
    {
        LOGGER_ERROR("[CryptoUtils] compute_sha256: null pointer argument");
        return false;
    }
    static const unsigned char kEmpty = 0;
    const auto *input = data != nullptr ? static_cast<const unsigned char *>(data) : &kEmpty;
    if (crypto_hash_sha256(out, input, len) != 0)
    {
        LOGGER_ERROR("[CryptoUtils] crypto_hash_sha256 failed (should never happen)");
        return false;
    }
    return true;
}

std::string sha256_hex(std::string_view data)
{
    std::array<uint8_t, SHA256_HASH_BYTES> hash{};
    if (!compute_sha256(hash.data(), data.data(), data.size()))
    {
        return {};
    }
    return to_hex(hash.data(), hash.size());
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    if (a.empty())
    {
        return true;
    }
    if (!ensure_sodium_init())
    {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Random Number Generation
// ============================================================================

void generate_random_bytes(uint8_t *out, size_t len) noexcept
{
    if (out == nullptr)
    {
        LOGGER_ERROR("[CryptoUtils] generate_random_bytes: null output pointer");
        return;
    }
    if (!ensure_sodium_init())
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: Cannot generate random bytes, libsodium not initialized!");
        std::memset(out, 0, len);
        return;
    }
    randombytes_buf(out, len);
}

uint32_t random_uniform(uint32_t upper_bound) noexcept
{
    if (upper_bound <= 1 || !ensure_sodium_init())
    {
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

std::string random_hex(size_t num_bytes)
{
    std::vector<uint8_t> bytes(num_bytes);
    generate_random_bytes(bytes.data(), bytes.size());
    return to_hex(bytes.data(), bytes.size());
}

// ============================================================================
// Lifecycle Integration
// ============================================================================

namespace
{
void crypto_startup(const char * /*arg*/)
{
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("[CryptoUtils] failed to initialize libsodium");
    }
    LOGGER_DEBUG("[CryptoUtils] Module initialized");
}

void crypto_shutdown(const char * /*arg*/)
{
    // libsodium needs no explicit cleanup.
    LOGGER_DEBUG("[CryptoUtils] Module shutdown complete");
}
} // anonymous namespace

zonechat::utils::ModuleDef GetLifecycleModule()
{
    zonechat::utils::ModuleDef module("CryptoUtils");
    module.add_dependency("Logger");
    module.set_startup(&crypto_startup);
    module.set_shutdown(&crypto_shutdown);
    return module;
}

} // namespace zonechat::crypto
