/**
 * @file test_crypto_utils.cpp
 * @brief Layer 2 tests for crypto_utils (SHA-256, constant-time compare, randomness).
 *
 * libsodium is initialized lazily by the first call, so these run in-process
 * without a LifecycleGuard.
 */
#include "utils/crypto_utils.hpp"
#include <gtest/gtest.h>

#include <array>
#include <set>
#include <string>

using namespace zonechat::crypto;

// ============================================================================
// SHA-256
// ============================================================================

TEST(CryptoUtilsTest, Sha256KnownVectors)
{
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoUtilsTest, Sha256IsDeterministicAndDistinct)
{
    EXPECT_EQ(sha256_hex("bunker"), sha256_hex("bunker"));
    EXPECT_NE(sha256_hex("bunker"), sha256_hex("bunkeR"));
    EXPECT_EQ(sha256_hex("bunker").size(), 2 * SHA256_HASH_BYTES);
}

TEST(CryptoUtilsTest, ComputeSha256RejectsNullOutput)
{
    const char data[] = "x";
    EXPECT_FALSE(compute_sha256(nullptr, data, 1));
}

TEST(CryptoUtilsTest, ComputeSha256AllowsEmptyNullInput)
{
    std::array<uint8_t, SHA256_HASH_BYTES> out{};
    EXPECT_TRUE(compute_sha256(out.data(), nullptr, 0));
    EXPECT_EQ(out[0], 0xe3);
}

// ============================================================================
// Constant-time compare
// ============================================================================

TEST(CryptoUtilsTest, ConstantTimeEquals)
{
    EXPECT_TRUE(constant_time_equals("abcdef", "abcdef"));
    EXPECT_FALSE(constant_time_equals("abcdef", "abcdeg"));
    EXPECT_FALSE(constant_time_equals("abc", "abcd"));
    EXPECT_TRUE(constant_time_equals("", ""));
}

// ============================================================================
// Randomness
// ============================================================================

TEST(CryptoUtilsTest, RandomHexLengthAndAlphabet)
{
    const std::string h = random_hex(8);
    ASSERT_EQ(h.size(), 16u);
    EXPECT_EQ(h.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(CryptoUtilsTest, RandomUniformStaysInRange)
{
    std::set<uint32_t> seen;
    for (int i = 0; i < 2000; ++i)
    {
        const uint32_t v = random_uniform(8);
        ASSERT_LT(v, 8u);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 8u);
    EXPECT_EQ(random_uniform(0), 0u);
    EXPECT_EQ(random_uniform(1), 0u);
}
