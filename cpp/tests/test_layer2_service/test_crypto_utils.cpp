// tests/test_layer2_service/test_crypto_utils.cpp
/**
 * @file test_crypto_utils.cpp
 * @brief libsodium wrappers: BLAKE2b, Argon2id key derivation and random bytes.
 *
 * Key derivation uses the libsodium minimum cost so the suite stays fast.
 */
#include "wk_service.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cctype>
#include <set>
#include <string>

using namespace walkie;

namespace
{
std::array<uint8_t, crypto::PWHASH_SALT_BYTES> make_salt(uint8_t fill)
{
    std::array<uint8_t, crypto::PWHASH_SALT_BYTES> salt{};
    salt.fill(fill);
    return salt;
}

std::array<uint8_t, 32> derive(std::string_view password, uint8_t salt_fill)
{
    std::array<uint8_t, 32> out{};
    EXPECT_TRUE(crypto::derive_key(out.data(), out.size(), password, make_salt(salt_fill),
                                   crypto::pwhash_opslimit_min(),
                                   crypto::pwhash_memlimit_min()));
    return out;
}
} // namespace

// ============================================================================
// BLAKE2b
// ============================================================================

TEST(CryptoUtilsTest, Blake2bIsDeterministic)
{
    const std::string data = "walkie";
    std::array<uint8_t, 32> a{};
    std::array<uint8_t, 32> b{};
    ASSERT_TRUE(crypto::compute_blake2b(a.data(), a.size(), data.data(), data.size()));
    ASSERT_TRUE(crypto::compute_blake2b(b.data(), b.size(), data.data(), data.size()));
    EXPECT_EQ(a, b);
}

TEST(CryptoUtilsTest, Blake2bDiffersForDifferentInput)
{
    std::array<uint8_t, 32> a{};
    std::array<uint8_t, 32> b{};
    ASSERT_TRUE(crypto::compute_blake2b(a.data(), a.size(), "room-a", 6));
    ASSERT_TRUE(crypto::compute_blake2b(b.data(), b.size(), "room-b", 6));
    EXPECT_NE(a, b);
}

TEST(CryptoUtilsTest, Blake2bRejectsNullOutput)
{
    EXPECT_FALSE(crypto::compute_blake2b(nullptr, 32, "x", 1));
}

// ============================================================================
// Argon2id
// ============================================================================

TEST(CryptoUtilsTest, DeriveKeyIsDeterministic)
{
    EXPECT_EQ(derive("s1", 0x11), derive("s1", 0x11));
}

TEST(CryptoUtilsTest, DeriveKeyDependsOnPasswordAndSalt)
{
    const auto base = derive("s1", 0x11);
    EXPECT_NE(base, derive("s2", 0x11));
    EXPECT_NE(base, derive("s1", 0x22));
}

TEST(CryptoUtilsTest, CostLimitsAreOrdered)
{
    EXPECT_LE(crypto::pwhash_opslimit_min(), crypto::pwhash_opslimit_interactive());
    EXPECT_LE(crypto::pwhash_memlimit_min(), crypto::pwhash_memlimit_interactive());
}

// ============================================================================
// Random
// ============================================================================

TEST(CryptoUtilsTest, RandomHexHasExpectedShape)
{
    const std::string id = crypto::generate_random_hex(4);
    ASSERT_EQ(id.size(), 8u);
    for (char c : id)
    {
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f'))
            << "unexpected character '" << c << "' in " << id;
    }
}

TEST(CryptoUtilsTest, RandomValuesAreUnique)
{
    std::set<uint64_t> seen;
    for (int i = 0; i < 1000; ++i)
    {
        seen.insert(crypto::generate_random_u64());
    }
    EXPECT_EQ(seen.size(), 1000u);
}
