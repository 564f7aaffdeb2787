#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include "TestUtils.hpp"
#include "filecrypt/crypto/KeyDerivation.hpp"
#include "filecrypt/security/SecureEquals.hpp"

namespace
{

using filecrypt::test_utils::g_fastArgon2idParams;

constexpr std::string_view g_kPassword{ "correct-horse" };

std::span<const std::byte> asBytes(std::string_view s)
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

filecrypt::security::SecureBuffer derive(std::string_view password, std::span<const std::uint8_t> salt,
                                         filecrypt::crypto::Argon2idParams params = g_fastArgon2idParams)
{
    return filecrypt::crypto::deriveKeyArgon2id(asBytes(password), salt, params);
}

} // namespace

TEST(KeyDerivation, RejectsSaltThatIsNot32Bytes)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes - 1U> shortSalt{};
    std::array<std::uint8_t, 16U> argon2DefaultSalt{};
    EXPECT_THROW((void)derive(g_kPassword, shortSalt), std::invalid_argument);
    EXPECT_THROW((void)derive(g_kPassword, argon2DefaultSalt), std::invalid_argument);
}

TEST(KeyDerivation, RejectsUnsafeParameters)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};

    EXPECT_THROW((void)derive(g_kPassword, salt, { .iterations = 0U, .memoryKiB = 8U, .parallelism = 1U }),
                 std::invalid_argument);
    EXPECT_THROW((void)derive(g_kPassword, salt, { .iterations = 1U, .memoryKiB = 8U, .parallelism = 0U }),
                 std::invalid_argument);
    EXPECT_THROW((void)derive(g_kPassword, salt, { .iterations = 11U, .memoryKiB = 8U, .parallelism = 1U }),
                 std::invalid_argument);
    EXPECT_THROW(
        (void)derive(g_kPassword, salt, { .iterations = 1U, .memoryKiB = 1024U * 1024U + 4U, .parallelism = 1U }),
        std::invalid_argument);
}

TEST(KeyDerivation, RejectsMemoryNotMatchingLanes)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};
    // Below 8 KiB per lane.
    EXPECT_THROW((void)derive(g_kPassword, salt, { .iterations = 1U, .memoryKiB = 16U, .parallelism = 4U }),
                 std::invalid_argument);
    // Not a multiple of 4 KiB per lane.
    EXPECT_THROW((void)derive(g_kPassword, salt, { .iterations = 1U, .memoryKiB = 36U, .parallelism = 4U }),
                 std::invalid_argument);
}

TEST(KeyDerivation, FormatProfileConstants)
{
    EXPECT_EQ(filecrypt::crypto::g_kFormatArgon2idParams.iterations, 3U);
    EXPECT_EQ(filecrypt::crypto::g_kFormatArgon2idParams.memoryKiB, 65536U);
    EXPECT_EQ(filecrypt::crypto::g_kFormatArgon2idParams.parallelism, 4U);
}

TEST(KeyDerivation, Produces32ByteKeyAndIsDeterministic)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};
    salt[0] = 0x01U;
    salt[31] = 0x02U;

    const auto a = derive(g_kPassword, salt);
    const auto b = derive(g_kPassword, salt);

    ASSERT_EQ(a.size(), filecrypt::crypto::g_kDerivedKeyBytes);
    EXPECT_TRUE(filecrypt::security::secureEquals(a, b));
}

TEST(KeyDerivation, AcceptsEmptyPassword)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};
    const auto key = derive("", salt);
    EXPECT_EQ(key.size(), filecrypt::crypto::g_kDerivedKeyBytes);
}

TEST(KeyDerivation, LastSaltByteChangesKey)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> saltA{};
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> saltB{};
    saltB[31] = 0x01U;

    EXPECT_FALSE(filecrypt::security::secureEquals(derive(g_kPassword, saltA), derive(g_kPassword, saltB)));
}

TEST(KeyDerivation, PasswordChangesKey)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};
    EXPECT_FALSE(filecrypt::security::secureEquals(derive("correct-horse", salt), derive("correct-horsf", salt)));
}

TEST(KeyDerivation, LaneCountChangesKey)
{
    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};
    constexpr filecrypt::crypto::Argon2idParams kOneLane{ .iterations = 1U, .memoryKiB = 32U, .parallelism = 1U };
    constexpr filecrypt::crypto::Argon2idParams kFourLanes{ .iterations = 1U, .memoryKiB = 32U, .parallelism = 4U };

    EXPECT_FALSE(
        filecrypt::security::secureEquals(derive(g_kPassword, salt, kOneLane), derive(g_kPassword, salt, kFourLanes)));
}

TEST(KeyDerivation, FormatParamsDerive32ByteKey)
{
    if (!filecrypt::test_utils::envFlagSet("FILECRYPT_RUN_SLOW_TESTS"))
    {
        GTEST_SKIP() << "Set FILECRYPT_RUN_SLOW_TESTS=1 to run the 64 MiB Argon2id profile.";
    }

    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};
    salt[0] = 0x10U;

    const auto a = filecrypt::crypto::deriveKeyArgon2idFormat(asBytes(g_kPassword), salt);
    const auto b = derive(g_kPassword, salt, filecrypt::crypto::g_kFormatArgon2idParams);
    ASSERT_EQ(a.size(), filecrypt::crypto::g_kDerivedKeyBytes);
    EXPECT_TRUE(filecrypt::security::secureEquals(a, b));
}
