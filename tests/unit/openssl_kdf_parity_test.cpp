#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string_view>

#include "TestUtils.hpp"
#include "filecrypt/crypto/providers/OpenSslProviderFactory.hpp"
#include "filecrypt/security/SecureEquals.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

// Runs `params` through both backends; skips when libcrypto has no Argon2id.
void expectParity(const filecrypt::crypto::Argon2idParams& params)
{
    auto native{ filecrypt::crypto::providers::makeNativeCryptoProvider(params) };
    auto openssl{ filecrypt::crypto::providers::makeOpenSslCryptoProvider(params) };

    std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> salt{};
    salt[0] = 0x42U;
    salt[31] = 0x99U;

    constexpr std::string_view kPassword{ "correct-horse" };
    const auto nativeKey{ native->deriveKey(asBytes(kPassword), salt) };

    filecrypt::security::SecureBuffer opensslKey{};
    try
    {
        opensslKey = openssl->deriveKey(asBytes(kPassword), salt);
    }
    catch (const std::runtime_error& e)
    {
        GTEST_SKIP() << e.what();
    }

    ASSERT_EQ(nativeKey.size(), filecrypt::crypto::g_kDerivedKeyBytes);
    ASSERT_EQ(opensslKey.size(), filecrypt::crypto::g_kDerivedKeyBytes);
    EXPECT_TRUE(filecrypt::security::secureEquals(nativeKey, opensslKey));
}

} // namespace

TEST(CryptoProviderParity, SingleLaneNativeEqualsOpenSsl)
{
    expectParity(filecrypt::test_utils::g_fastArgon2idParams);
}

TEST(CryptoProviderParity, FourLanesNativeEqualsOpenSsl)
{
    expectParity({ .iterations = 2U, .memoryKiB = 64U, .parallelism = 4U });
}

TEST(CryptoProviderParity, FormatParamsNativeEqualsOpenSsl)
{
    if (!filecrypt::test_utils::envFlagSet("FILECRYPT_RUN_SLOW_TESTS"))
    {
        GTEST_SKIP() << "Set FILECRYPT_RUN_SLOW_TESTS=1 to run the 64 MiB Argon2id profile.";
    }
    expectParity(filecrypt::crypto::g_kFormatArgon2idParams);
}

TEST(OpenSslCryptoProvider, AeadRoundTrip)
{
    auto provider{ filecrypt::crypto::providers::makeOpenSslCryptoProvider(filecrypt::test_utils::g_fastArgon2idParams) };

    std::array<std::uint8_t, filecrypt::crypto::g_aeadKeyBytes> key{};
    key.fill(0x11U);

    const auto box{ provider->aeadEncrypt(key, asBytes("hello world")) };
    const filecrypt::crypto::AeadBoxView view{
        .nonce = std::span<const std::uint8_t, filecrypt::crypto::g_aeadNonceBytes>{ box.nonce },
        .cipherText = std::span<const std::uint8_t>{ box.cipherText },
        .tag = std::span<const std::uint8_t, filecrypt::crypto::g_aeadTagBytes>{ box.tag }
    };
    const auto plain{ provider->aeadDecrypt(key, view) };
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->size(), std::string_view{ "hello world" }.size());
}
