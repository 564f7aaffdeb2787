#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "TestUtils.hpp"
#include "filecrypt/core/AeadCipher.hpp"

namespace
{

using filecrypt::core::AeadCipher;
using filecrypt::core::ErrorCode;
using filecrypt::test_utils::bytesOf;

class AeadCipherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = filecrypt::test_utils::makeFastNativeProvider();
        m_salt.fill(0x5AU);
    }

    AeadCipher makeCipher(std::string_view password)
    {
        auto res = AeadCipher::fromPassword(*m_crypto, filecrypt::security::secureStringFrom(password), m_salt);
        EXPECT_TRUE(std::holds_alternative<AeadCipher>(res));
        return std::move(std::get<AeadCipher>(res));
    }

    std::unique_ptr<filecrypt::crypto::ICryptoProvider> m_crypto; // NOLINT
    filecrypt::core::Salt m_salt{};                                // NOLINT
};

ErrorCode codeOf(const filecrypt::core::Result<filecrypt::security::SecureBuffer>& r)
{
    return std::get<filecrypt::core::Error>(r).code;
}

} // namespace

TEST_F(AeadCipherTest, OutputIsNonceCipherTextTag)
{
    const auto cipher = makeCipher("correct-horse");
    const auto sealed = cipher.encrypt(bytesOf("hello world"));
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(sealed));
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(sealed).size(), 12U + 11U + 16U);
}

TEST_F(AeadCipherTest, RoundTrip)
{
    const auto cipher = makeCipher("correct-horse");
    const auto sealed = std::get<std::vector<std::uint8_t>>(cipher.encrypt(bytesOf("hello world")));

    const auto opened = cipher.decrypt(sealed);
    ASSERT_TRUE(std::holds_alternative<filecrypt::security::SecureBuffer>(opened));
    const auto& plain = std::get<filecrypt::security::SecureBuffer>(opened);
    EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(plain.data()), plain.size()), "hello world");
}

TEST_F(AeadCipherTest, SameKeyUsesFreshNoncePerCall)
{
    const auto cipher = makeCipher("correct-horse");
    const auto a = std::get<std::vector<std::uint8_t>>(cipher.encrypt(bytesOf("same")));
    const auto b = std::get<std::vector<std::uint8_t>>(cipher.encrypt(bytesOf("same")));

    EXPECT_FALSE(std::equal(a.begin(), a.begin() + 12, b.begin()));
}

TEST_F(AeadCipherTest, EveryFlippedBitFailsAuthentication)
{
    const auto cipher = makeCipher("correct-horse");
    const auto sealed = std::get<std::vector<std::uint8_t>>(cipher.encrypt(bytesOf("tamper me")));

    for (std::size_t i{}; i < sealed.size(); ++i)
    {
        for (unsigned bit{}; bit < 8U; ++bit)
        {
            auto tampered = sealed;
            tampered[i] ^= static_cast<std::uint8_t>(1U << bit);
            const auto opened = cipher.decrypt(tampered);
            ASSERT_TRUE(std::holds_alternative<filecrypt::core::Error>(opened)) << "byte " << i << " bit " << bit;
            EXPECT_EQ(codeOf(opened), ErrorCode::AuthenticationFailed);
        }
    }
}

TEST_F(AeadCipherTest, WrongPasswordFailsAuthentication)
{
    const auto sealed = std::get<std::vector<std::uint8_t>>(makeCipher("correct-horse").encrypt(bytesOf("x")));
    const auto opened = makeCipher("battery-staple").decrypt(sealed);
    EXPECT_EQ(codeOf(opened), ErrorCode::AuthenticationFailed);
}

TEST_F(AeadCipherTest, InputWithoutNonceIsPayloadTooShort)
{
    const auto cipher = makeCipher("correct-horse");
    const std::vector<std::uint8_t> input(11U, 0U);
    EXPECT_EQ(codeOf(cipher.decrypt(input)), ErrorCode::PayloadTooShort);
}

TEST_F(AeadCipherTest, InputWithoutTagFailsAuthentication)
{
    const auto cipher = makeCipher("correct-horse");
    const std::vector<std::uint8_t> input(12U + 15U, 0U);
    EXPECT_EQ(codeOf(cipher.decrypt(input)), ErrorCode::AuthenticationFailed);
}

TEST_F(AeadCipherTest, MovedFromCipherReportsInvalidArgument)
{
    auto cipher = makeCipher("correct-horse");
    const AeadCipher other{ std::move(cipher) };

    const auto sealed = cipher.encrypt(bytesOf("x")); // NOLINT(bugprone-use-after-move)
    ASSERT_TRUE(std::holds_alternative<filecrypt::core::Error>(sealed));
    EXPECT_EQ(std::get<filecrypt::core::Error>(sealed).code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(other.encrypt(bytesOf("x"))));
}
