#include <gtest/gtest.h>

#include <cstdint>
#include <variant>
#include <vector>

#include "filecrypt/core/Container.hpp"

namespace
{

using filecrypt::core::ErrorCode;

filecrypt::core::Salt patternSalt()
{
    filecrypt::core::Salt salt{};
    for (std::size_t i{}; i < salt.size(); ++i)
    {
        salt[i] = static_cast<std::uint8_t>(0xC0U + i);
    }
    return salt;
}

ErrorCode codeOf(const filecrypt::core::Result<filecrypt::core::ContainerView>& r)
{
    return std::get<filecrypt::core::Error>(r).code;
}

} // namespace

TEST(Container, LayoutIsMagicVersionSaltPayload)
{
    const std::vector<std::uint8_t> payload{ 0x01U, 0x02U, 0x03U };
    const auto bytes = filecrypt::core::encodeContainer(patternSalt(), payload);

    ASSERT_EQ(bytes.size(), 37U + payload.size());
    EXPECT_EQ(bytes[0], 0x45U);
    EXPECT_EQ(bytes[1], 0x4EU);
    EXPECT_EQ(bytes[2], 0x43U);
    EXPECT_EQ(bytes[3], 0x52U);
    EXPECT_EQ(bytes[4], 0x01U);
    EXPECT_EQ(bytes[5], 0xC0U);
    EXPECT_EQ(bytes[36], static_cast<std::uint8_t>(0xC0U + 31U));
    EXPECT_EQ(bytes[37], 0x01U);
}

TEST(Container, DecodeReturnsSaltAndPayloadView)
{
    const std::vector<std::uint8_t> payload(28U, 0x7FU);
    const auto bytes = filecrypt::core::encodeContainer(patternSalt(), payload);

    const auto decoded = filecrypt::core::decodeContainer(bytes);
    ASSERT_TRUE(std::holds_alternative<filecrypt::core::ContainerView>(decoded));
    const auto& view = std::get<filecrypt::core::ContainerView>(decoded);

    EXPECT_EQ(view.version, 1U);
    EXPECT_EQ(view.salt, patternSalt());
    ASSERT_EQ(view.payload.size(), payload.size());
    EXPECT_EQ(view.payload.data(), bytes.data() + 37);
}

TEST(Container, HeaderOnlyIsAcceptedByCodec)
{
    const auto bytes = filecrypt::core::encodeContainer(patternSalt(), {});
    const auto decoded = filecrypt::core::decodeContainer(bytes);
    ASSERT_TRUE(std::holds_alternative<filecrypt::core::ContainerView>(decoded));
    EXPECT_TRUE(std::get<filecrypt::core::ContainerView>(decoded).payload.empty());
}

TEST(Container, RejectsInputShorterThanHeader)
{
    const std::vector<std::uint8_t> empty{};
    EXPECT_EQ(codeOf(filecrypt::core::decodeContainer(empty)), ErrorCode::ContainerTooShort);

    auto bytes = filecrypt::core::encodeContainer(patternSalt(), {});
    bytes.pop_back();
    EXPECT_EQ(codeOf(filecrypt::core::decodeContainer(bytes)), ErrorCode::ContainerTooShort);
}

TEST(Container, RejectsBadMagic)
{
    auto bytes = filecrypt::core::encodeContainer(patternSalt(), std::vector<std::uint8_t>(28U, 0U));
    bytes[3] = 0x53U;
    EXPECT_EQ(codeOf(filecrypt::core::decodeContainer(bytes)), ErrorCode::BadMagic);
}

TEST(Container, RejectsUnknownVersions)
{
    auto bytes = filecrypt::core::encodeContainer(patternSalt(), std::vector<std::uint8_t>(28U, 0U));
    for (const std::uint8_t v : { std::uint8_t{ 0x00U }, std::uint8_t{ 0x02U }, std::uint8_t{ 0xFFU } })
    {
        bytes[4] = v;
        EXPECT_EQ(codeOf(filecrypt::core::decodeContainer(bytes)), ErrorCode::UnsupportedVersion);
    }
}

TEST(Container, SizesMatchFormat)
{
    EXPECT_EQ(filecrypt::core::g_containerHeaderBytes, 37U);
    EXPECT_EQ(filecrypt::core::g_containerMinBytes, 65U);
}
