#ifndef INCLUDE_FILECRYPT_CORE_CONTAINER_HPP
#define INCLUDE_FILECRYPT_CORE_CONTAINER_HPP

#include "filecrypt/core/Errors.hpp"
#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace filecrypt::core
{

//  offset  size  field
//  0       4     magic "ENCR"
//  4       1     version
//  5       32    salt
//  37      ...   payload (nonce(12) || ciphertext || tag(16))
constexpr std::array<std::uint8_t, 4> g_containerMagic{ 0x45U, 0x4EU, 0x43U, 0x52U };
constexpr std::uint8_t g_containerVersionV1{ 1U };
constexpr std::uint8_t g_containerVersionCurrent{ g_containerVersionV1 };

constexpr std::size_t g_containerVersionOffset{ g_containerMagic.size() };
constexpr std::size_t g_containerSaltOffset{ g_containerVersionOffset + 1U };
constexpr std::size_t g_containerHeaderBytes{ g_containerSaltOffset + filecrypt::crypto::g_kSaltBytes };

// Smallest well-formed container (empty plaintext). decodeContainer only enforces the
// header size; the AEAD layer rejects anything shorter than this.
constexpr std::size_t g_containerMinBytes{ g_containerHeaderBytes + filecrypt::crypto::g_aeadNonceBytes +
                                           filecrypt::crypto::g_aeadTagBytes };

using Salt = std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes>;

struct ContainerView final
{
    std::uint8_t version{ g_containerVersionCurrent };
    Salt salt{};
    // Points into the decoded buffer; valid only as long as that buffer.
    std::span<const std::uint8_t> payload;
};

[[nodiscard]] std::vector<std::uint8_t> encodeContainer(const Salt& salt, std::span<const std::uint8_t> payload);

// Structural parsing only; no cryptographic validation.
[[nodiscard]] Result<ContainerView> decodeContainer(std::span<const std::uint8_t> bytes) noexcept;

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_CONTAINER_HPP
