#ifndef INCLUDE_FILECRYPT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_FILECRYPT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "filecrypt/crypto/KdfParams.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace filecrypt::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

// Non-owning view used for decryption so large payloads are not copied out of the
// container buffer.
struct AeadBoxView final
{
    std::span<const std::uint8_t, g_aeadNonceBytes> nonce;
    std::span<const std::uint8_t> cipherText;
    std::span<const std::uint8_t, g_aeadTagBytes> tag;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Argon2id with the provider's parameter profile (g_kFormatArgon2idParams unless
    // the provider was built with an explicit profile).
    // Contract violations (salt size, unsafe params) throw std::invalid_argument;
    // backend failures throw std::runtime_error.
    [[nodiscard]] virtual filecrypt::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                                      std::span<const std::uint8_t> salt) const = 0;

    [[nodiscard]] virtual const Argon2idParams& kdfParams() const noexcept = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: AES-256-GCM (12-byte nonce, 16-byte tag). The nonce is drawn from the CSPRNG
    // on every call.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                              std::span<const std::byte> plainText) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<filecrypt::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBoxView& box) = 0;
};

} // namespace filecrypt::crypto

#endif // INCLUDE_FILECRYPT_CRYPTO_ICRYPTOPROVIDER_HPP
