#ifndef INTERNAL_FILECRYPT_CRYPTO_AESGCM_HPP
#define INTERNAL_FILECRYPT_CRYPTO_AESGCM_HPP

#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace filecrypt::crypto::detail
{

// Shared OpenSSL EVP implementation used by every provider.
// `nonce` must already hold fresh random bytes.
[[nodiscard]] AeadBox aes256GcmSeal(std::span<const std::uint8_t> key,
                                    std::span<const std::uint8_t, g_aeadNonceBytes> nonce,
                                    std::span<const std::byte> plainText);

[[nodiscard]] std::optional<filecrypt::security::SecureBuffer> aes256GcmOpen(std::span<const std::uint8_t> key,
                                                                             const AeadBoxView& box);

} // namespace filecrypt::crypto::detail

#endif // INTERNAL_FILECRYPT_CRYPTO_AESGCM_HPP
