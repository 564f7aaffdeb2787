#ifndef INCLUDE_FILECRYPT_CORE_ENVELOPE_HPP
#define INCLUDE_FILECRYPT_CORE_ENVELOPE_HPP

#include "filecrypt/core/AeadCipher.hpp"
#include "filecrypt/core/Container.hpp"
#include "filecrypt/core/Errors.hpp"
#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/SecureString.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace filecrypt::core
{

// cipher.encrypt + encodeContainer. `salt` must be the salt `cipher`'s key was derived from.
[[nodiscard]] Result<std::vector<std::uint8_t>> sealEnvelope(const AeadCipher& cipher, const Salt& salt,
                                                             std::span<const std::uint8_t> plainText);

// decodeContainer, then a key derived from the container's own salt, then decrypt.
[[nodiscard]] Result<filecrypt::security::SecureBuffer>
openEnvelope(filecrypt::crypto::ICryptoProvider& crypto, const filecrypt::security::SecureString& password,
             std::span<const std::uint8_t> container);

// Self-contained byte-level API: a fresh salt and key per call.
[[nodiscard]] Result<std::vector<std::uint8_t>> encryptBytes(filecrypt::crypto::ICryptoProvider& crypto,
                                                             const filecrypt::security::SecureString& password,
                                                             std::span<const std::uint8_t> plainText);

[[nodiscard]] Result<filecrypt::security::SecureBuffer>
decryptBytes(filecrypt::crypto::ICryptoProvider& crypto, const filecrypt::security::SecureString& password,
             std::span<const std::uint8_t> container);

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_ENVELOPE_HPP
