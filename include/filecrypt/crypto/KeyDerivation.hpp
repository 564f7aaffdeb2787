#ifndef INCLUDE_FILECRYPT_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_FILECRYPT_CRYPTO_KEYDERIVATION_HPP

#include "filecrypt/crypto/KdfParams.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace filecrypt::crypto
{

// Argon2id (Monocypher backend). Throws std::invalid_argument on a wrong salt size or
// unsafe parameters, std::bad_alloc if the work area cannot be allocated.
[[nodiscard]] filecrypt::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                                  std::span<const std::uint8_t> salt,
                                                                  Argon2idParams params);

[[nodiscard]] filecrypt::security::SecureBuffer deriveKeyArgon2idFormat(std::span<const std::byte> password,
                                                                        std::span<const std::uint8_t> salt);

} // namespace filecrypt::crypto

#endif // INCLUDE_FILECRYPT_CRYPTO_KEYDERIVATION_HPP
