#ifndef INCLUDE_FILECRYPT_CORE_KDFPOLICY_HPP
#define INCLUDE_FILECRYPT_CORE_KDFPOLICY_HPP

#include "filecrypt/core/Container.hpp"
#include "filecrypt/core/Errors.hpp"
#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/SecureString.hpp"

namespace filecrypt::core
{

// Fresh salt from the provider's CSPRNG. Fails with RandomFailed.
[[nodiscard]] Result<Salt> generateSalt(filecrypt::crypto::ICryptoProvider& crypto) noexcept;

// Password + salt -> 32-byte key. Fails with KeyDerivationFailed.
[[nodiscard]] Result<filecrypt::security::SecureBuffer> deriveKey(const filecrypt::crypto::ICryptoProvider& crypto,
                                                                  const filecrypt::security::SecureString& password,
                                                                  const Salt& salt) noexcept;

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_KDFPOLICY_HPP
