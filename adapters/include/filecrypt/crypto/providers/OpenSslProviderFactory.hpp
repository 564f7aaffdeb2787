#ifndef INCLUDE_FILECRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_FILECRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/crypto/KdfParams.hpp"
#include <memory>

namespace filecrypt::crypto::providers
{

// OpenSSL for everything. Argon2id needs OpenSSL >= 3.2; on older libraries
// deriveKey() throws std::runtime_error.
[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider>
makeOpenSslCryptoProvider(const filecrypt::crypto::Argon2idParams& params);

} // namespace filecrypt::crypto::providers

#endif // INCLUDE_FILECRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
