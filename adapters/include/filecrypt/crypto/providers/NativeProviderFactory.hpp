#ifndef INCLUDE_FILECRYPT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_FILECRYPT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/crypto/KdfParams.hpp"
#include <memory>

namespace filecrypt::crypto::providers
{

// Monocypher Argon2id + OpenSSL AES-256-GCM. Works with any OpenSSL 3.x.
[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider> makeNativeCryptoProvider();

// Same backend with a custom Argon2id profile. Keys derived with anything other than
// g_kFormatArgon2idParams do not interoperate with other implementations; tests only.
[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider>
makeNativeCryptoProvider(const filecrypt::crypto::Argon2idParams& params);

} // namespace filecrypt::crypto::providers

#endif // INCLUDE_FILECRYPT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
