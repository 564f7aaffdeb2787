#ifndef INCLUDE_FILECRYPT_CORE_AEADCIPHER_HPP
#define INCLUDE_FILECRYPT_CORE_AEADCIPHER_HPP

#include "filecrypt/core/Container.hpp"
#include "filecrypt/core/Errors.hpp"
#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace filecrypt::core
{

// One derived key bound to a provider. The key is fixed at construction and wiped on
// destruction; every encrypt() draws a new random nonce, so a single instance may seal
// any number of files.
class AeadCipher final
{
public:
    AeadCipher(filecrypt::crypto::ICryptoProvider& crypto, filecrypt::security::SecureBuffer key) noexcept;

    AeadCipher(const AeadCipher&) = delete;
    AeadCipher& operator=(const AeadCipher&) = delete;
    AeadCipher(AeadCipher&& other) noexcept;
    AeadCipher& operator=(AeadCipher&& other) noexcept;
    ~AeadCipher() noexcept;

    // Derives the key from (password, salt) and builds a cipher around it.
    [[nodiscard]] static Result<AeadCipher> fromPassword(filecrypt::crypto::ICryptoProvider& crypto,
                                                         const filecrypt::security::SecureString& password,
                                                         const Salt& salt) noexcept;

    // Returns nonce || ciphertext || tag.
    [[nodiscard]] Result<std::vector<std::uint8_t>> encrypt(std::span<const std::uint8_t> plainText) const noexcept;

    // PayloadTooShort if `input` cannot hold a nonce, AuthenticationFailed if the tag
    // does not verify. Never returns partial plaintext.
    [[nodiscard]] Result<filecrypt::security::SecureBuffer> decrypt(std::span<const std::uint8_t> input) const noexcept;

private:
    filecrypt::crypto::ICryptoProvider* m_crypto{ nullptr };
    filecrypt::security::SecureBuffer m_key;
};

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_AEADCIPHER_HPP
