#include "filecrypt/core/Envelope.hpp"
#include "filecrypt/core/KdfPolicy.hpp"

#include <new>
#include <utility>
#include <variant>

namespace filecrypt::core
{

[[nodiscard]] Result<std::vector<std::uint8_t>> sealEnvelope(const AeadCipher& cipher, const Salt& salt,
                                                             std::span<const std::uint8_t> plainText)
{
    auto payloadOrErr{ cipher.encrypt(plainText) };
    if (auto* err{ std::get_if<Error>(&payloadOrErr) })
    {
        return std::move(*err);
    }

    try
    {
        return encodeContainer(salt, std::get<std::vector<std::uint8_t>>(payloadOrErr));
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ErrorCode::CipherFailed, {}, "out of memory");
    }
}

[[nodiscard]] Result<filecrypt::security::SecureBuffer>
openEnvelope(filecrypt::crypto::ICryptoProvider& crypto, const filecrypt::security::SecureString& password,
             std::span<const std::uint8_t> container)
{
    const auto viewOrErr{ decodeContainer(container) };
    if (const auto* err{ std::get_if<Error>(&viewOrErr) })
    {
        return *err;
    }
    const auto& view{ std::get<ContainerView>(viewOrErr) };

    auto cipherOrErr{ AeadCipher::fromPassword(crypto, password, view.salt) };
    if (auto* err{ std::get_if<Error>(&cipherOrErr) })
    {
        return std::move(*err);
    }

    return std::get<AeadCipher>(cipherOrErr).decrypt(view.payload);
}

[[nodiscard]] Result<std::vector<std::uint8_t>> encryptBytes(filecrypt::crypto::ICryptoProvider& crypto,
                                                             const filecrypt::security::SecureString& password,
                                                             std::span<const std::uint8_t> plainText)
{
    const auto saltOrErr{ generateSalt(crypto) };
    if (const auto* err{ std::get_if<Error>(&saltOrErr) })
    {
        return *err;
    }
    const auto& salt{ std::get<Salt>(saltOrErr) };

    auto cipherOrErr{ AeadCipher::fromPassword(crypto, password, salt) };
    if (auto* err{ std::get_if<Error>(&cipherOrErr) })
    {
        return std::move(*err);
    }

    return sealEnvelope(std::get<AeadCipher>(cipherOrErr), salt, plainText);
}

[[nodiscard]] Result<filecrypt::security::SecureBuffer>
decryptBytes(filecrypt::crypto::ICryptoProvider& crypto, const filecrypt::security::SecureString& password,
             std::span<const std::uint8_t> container)
{
    return openEnvelope(crypto, password, container);
}

} // namespace filecrypt::core
