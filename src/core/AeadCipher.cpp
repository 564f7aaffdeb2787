#include "filecrypt/core/AeadCipher.hpp"
#include "filecrypt/core/KdfPolicy.hpp"

#include <exception>
#include <new>
#include <utility>
#include <variant>

namespace filecrypt::core
{

AeadCipher::AeadCipher(filecrypt::crypto::ICryptoProvider& crypto, filecrypt::security::SecureBuffer key) noexcept
    : m_crypto(&crypto), m_key(std::move(key))
{
}

AeadCipher::AeadCipher(AeadCipher&& other) noexcept : m_crypto(other.m_crypto), m_key{}
{
    m_key.swap(other.m_key);
    other.m_crypto = nullptr;
}

AeadCipher& AeadCipher::operator=(AeadCipher&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    filecrypt::security::secureRelease(m_key);
    m_key.swap(other.m_key);
    m_crypto = other.m_crypto;
    other.m_crypto = nullptr;
    return *this;
}

AeadCipher::~AeadCipher() noexcept
{
    filecrypt::security::secureRelease(m_key);
}

[[nodiscard]] Result<AeadCipher> AeadCipher::fromPassword(filecrypt::crypto::ICryptoProvider& crypto,
                                                          const filecrypt::security::SecureString& password,
                                                          const Salt& salt) noexcept
{
    auto keyOrErr{ deriveKey(crypto, password, salt) };
    if (auto* err{ std::get_if<Error>(&keyOrErr) })
    {
        return std::move(*err);
    }
    return AeadCipher{ crypto, std::get<filecrypt::security::SecureBuffer>(std::move(keyOrErr)) };
}

[[nodiscard]] Result<std::vector<std::uint8_t>> AeadCipher::encrypt(std::span<const std::uint8_t> plainText) const noexcept
{
    if (m_crypto == nullptr)
    {
        return makeError(ErrorCode::InvalidArgument, {}, "cipher has been moved from");
    }

    try
    {
        const auto box{ m_crypto->aeadEncrypt(filecrypt::security::asSpan(m_key), std::as_bytes(plainText)) };

        std::vector<std::uint8_t> out{};
        out.reserve(box.nonce.size() + box.cipherText.size() + box.tag.size());
        out.insert(out.end(), box.nonce.begin(), box.nonce.end());
        out.insert(out.end(), box.cipherText.begin(), box.cipherText.end());
        out.insert(out.end(), box.tag.begin(), box.tag.end());
        return out;
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ErrorCode::CipherFailed, {}, "out of memory");
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::CipherFailed, {}, e.what());
    }
}

[[nodiscard]] Result<filecrypt::security::SecureBuffer>
AeadCipher::decrypt(std::span<const std::uint8_t> input) const noexcept
{
    if (m_crypto == nullptr)
    {
        return makeError(ErrorCode::InvalidArgument, {}, "cipher has been moved from");
    }
    if (input.size() < filecrypt::crypto::g_aeadNonceBytes)
    {
        return makeError(ErrorCode::PayloadTooShort);
    }
    // A nonce without room for a tag cannot authenticate; report it like any forgery.
    if (input.size() < filecrypt::crypto::g_aeadNonceBytes + filecrypt::crypto::g_aeadTagBytes)
    {
        return makeError(ErrorCode::AuthenticationFailed);
    }

    const std::size_t cipherTextBytes{ input.size() - filecrypt::crypto::g_aeadNonceBytes -
                                       filecrypt::crypto::g_aeadTagBytes };
    const filecrypt::crypto::AeadBoxView box{
        .nonce = input.first<filecrypt::crypto::g_aeadNonceBytes>(),
        .cipherText = input.subspan(filecrypt::crypto::g_aeadNonceBytes, cipherTextBytes),
        .tag = input.last<filecrypt::crypto::g_aeadTagBytes>(),
    };

    try
    {
        auto plainOpt{ m_crypto->aeadDecrypt(filecrypt::security::asSpan(m_key), box) };
        if (!plainOpt)
        {
            return makeError(ErrorCode::AuthenticationFailed);
        }
        return std::move(*plainOpt);
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ErrorCode::CipherFailed, {}, "out of memory");
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::CipherFailed, {}, e.what());
    }
}

} // namespace filecrypt::core
