#include "filecrypt/crypto/AesGcm.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace filecrypt::crypto::detail
{
namespace
{

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// EVP lengths are int; larger buffers are fed in slices of this size.
constexpr std::size_t g_kMaxUpdateBytes{ std::size_t{ 1U } << 30U };

void requireKeySize(std::span<const std::uint8_t> key, const char* what)
{
    if (key.size() != g_aeadKeyBytes)
    {
        throw std::invalid_argument(what);
    }
}

EvpCipherCtxPtr newCipherCtx(const char* what)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error(what);
    }
    return ctx;
}

} // namespace

[[nodiscard]] AeadBox aes256GcmSeal(std::span<const std::uint8_t> key,
                                    std::span<const std::uint8_t, g_aeadNonceBytes> nonce,
                                    std::span<const std::byte> plainText)
{
    requireKeySize(key, "aeadEncrypt: key");

    AeadBox box{};
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());

    auto ctx{ newCipherCtx("aeadEncrypt: EVP_CIPHER_CTX_new failed") };
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
    {
        throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
    {
        throw std::runtime_error("aeadEncrypt: set ivlen failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
    {
        throw std::runtime_error("aeadEncrypt: set key/nonce failed");
    }

    box.cipherText.resize(plainText.size());
    const auto* in{ reinterpret_cast<const unsigned char*>(plainText.data()) };
    std::size_t written{ 0U };
    std::size_t offset{ 0U };
    while (offset < plainText.size())
    {
        const std::size_t slice{ std::min(g_kMaxUpdateBytes, plainText.size() - offset) };
        int outLen{ 0 };
        if (EVP_EncryptUpdate(ctx.get(), box.cipherText.data() + written, &outLen, in + offset,
                              static_cast<int>(slice)) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt update failed");
        }
        if (outLen < 0 || written + static_cast<std::size_t>(outLen) > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }
        written += static_cast<std::size_t>(outLen);
        offset += slice;
    }

    // GCM is a stream mode: Final emits nothing but must still be called to finish the tag.
    unsigned char finalBlock[1]{};
    int finalLen{ 0 };
    if (EVP_EncryptFinal_ex(ctx.get(), finalBlock, &finalLen) != 1 || finalLen != 0)
    {
        throw std::runtime_error("aeadEncrypt: encrypt final failed");
    }
    if (written != box.cipherText.size())
    {
        throw std::runtime_error("aeadEncrypt: invalid output length");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) != 1)
    {
        throw std::runtime_error("aeadEncrypt: get tag failed");
    }

    return box;
}

[[nodiscard]] std::optional<filecrypt::security::SecureBuffer> aes256GcmOpen(std::span<const std::uint8_t> key,
                                                                             const AeadBoxView& box)
{
    requireKeySize(key, "aeadDecrypt: key");

    auto ctx{ newCipherCtx("aeadDecrypt: EVP_CIPHER_CTX_new failed") };
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
    {
        throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
    {
        throw std::runtime_error("aeadDecrypt: set ivlen failed");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
    {
        throw std::runtime_error("aeadDecrypt: set key/nonce failed");
    }

    // Plaintext produced before the tag is checked lives only in this buffer and is wiped
    // if verification fails.
    filecrypt::security::SecureBuffer plainText{};
    plainText.resize(box.cipherText.size());

    std::size_t written{ 0U };
    std::size_t offset{ 0U };
    while (offset < box.cipherText.size())
    {
        const std::size_t slice{ std::min(g_kMaxUpdateBytes, box.cipherText.size() - offset) };
        int outLen{ 0 };
        if (EVP_DecryptUpdate(ctx.get(), plainText.data() + written, &outLen, box.cipherText.data() + offset,
                              static_cast<int>(slice)) != 1 ||
            outLen < 0 || written + static_cast<std::size_t>(outLen) > plainText.size())
        {
            filecrypt::security::secureRelease(plainText);
            return std::nullopt;
        }
        written += static_cast<std::size_t>(outLen);
        offset += slice;
    }

    std::array<std::uint8_t, g_aeadTagBytes> tagCopy{};
    std::copy(box.tag.begin(), box.tag.end(), tagCopy.begin());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) != 1)
    {
        filecrypt::security::secureRelease(plainText);
        throw std::runtime_error("aeadDecrypt: set tag failed");
    }

    unsigned char finalBlock[1]{};
    int finalLen{ 0 };
    if (EVP_DecryptFinal_ex(ctx.get(), finalBlock, &finalLen) != 1 || finalLen != 0 ||
        written != plainText.size())
    {
        filecrypt::security::secureRelease(plainText);
        return std::nullopt;
    }

    return plainText;
}

} // namespace filecrypt::crypto::detail
