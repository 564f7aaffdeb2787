#include "filecrypt/crypto/AesGcm.hpp"
#include "filecrypt/crypto/Argon2idChecks.hpp"
#include "filecrypt/crypto/providers/OpenSslProviderFactory.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>

namespace filecrypt::crypto::providers
{
namespace
{

// Parameter names of the ARGON2ID KDF (OpenSSL >= 3.2); spelled out so this file also
// builds against 3.0/3.1 headers, where the KDF simply is not found at runtime.
constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

EvpKdfPtr fetchArgon2idKdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr), &EVP_KDF_free };
}

class OpenSslCryptoProvider final : public filecrypt::crypto::ICryptoProvider
{
public:
    explicit OpenSslCryptoProvider(const filecrypt::crypto::Argon2idParams& params)
        : m_params{ params }, m_argon2idKdf{ fetchArgon2idKdf() }
    {
    }

    [[nodiscard]] filecrypt::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::uint8_t> salt) const override
    {
        filecrypt::crypto::detail::requireSaltSize(salt.size());
        filecrypt::crypto::detail::requireArgon2idParamsSafe(m_params);

        if (!m_argon2idKdf)
        {
            throw std::runtime_error("deriveKey: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ m_params.iterations };
        std::uint32_t memcostKiB{ m_params.memoryKiB };
        std::uint32_t lanes{ m_params.parallelism };
        std::uint32_t threads{ 1U };
        std::uint32_t version{ filecrypt::crypto::g_kArgon2VersionV13 };

        // OSSL_PARAM wants non-const pointers even for inputs; hand it private copies.
        // Never a null buffer, even for an empty password.
        filecrypt::security::SecureBuffer passwordCopy{};
        passwordCopy.resize(password.empty() ? 1U : password.size());
        if (!password.empty())
        {
            std::memcpy(passwordCopy.data(), password.data(), password.size());
        }
        std::array<std::uint8_t, filecrypt::crypto::g_kSaltBytes> saltCopy{};
        std::memcpy(saltCopy.data(), salt.data(), saltCopy.size());

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), password.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        filecrypt::security::SecureBuffer out{};
        out.resize(filecrypt::crypto::g_kDerivedKeyBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            filecrypt::security::secureRelease(out);
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] const filecrypt::crypto::Argon2idParams& kdfParams() const noexcept override
    {
        return m_params;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return filecrypt::security::secureRandomFill(out);
    }

    [[nodiscard]] filecrypt::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                         std::span<const std::byte> plainText) override
    {
        std::array<std::uint8_t, filecrypt::crypto::g_aeadNonceBytes> nonce{};
        if (!randomBytes(std::span<std::uint8_t>{ nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }
        return filecrypt::crypto::detail::aes256GcmSeal(key, nonce, plainText);
    }

    [[nodiscard]] std::optional<filecrypt::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const filecrypt::crypto::AeadBoxView& box) override
    {
        return filecrypt::crypto::detail::aes256GcmOpen(key, box);
    }

private:
    filecrypt::crypto::Argon2idParams m_params;
    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return makeOpenSslCryptoProvider(filecrypt::crypto::g_kFormatArgon2idParams);
}

[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider>
makeOpenSslCryptoProvider(const filecrypt::crypto::Argon2idParams& params)
{
    return std::make_unique<OpenSslCryptoProvider>(params);
}

} // namespace filecrypt::crypto::providers
