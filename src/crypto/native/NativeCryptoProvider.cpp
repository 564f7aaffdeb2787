#include "filecrypt/crypto/AesGcm.hpp"
#include "filecrypt/crypto/KeyDerivation.hpp"
#include "filecrypt/crypto/providers/NativeProviderFactory.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>

namespace filecrypt::crypto::providers
{
namespace
{

class NativeCryptoProvider final : public filecrypt::crypto::ICryptoProvider
{
public:
    explicit NativeCryptoProvider(const filecrypt::crypto::Argon2idParams& params) noexcept : m_params{ params }
    {
    }

    [[nodiscard]] filecrypt::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::uint8_t> salt) const override
    {
        return filecrypt::crypto::deriveKeyArgon2id(password, salt, m_params);
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
};

} // namespace

[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return makeNativeCryptoProvider(filecrypt::crypto::g_kFormatArgon2idParams);
}

[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider>
makeNativeCryptoProvider(const filecrypt::crypto::Argon2idParams& params)
{
    return std::make_unique<NativeCryptoProvider>(params);
}

} // namespace filecrypt::crypto::providers
