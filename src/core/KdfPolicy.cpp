#include "filecrypt/core/KdfPolicy.hpp"

#include <exception>
#include <new>
#include <span>

namespace filecrypt::core
{

[[nodiscard]] Result<Salt> generateSalt(filecrypt::crypto::ICryptoProvider& crypto) noexcept
{
    Salt salt{};
    if (!crypto.randomBytes(std::span<std::uint8_t>{ salt }))
    {
        return makeError(ErrorCode::RandomFailed);
    }
    return salt;
}

[[nodiscard]] Result<filecrypt::security::SecureBuffer> deriveKey(const filecrypt::crypto::ICryptoProvider& crypto,
                                                                  const filecrypt::security::SecureString& password,
                                                                  const Salt& salt) noexcept
{
    try
    {
        auto key{ crypto.deriveKey(filecrypt::security::asBytes(password), std::span<const std::uint8_t>{ salt }) };
        if (key.size() != filecrypt::crypto::g_kDerivedKeyBytes)
        {
            filecrypt::security::secureRelease(key);
            return makeError(ErrorCode::KeyDerivationFailed, {}, "unexpected key size");
        }
        return key;
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ErrorCode::KeyDerivationFailed, {}, "out of memory");
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::KeyDerivationFailed, {}, e.what());
    }
}

} // namespace filecrypt::core
