#ifndef INCLUDE_FILECRYPT_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_FILECRYPT_SECURITY_SECUREEQUALS_HPP

#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace filecrypt::security
{

// Constant-time for equal sizes.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::uint8_t diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0U;
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asSpan(a), asSpan(b));
}

[[nodiscard]] inline bool secureEquals(const SecureString& a, const SecureString& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace filecrypt::security

#endif // INCLUDE_FILECRYPT_SECURITY_SECUREEQUALS_HPP
