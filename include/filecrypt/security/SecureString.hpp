#ifndef INCLUDE_FILECRYPT_SECURITY_SECURESTRING_HPP
#define INCLUDE_FILECRYPT_SECURITY_SECURESTRING_HPP

#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace filecrypt::security
{

// Password storage. Not NUL-terminated.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString empty{};
    s.swap(empty);
}

} // namespace filecrypt::security

#endif // INCLUDE_FILECRYPT_SECURITY_SECURESTRING_HPP
