#ifndef INCLUDE_FILECRYPT_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_FILECRYPT_SECURITY_SECUREBUFFER_HPP

#include "filecrypt/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace filecrypt::security
{

using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

inline void secureWipeSize(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
}

// Wipes and frees the storage (clear() alone keeps the capacity alive).
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipeSize(b);
    SecureBuffer empty{};
    b.swap(empty);
}

} // namespace filecrypt::security

#endif // INCLUDE_FILECRYPT_SECURITY_SECUREBUFFER_HPP
