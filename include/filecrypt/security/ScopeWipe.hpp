#ifndef INCLUDE_FILECRYPT_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_FILECRYPT_SECURITY_SCOPEWIPE_HPP

#include "filecrypt/security/MemoryWiper.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include "filecrypt/security/SecureString.hpp"
#include <cstdint>
#include <span>

namespace filecrypt::security
{

// Wipes a caller-owned byte range when the guard leaves scope.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.release();
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = other.m_bytes;
            other.release();
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

} // namespace filecrypt::security

#endif // INCLUDE_FILECRYPT_SECURITY_SCOPEWIPE_HPP
