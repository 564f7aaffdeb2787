#include "filecrypt/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace filecrypt::security
{

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* cursor{ out.data() };
    std::size_t remaining{ out.size() };

#if defined(_WIN32)
    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (remaining > 0U)
    {
        const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };
        const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(cursor), static_cast<ULONG>(chunk),
                                               BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }
        remaining -= chunk;
        cursor += chunk;
    }
#else
    while (remaining > 0U)
    {
        const ssize_t received{ ::getrandom(cursor, remaining, 0) };
        if (received < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }

        const auto count{ static_cast<std::size_t>(received) };
        if (count == 0U || count > remaining)
        {
            return false;
        }
        remaining -= count;
        cursor += count;
    }
#endif

    return true;
}

} // namespace filecrypt::security
