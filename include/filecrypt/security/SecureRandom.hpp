#ifndef INCLUDE_FILECRYPT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_FILECRYPT_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace filecrypt::security
{

// Fills `out` from the operating system CSPRNG (getrandom / BCryptGenRandom).
// Returns false if the generator fails; `out` must then be treated as garbage.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace filecrypt::security

#endif // INCLUDE_FILECRYPT_SECURITY_SECURERANDOM_HPP
