#ifndef INCLUDE_FILECRYPT_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_FILECRYPT_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace filecrypt::crypto
{

constexpr std::size_t g_kSaltBytes{ 32 };
constexpr std::size_t g_kDerivedKeyBytes{ 32 };

// Argon2 version v1.3 (0x13). Monocypher is hardcoded to this.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13 };

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

// Part of container format v1: every implementation must derive byte-identical keys
// from the same (password, salt), so these are constants and not user settings.
constexpr Argon2idParams g_kFormatArgon2idParams{ .iterations = 3U, .memoryKiB = 64U * 1024U, .parallelism = 4U };

} // namespace filecrypt::crypto

#endif // INCLUDE_FILECRYPT_CRYPTO_KDFPARAMS_HPP
