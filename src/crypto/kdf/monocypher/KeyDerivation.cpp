#include "filecrypt/crypto/KeyDerivation.hpp"

#include "filecrypt/crypto/Argon2idChecks.hpp"
#include "filecrypt/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace filecrypt::crypto
{

[[nodiscard]] filecrypt::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                                  std::span<const std::uint8_t> salt,
                                                                  Argon2idParams params)
{
    detail::requireSaltSize(salt.size());
    detail::requireArgon2idParamsSafe(params);

    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKeyArgon2id: password too large");
    }

    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kU64WordsPerKiB))
    {
        throw std::bad_alloc{};
    }
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, filecrypt::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    filecrypt::security::SecureBuffer key{};
    key.resize(g_kDerivedKeyBytes);

    // Argon2id accepts an empty password; Monocypher still wants a valid pointer.
    constexpr std::uint8_t kEmpty{ 0U };
    const auto* passPtr{ password.empty() ? &kEmpty : reinterpret_cast<const std::uint8_t*>(password.data()) };

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = passPtr,
                                       .salt = salt.data(),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return key;
}

[[nodiscard]] filecrypt::security::SecureBuffer deriveKeyArgon2idFormat(std::span<const std::byte> password,
                                                                        std::span<const std::uint8_t> salt)
{
    return deriveKeyArgon2id(password, salt, g_kFormatArgon2idParams);
}

} // namespace filecrypt::crypto
