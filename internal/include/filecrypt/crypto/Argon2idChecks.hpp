#ifndef INTERNAL_FILECRYPT_CRYPTO_ARGON2IDCHECKS_HPP
#define INTERNAL_FILECRYPT_CRYPTO_ARGON2IDCHECKS_HPP

#include "filecrypt/crypto/KdfParams.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace filecrypt::crypto::detail
{

inline void requireSaltSize(std::size_t saltBytes)
{
    if (saltBytes != g_kSaltBytes)
    {
        throw std::invalid_argument("deriveKey: invalid salt size");
    }
}

// Rejects parameter sets the backends would silently round or that would let a hostile
// caller request unbounded memory/time.
inline void requireArgon2idParamsSafe(const Argon2idParams& params)
{
    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }

    constexpr std::uint32_t parallelismCap{ 16U };
    constexpr std::uint32_t memoryKiBCap{ 1024U * 1024U };
    constexpr std::uint32_t iterationsCap{ 10U };
    if (params.parallelism > parallelismCap || params.memoryKiB > memoryKiBCap || params.iterations > iterationsCap)
    {
        throw std::invalid_argument("deriveKey: unsafe Argon2id parameters");
    }

    if (const std::uint32_t minMemoryKiB{ params.parallelism * 8U }; params.memoryKiB < minMemoryKiB)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }

    if ((params.memoryKiB % (params.parallelism * 4U)) != 0U)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }
}

} // namespace filecrypt::crypto::detail

#endif // INTERNAL_FILECRYPT_CRYPTO_ARGON2IDCHECKS_HPP
