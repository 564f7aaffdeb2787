#ifndef INCLUDE_FILECRYPT_CORE_BATCHPROCESSOR_HPP
#define INCLUDE_FILECRYPT_CORE_BATCHPROCESSOR_HPP

#include "filecrypt/core/Errors.hpp"
#include "filecrypt/core/FileEnumerator.hpp"
#include "filecrypt/core/Progress.hpp"
#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace filecrypt::core
{

enum class SaltPolicy : std::uint8_t
{
    PerBatch, // one salt and one key derivation for the whole directory
    PerFile,  // fresh salt and key derivation for every file
};

struct BatchReport final
{
    std::filesystem::path outputRoot{};
    std::size_t filesProcessed{ 0U };
};

/**
 * @brief Mirrors a directory tree through encryption or decryption.
 *
 * Files are handled one at a time in enumeration order. The first failure stops the
 * batch; outputs already written stay on disk and the failure reports how many files
 * completed before it. The enumeration is taken before any output is written, so an
 * output root inside the input tree is never picked up as input.
 */
class BatchProcessor final
{
public:
    BatchProcessor(filecrypt::crypto::ICryptoProvider& crypto, const IFileEnumerator& enumerator,
                   ProgressSink progress = {});

    // Every regular file becomes "<relative path>.encrypted" under `outputRoot`.
    [[nodiscard]] BatchResult<BatchReport> encryptDirectory(const std::filesystem::path& inputRoot,
                                                            const std::filesystem::path& outputRoot,
                                                            const filecrypt::security::SecureString& password,
                                                            SaltPolicy saltPolicy = SaltPolicy::PerBatch) const;

    // Only files with a final ".encrypted" extension are considered; every key is derived
    // from the salt embedded in that file.
    [[nodiscard]] BatchResult<BatchReport> decryptDirectory(const std::filesystem::path& inputRoot,
                                                            const std::filesystem::path& outputRoot,
                                                            const filecrypt::security::SecureString& password) const;

private:
    filecrypt::crypto::ICryptoProvider* m_crypto{ nullptr };
    const IFileEnumerator* m_enumerator{ nullptr };
    ProgressSink m_progress;
};

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_BATCHPROCESSOR_HPP
