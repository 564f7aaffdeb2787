#ifndef INCLUDE_FILECRYPT_CORE_FILESERVICE_HPP
#define INCLUDE_FILECRYPT_CORE_FILESERVICE_HPP

#include "filecrypt/core/Errors.hpp"
#include "filecrypt/core/Progress.hpp"
#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/security/SecureString.hpp"
#include <filesystem>
#include <optional>

namespace filecrypt::core
{

// Single-file operations. Without `output` the default name next to the input is used
// (see OutputPaths.hpp). Both return the path actually written.
[[nodiscard]] Result<std::filesystem::path> encryptFile(filecrypt::crypto::ICryptoProvider& crypto,
                                                        const std::filesystem::path& input,
                                                        const std::optional<std::filesystem::path>& output,
                                                        const filecrypt::security::SecureString& password,
                                                        const ProgressSink& progress = {});

[[nodiscard]] Result<std::filesystem::path> decryptFile(filecrypt::crypto::ICryptoProvider& crypto,
                                                        const std::filesystem::path& input,
                                                        const std::optional<std::filesystem::path>& output,
                                                        const filecrypt::security::SecureString& password,
                                                        const ProgressSink& progress = {});

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_FILESERVICE_HPP
