#ifndef INCLUDE_FILECRYPT_CORE_OUTPUTPATHS_HPP
#define INCLUDE_FILECRYPT_CORE_OUTPUTPATHS_HPP

#include <filesystem>
#include <string_view>

namespace filecrypt::core
{

inline constexpr std::string_view g_encryptedExtension{ ".encrypted" };
inline constexpr std::string_view g_decryptedFallbackExtension{ ".decrypted" };
inline constexpr std::string_view g_decryptedDirSuffix{ "_decrypted" };

// "report.txt" -> "report.txt.encrypted", "README" -> "README.encrypted".
[[nodiscard]] std::filesystem::path encryptedName(const std::filesystem::path& plainPath);

// Strips a final ".encrypted" extension, otherwise appends ".decrypted".
[[nodiscard]] std::filesystem::path decryptedName(const std::filesystem::path& encryptedPath);

// True when the final extension is exactly ".encrypted" (dot-files have no extension).
[[nodiscard]] bool hasEncryptedExtension(const std::filesystem::path& path);

[[nodiscard]] std::filesystem::path defaultEncryptOutputFile(const std::filesystem::path& input);
[[nodiscard]] std::filesystem::path defaultDecryptOutputFile(const std::filesystem::path& input);

// "<dir>.encrypted"; a trailing separator on `inputDir` is ignored.
[[nodiscard]] std::filesystem::path defaultEncryptOutputDir(const std::filesystem::path& inputDir);

// "<dir>" without a trailing ".encrypted", otherwise "<dir>_decrypted".
[[nodiscard]] std::filesystem::path defaultDecryptOutputDir(const std::filesystem::path& inputDir);

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_OUTPUTPATHS_HPP
