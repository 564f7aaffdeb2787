#ifndef INCLUDE_FILECRYPT_CORE_FILEIO_HPP
#define INCLUDE_FILECRYPT_CORE_FILEIO_HPP

#include "filecrypt/core/Errors.hpp"
#include "filecrypt/core/Progress.hpp"
#include "filecrypt/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <variant>

namespace filecrypt::core
{

constexpr std::size_t g_ioChunkBytes{ 64U * 1024U };

// Whole-file read in g_ioChunkBytes chunks, one Read event per chunk. The buffer wipes
// itself on release since it usually holds plaintext.
[[nodiscard]] Result<filecrypt::security::SecureBuffer> readWholeFile(const std::filesystem::path& path,
                                                                      const ProgressSink& progress = {});

// Creates missing parent directories, writes to a temporary sibling and renames it over
// `path` once every byte is flushed. On failure the temporary file is removed and `path`
// is left untouched. Nothing is fsynced, so a crash may still lose the new contents.
[[nodiscard]] Result<std::monostate> writeFileAtomic(const std::filesystem::path& path,
                                                     std::span<const std::uint8_t> data,
                                                     const ProgressSink& progress = {});

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_FILEIO_HPP
