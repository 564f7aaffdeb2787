#ifndef INCLUDE_FILECRYPT_CORE_FILEENUMERATOR_HPP
#define INCLUDE_FILECRYPT_CORE_FILEENUMERATOR_HPP

#include "filecrypt/core/Errors.hpp"
#include <filesystem>
#include <memory>
#include <vector>

namespace filecrypt::core
{

class IFileEnumerator
{
public:
    IFileEnumerator() = default;
    virtual ~IFileEnumerator() = default;

    IFileEnumerator(const IFileEnumerator&) = delete;
    IFileEnumerator& operator=(const IFileEnumerator&) = delete;
    IFileEnumerator(IFileEnumerator&&) = delete;
    IFileEnumerator& operator=(IFileEnumerator&&) = delete;

    // Regular files below `root`, relative to it, sorted. Symlinks are neither listed
    // nor followed.
    [[nodiscard]] virtual Result<std::vector<std::filesystem::path>>
    listRegularFiles(const std::filesystem::path& root) const = 0;
};

[[nodiscard]] std::unique_ptr<IFileEnumerator> makeRecursiveFileEnumerator();

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_FILEENUMERATOR_HPP
