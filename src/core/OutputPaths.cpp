#include "filecrypt/core/OutputPaths.hpp"

namespace filecrypt::core
{
namespace
{

[[nodiscard]] std::filesystem::path withoutTrailingSeparator(const std::filesystem::path& p)
{
    std::filesystem::path out{ p };
    while (!out.has_filename() && out.has_relative_path())
    {
        out = out.parent_path();
    }
    return out;
}

} // namespace

[[nodiscard]] std::filesystem::path encryptedName(const std::filesystem::path& plainPath)
{
    std::filesystem::path out{ plainPath };
    out += g_encryptedExtension;
    return out;
}

[[nodiscard]] bool hasEncryptedExtension(const std::filesystem::path& path)
{
    return path.extension() == g_encryptedExtension;
}

[[nodiscard]] std::filesystem::path decryptedName(const std::filesystem::path& encryptedPath)
{
    std::filesystem::path out{ encryptedPath };
    if (hasEncryptedExtension(out))
    {
        out.replace_extension();
    }
    else
    {
        out += g_decryptedFallbackExtension;
    }
    return out;
}

[[nodiscard]] std::filesystem::path defaultEncryptOutputFile(const std::filesystem::path& input)
{
    return encryptedName(input);
}

[[nodiscard]] std::filesystem::path defaultDecryptOutputFile(const std::filesystem::path& input)
{
    return decryptedName(input);
}

[[nodiscard]] std::filesystem::path defaultEncryptOutputDir(const std::filesystem::path& inputDir)
{
    return encryptedName(withoutTrailingSeparator(inputDir));
}

[[nodiscard]] std::filesystem::path defaultDecryptOutputDir(const std::filesystem::path& inputDir)
{
    std::filesystem::path out{ withoutTrailingSeparator(inputDir) };
    if (hasEncryptedExtension(out))
    {
        out.replace_extension();
    }
    else
    {
        out += g_decryptedDirSuffix;
    }
    return out;
}

} // namespace filecrypt::core
