#include "filecrypt/core/FileEnumerator.hpp"

#include <algorithm>
#include <system_error>

namespace filecrypt::core
{
namespace
{

class RecursiveFileEnumerator final : public IFileEnumerator
{
public:
    [[nodiscard]] Result<std::vector<std::filesystem::path>>
    listRegularFiles(const std::filesystem::path& root) const override
    {
        std::error_code ec{};
        std::filesystem::recursive_directory_iterator it{ root, ec };
        if (ec)
        {
            return makeError(ErrorCode::IoFailed, root, "failed to open directory: " + ec.message());
        }

        std::vector<std::filesystem::path> files{};
        for (const std::filesystem::recursive_directory_iterator end{}; it != end; it.increment(ec))
        {
            if (ec)
            {
                break;
            }

            const auto status{ it->symlink_status(ec) };
            if (ec)
            {
                return makeError(ErrorCode::IoFailed, it->path(), "failed to stat: " + ec.message());
            }
            if (std::filesystem::is_regular_file(status))
            {
                files.push_back(it->path().lexically_relative(root));
            }
        }
        if (ec)
        {
            return makeError(ErrorCode::IoFailed, root, "failed to walk directory: " + ec.message());
        }

        std::sort(files.begin(), files.end());
        return files;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<IFileEnumerator> makeRecursiveFileEnumerator()
{
    return std::make_unique<RecursiveFileEnumerator>();
}

} // namespace filecrypt::core
