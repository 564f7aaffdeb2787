#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "TestUtils.hpp"
#include "filecrypt/core/FileEnumerator.hpp"

namespace fs = std::filesystem;

namespace
{

std::vector<std::string> listed(const filecrypt::core::IFileEnumerator& e, const fs::path& root)
{
    const auto res = e.listRegularFiles(root);
    EXPECT_TRUE(std::holds_alternative<std::vector<fs::path>>(res));
    std::vector<std::string> out;
    if (const auto* files = std::get_if<std::vector<fs::path>>(&res))
    {
        for (const auto& f : *files)
        {
            out.push_back(f.generic_string());
        }
    }
    return out;
}

} // namespace

TEST(FileEnumerator, ListsNestedFilesSortedAndRelative)
{
    const filecrypt::test_utils::TempDirGuard dir{ filecrypt::test_utils::makeSecureTempDir("enum_") };
    ASSERT_FALSE(dir.path().empty());

    filecrypt::test_utils::writeFile(dir.path() / "b.txt", "b");
    filecrypt::test_utils::writeFile(dir.path() / "a" / "deep" / "c.bin", "c");
    filecrypt::test_utils::writeFile(dir.path() / "a" / "README", "r");
    fs::create_directories(dir.path() / "empty_dir");

    const auto enumerator = filecrypt::core::makeRecursiveFileEnumerator();
    EXPECT_EQ(listed(*enumerator, dir.path()), (std::vector<std::string>{ "a/README", "a/deep/c.bin", "b.txt" }));
}

TEST(FileEnumerator, SkipsSymlinks)
{
    const filecrypt::test_utils::TempDirGuard dir{ filecrypt::test_utils::makeSecureTempDir("enum_") };
    ASSERT_FALSE(dir.path().empty());
    const filecrypt::test_utils::TempDirGuard outside{ filecrypt::test_utils::makeSecureTempDir("enum_outside_") };
    ASSERT_FALSE(outside.path().empty());

    filecrypt::test_utils::writeFile(dir.path() / "real.txt", "r");
    filecrypt::test_utils::writeFile(outside.path() / "secret.txt", "s");

    std::error_code ec;
    fs::create_symlink(dir.path() / "real.txt", dir.path() / "link.txt", ec);
    if (ec)
    {
        GTEST_SKIP() << "symlinks not supported: " << ec.message();
    }
    fs::create_directory_symlink(outside.path(), dir.path() / "linked_dir", ec);
    ASSERT_FALSE(ec);

    const auto enumerator = filecrypt::core::makeRecursiveFileEnumerator();
    EXPECT_EQ(listed(*enumerator, dir.path()), (std::vector<std::string>{ "real.txt" }));
}

TEST(FileEnumerator, EmptyDirectoryGivesEmptyList)
{
    const filecrypt::test_utils::TempDirGuard dir{ filecrypt::test_utils::makeSecureTempDir("enum_") };
    ASSERT_FALSE(dir.path().empty());

    const auto enumerator = filecrypt::core::makeRecursiveFileEnumerator();
    EXPECT_TRUE(listed(*enumerator, dir.path()).empty());
}

TEST(FileEnumerator, MissingRootIsIoError)
{
    const auto enumerator = filecrypt::core::makeRecursiveFileEnumerator();
    const auto res = enumerator->listRegularFiles(fs::path{ "/nonexistent/filecrypt/root" });
    ASSERT_TRUE(std::holds_alternative<filecrypt::core::Error>(res));
    EXPECT_EQ(std::get<filecrypt::core::Error>(res).code, filecrypt::core::ErrorCode::IoFailed);
}
