#include <gtest/gtest.h>

#include <filesystem>

#include "filecrypt/core/OutputPaths.hpp"

namespace fs = std::filesystem;

TEST(OutputPaths, EncryptedNameAppendsExtension)
{
    EXPECT_EQ(filecrypt::core::encryptedName("report.txt").string(), "report.txt.encrypted");
    EXPECT_EQ(filecrypt::core::encryptedName("README").string(), "README.encrypted");
    EXPECT_EQ(filecrypt::core::encryptedName(".bashrc").string(), ".bashrc.encrypted");
    EXPECT_EQ(filecrypt::core::encryptedName(fs::path{ "a" } / "b.tar.gz").string(),
              (fs::path{ "a" } / "b.tar.gz.encrypted").string());
}

TEST(OutputPaths, DecryptedNameStripsOnlyFinalEncryptedExtension)
{
    EXPECT_EQ(filecrypt::core::decryptedName("report.txt.encrypted").string(), "report.txt");
    EXPECT_EQ(filecrypt::core::decryptedName("README.encrypted").string(), "README");
    EXPECT_EQ(filecrypt::core::decryptedName(".bashrc.encrypted").string(), ".bashrc");
    EXPECT_EQ(filecrypt::core::decryptedName("x.encrypted.encrypted").string(), "x.encrypted");
}

TEST(OutputPaths, DecryptedNameFallsBackToSuffix)
{
    EXPECT_EQ(filecrypt::core::decryptedName("blob.bin").string(), "blob.bin.decrypted");
    EXPECT_EQ(filecrypt::core::decryptedName("blob.ENCRYPTED").string(), "blob.ENCRYPTED.decrypted");
    // A dot-file has no extension.
    EXPECT_EQ(filecrypt::core::decryptedName(".encrypted").string(), ".encrypted.decrypted");
}

TEST(OutputPaths, EncryptedExtensionCheck)
{
    EXPECT_TRUE(filecrypt::core::hasEncryptedExtension("a.encrypted"));
    EXPECT_TRUE(filecrypt::core::hasEncryptedExtension(fs::path{ "dir" } / ".bashrc.encrypted"));
    EXPECT_FALSE(filecrypt::core::hasEncryptedExtension(".encrypted"));
    EXPECT_FALSE(filecrypt::core::hasEncryptedExtension("a.encrypted.bak"));
    EXPECT_FALSE(filecrypt::core::hasEncryptedExtension("a.encrypte"));
}

TEST(OutputPaths, DefaultFileOutputsLiveNextToInput)
{
    const fs::path input{ fs::path{ "docs" } / "report.txt" };
    EXPECT_EQ(filecrypt::core::defaultEncryptOutputFile(input).string(),
              (fs::path{ "docs" } / "report.txt.encrypted").string());
    EXPECT_EQ(filecrypt::core::defaultDecryptOutputFile(fs::path{ "docs" } / "report.txt.encrypted").string(),
              input.string());
}

TEST(OutputPaths, DefaultEncryptDirIgnoresTrailingSeparator)
{
    EXPECT_EQ(filecrypt::core::defaultEncryptOutputDir("photos").string(), "photos.encrypted");
    EXPECT_EQ(filecrypt::core::defaultEncryptOutputDir("photos/").string(), "photos.encrypted");
    EXPECT_EQ(filecrypt::core::defaultEncryptOutputDir("/data/photos/").string(), "/data/photos.encrypted");
}

TEST(OutputPaths, DefaultDecryptDirStripsOrSuffixes)
{
    EXPECT_EQ(filecrypt::core::defaultDecryptOutputDir("photos.encrypted").string(), "photos");
    EXPECT_EQ(filecrypt::core::defaultDecryptOutputDir("photos.encrypted/").string(), "photos");
    EXPECT_EQ(filecrypt::core::defaultDecryptOutputDir("backup").string(), "backup_decrypted");
}
