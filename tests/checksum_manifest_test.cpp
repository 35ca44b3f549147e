#include "lib/checksum_manifest.hpp"
#include "lib/errors.hpp"
#include "test_helpers.hpp"
#include <algorithm>

namespace fs = std::filesystem;

static const std::string MD5_HI = "49f68a5c8493ec2c0bf489821c21fc3b";
static const std::string MD5_BYE = "bfa99df33b137bc8fb5f5407d7e58da8";
static const std::string MD5_EMPTY = "d41d8cd98f00b204e9800998ecf8427e";

class ChecksumManifestTest : public TestHelpers::ScratchTest {
protected:
    fs::path tree;
    
    void SetUp() override {
        ScratchTest::SetUp();
        tree = dir() / "tree";
        TestHelpers::writeText(tree / "a.txt", "hi");
        TestHelpers::writeText(tree / "b" / "c.txt", "bye");
    }
};

TEST_F(ChecksumManifestTest, Md5OfKnownContent) {
    TestHelpers::writeText(dir() / "empty", "");
    
    EXPECT_EQ(ChecksumManifest::md5Hex(tree / "a.txt"), MD5_HI);
    EXPECT_EQ(ChecksumManifest::md5Hex(dir() / "empty"), MD5_EMPTY);
    EXPECT_THROW(ChecksumManifest::md5Hex(dir() / "absent"), FilesystemError);
}

TEST_F(ChecksumManifestTest, RegenerateTwoFileTree) {
    ChecksumManifest::regenerate(tree.string());
    
    EXPECT_EQ(TestHelpers::readText(tree / "md5sum.txt"),
              MD5_HI + "  a.txt\n" + MD5_BYE + "  b/c.txt\n");
    EXPECT_EQ(TestHelpers::modeOf(tree / "md5sum.txt"), 0444u);
    EXPECT_EQ(TestHelpers::modeOf(tree), 0555u);
}

TEST_F(ChecksumManifestTest, RegenerateReplacesReadOnlyManifest) {
    TestHelpers::writeText(tree / "md5sum.txt", "stale\n");
    fs::permissions(tree / "md5sum.txt", static_cast<fs::perms>(0444), fs::perm_options::replace);
    fs::permissions(tree, static_cast<fs::perms>(0555), fs::perm_options::replace);
    
    ChecksumManifest::regenerate(tree.string());
    
    std::string manifest = TestHelpers::readText(tree / "md5sum.txt");
    EXPECT_EQ(manifest, MD5_HI + "  a.txt\n" + MD5_BYE + "  b/c.txt\n");
    EXPECT_FALSE(fs::exists(tree / ".md5sum.txt.partial"));
}

TEST_F(ChecksumManifestTest, FailedWriteKeepsManifestReadOnly) {
    TestHelpers::writeText(tree / "md5sum.txt", "stale\n");
    fs::permissions(tree / "md5sum.txt", static_cast<fs::perms>(0444), fs::perm_options::replace);
    // a directory in the way of the temporary manifest makes the write fail
    fs::create_directories(tree / ".md5sum.txt.partial");
    
    EXPECT_THROW(ChecksumManifest::regenerate(tree.string()), FilesystemError);
    
    EXPECT_EQ(TestHelpers::readText(tree / "md5sum.txt"), "stale\n");
    EXPECT_EQ(TestHelpers::modeOf(tree / "md5sum.txt"), 0444u);
    EXPECT_EQ(TestHelpers::modeOf(tree), 0555u);
}

TEST_F(ChecksumManifestTest, SkipsSymlinks) {
    fs::create_symlink(tree / "a.txt", tree / "link.txt");
    fs::create_symlink(tree / "b", tree / "linked-dir");
    
    std::vector<fs::path> files = ChecksumManifest::findAllFilesUnder(tree);
    std::vector<std::string> names;
    for (const auto& file : files) {
        names.push_back(file.lexically_relative(tree).generic_string());
    }
    std::sort(names.begin(), names.end());
    
    EXPECT_EQ(names, (std::vector<std::string>{"a.txt", "b/c.txt"}));
}

TEST_F(ChecksumManifestTest, EntriesAreSortedAndExcludeManifest) {
    TestHelpers::writeText(tree / "md5sum.txt", "old");
    TestHelpers::writeText(tree / "0first", "");
    TestHelpers::writeText(tree / "b" / "md5sum.txt", "nested manifests are content");
    
    std::vector<ChecksumManifest::Entry> entries = ChecksumManifest::buildEntries(tree);
    
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].path, "0first");
    EXPECT_EQ(entries[0].digest, MD5_EMPTY);
    EXPECT_EQ(entries[1].path, "a.txt");
    EXPECT_EQ(entries[2].path, "b/c.txt");
    EXPECT_EQ(entries[3].path, "b/md5sum.txt");
}

TEST_F(ChecksumManifestTest, MissingTree) {
    EXPECT_THROW(ChecksumManifest::regenerate((dir() / "none").string()), NotADirectoryError);
}

TEST_F(ChecksumManifestTest, VerifyCleanTree) {
    ChecksumManifest::regenerate(tree.string());
    
    ChecksumManifest::VerifyReport report = ChecksumManifest::verify(tree.string());
    
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.checked, 2u);
    EXPECT_TRUE(report.unlisted.empty());
}

TEST_F(ChecksumManifestTest, VerifyReportsChanges) {
    ChecksumManifest::regenerate(tree.string());
    fs::permissions(tree, static_cast<fs::perms>(0755), fs::perm_options::replace);
    TestHelpers::writeText(tree / "a.txt", "changed");
    fs::remove(tree / "b" / "c.txt");
    TestHelpers::writeText(tree / "new.txt", "new");
    
    ChecksumManifest::VerifyReport report = ChecksumManifest::verify(tree.string());
    
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.mismatched, std::vector<std::string>{"a.txt"});
    EXPECT_EQ(report.missing, std::vector<std::string>{"b/c.txt"});
    EXPECT_EQ(report.unlisted, std::vector<std::string>{"new.txt"});
}

TEST_F(ChecksumManifestTest, ParseRejectsMalformedLines) {
    TestHelpers::writeText(dir() / "bad1.txt", "abc  a.txt\n");
    TestHelpers::writeText(dir() / "bad2.txt", MD5_HI + " a.txt\n");
    TestHelpers::writeText(dir() / "bad3.txt", "ZZ" + MD5_HI.substr(2) + "  a.txt\n");
    
    EXPECT_THROW(ChecksumManifest::parse((dir() / "bad1.txt").string()), InvalidFormatError);
    EXPECT_THROW(ChecksumManifest::parse((dir() / "bad2.txt").string()), InvalidFormatError);
    EXPECT_THROW(ChecksumManifest::parse((dir() / "bad3.txt").string()), InvalidFormatError);
}

TEST_F(ChecksumManifestTest, ParseKeepsSpacesInPaths) {
    TestHelpers::writeText(dir() / "m.txt", MD5_HI + "  dir/with space.txt\n\n");
    
    std::vector<ChecksumManifest::Entry> entries = ChecksumManifest::parse((dir() / "m.txt").string());
    
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].digest, MD5_HI);
    EXPECT_EQ(entries[0].path, "dir/with space.txt");
}
