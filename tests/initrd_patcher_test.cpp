#include "lib/initrd_patcher.hpp"
#include "lib/gzip_stream.hpp"
#include "lib/process_runner.hpp"
#include "lib/errors.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using TestHelpers::ScopedEnv;

class InitrdPatcherTest : public TestHelpers::ScratchTest {
protected:
    fs::path initrdDir;
    fs::path archive;
    fs::path base;
    std::unique_ptr<ScopedEnv> cpioEnv;
    
    void SetUp() override {
        ScratchTest::SetUp();
        
        initrdDir = dir() / "tree" / "install.amd" / "gtk";
        archive = initrdDir / "initrd.gz";
        TestHelpers::writeText(dir() / "raw", "ORIGINAL\n");
        fs::create_directories(initrdDir);
        GzipStream::compressFile((dir() / "raw").string(), archive.string());
        
        // extracted images come out read-only
        fs::permissions(archive, static_cast<fs::perms>(0444), fs::perm_options::replace);
        fs::permissions(initrdDir, static_cast<fs::perms>(0555), fs::perm_options::replace);
        
        base = dir() / "files";
        TestHelpers::writeText(base / "preseed.cfg", "d-i debian-installer/locale string en_US\n");
        
        TestHelpers::writeFakeCpio(dir() / "bin" / "cpio");
        cpioEnv = std::make_unique<ScopedEnv>("INJECTISO_CPIO", (dir() / "bin" / "cpio").string());
    }
    
    void TearDown() override {
        cpioEnv.reset();
        ScratchTest::TearDown();
    }
    
    std::string archiveContent() {
        GzipStream::decompressFile(archive.string(), (dir() / "check").string());
        return TestHelpers::readText(dir() / "check");
    }
    
    size_t entriesIn(const fs::path& directory) {
        size_t count = 0;
        for (auto it = fs::directory_iterator(directory); it != fs::directory_iterator(); ++it) {
            count++;
        }
        return count;
    }
};

TEST_F(InitrdPatcherTest, BuildsCpioAppendCommand) {
    std::vector<std::string> expected = {(dir() / "bin" / "cpio").string(), 
                                         "-H", "newc", "-o", "-A", "-F", "/tmp/raw"};
    EXPECT_EQ(InitrdPatcher::buildArguments("/tmp/raw"), expected);
}

TEST_F(InitrdPatcherTest, AppendsRelativeEntry) {
    InitrdPatcher::appendFile(archive.string(), base.string(), "preseed.cfg");
    
    EXPECT_EQ(archiveContent(), 
              "ORIGINAL\nENTRY preseed.cfg\nd-i debian-installer/locale string en_US\n");
    EXPECT_EQ(TestHelpers::modeOf(archive), 0444u);
    EXPECT_EQ(TestHelpers::modeOf(initrdDir), 0555u);
    EXPECT_EQ(entriesIn(initrdDir), 1u);
}

TEST_F(InitrdPatcherTest, AppendsNestedEntry) {
    TestHelpers::writeText(base / "usr" / "share" / "graphics" / "logo.png", "PNG");
    
    InitrdPatcher::appendFile(archive.string(), base.string(), "usr/share/graphics/logo.png");
    
    EXPECT_EQ(archiveContent(), "ORIGINAL\nENTRY usr/share/graphics/logo.png\nPNG");
}

TEST_F(InitrdPatcherTest, AbsoluteModeNamesFullPath) {
    InitrdPatcher::appendFile(archive.string(), base.string(), "preseed.cfg",
                              InitrdPatcher::PatchMode::ABSOLUTE_PATH);
    
    std::string content = archiveContent();
    EXPECT_NE(content.find("ENTRY " + (base / "preseed.cfg").string() + "\n"), std::string::npos);
}

TEST_F(InitrdPatcherTest, AppendsTwice) {
    TestHelpers::writeText(base / "second.cfg", "2\n");
    
    InitrdPatcher::appendFile(archive.string(), base.string(), "preseed.cfg");
    InitrdPatcher::appendFile(archive.string(), base.string(), "second.cfg");
    
    std::string content = archiveContent();
    EXPECT_NE(content.find("ENTRY preseed.cfg"), std::string::npos);
    EXPECT_NE(content.find("ENTRY second.cfg\n2\n"), std::string::npos);
}

TEST_F(InitrdPatcherTest, WrongArchiveNameFailsBeforeAnyIO) {
    EXPECT_THROW(InitrdPatcher::appendFile((dir() / "nowhere" / "initrd.img").string(), 
                                           (dir() / "nowhere").string(), "x"),
                 InvalidFormatError);
}

TEST_F(InitrdPatcherTest, MissingInputs) {
    EXPECT_THROW(InitrdPatcher::appendFile((dir() / "other" / "initrd.gz").string(), base.string(), "preseed.cfg"),
                 NotFoundError);
    EXPECT_THROW(InitrdPatcher::appendFile(archive.string(), (dir() / "nofiles").string(), "preseed.cfg"),
                 NotADirectoryError);
    EXPECT_THROW(InitrdPatcher::appendFile(archive.string(), base.string(), "absent.cfg"),
                 NotFoundError);
}

TEST_F(InitrdPatcherTest, RejectsAbsoluteRelativePath) {
    EXPECT_THROW(InitrdPatcher::appendFile(archive.string(), base.string(), 
                                           (base / "preseed.cfg").string()),
                 InvalidArgumentError);
}

TEST_F(InitrdPatcherTest, RejectsNonGzipArchive) {
    fs::path plainDir = dir() / "plain";
    TestHelpers::writeText(plainDir / "initrd.gz", "not compressed");
    
    EXPECT_THROW(InitrdPatcher::appendFile((plainDir / "initrd.gz").string(), base.string(), "preseed.cfg"),
                 InvalidFormatError);
}

TEST_F(InitrdPatcherTest, FailedCpioKeepsOriginal) {
    std::string before = TestHelpers::readText(archive);
    TestHelpers::writeFailingTool(dir() / "bin" / "broken-cpio", 3);
    ScopedEnv env("INJECTISO_CPIO", (dir() / "bin" / "broken-cpio").string());
    
    try {
        InitrdPatcher::appendFile(archive.string(), base.string(), "preseed.cfg");
        FAIL() << "expected ProcessError";
    } catch (const ProcessError& e) {
        EXPECT_EQ(e.getStatus(), 3);
    }
    
    EXPECT_EQ(TestHelpers::readText(archive), before);
    EXPECT_EQ(TestHelpers::modeOf(archive), 0444u);
    EXPECT_EQ(TestHelpers::modeOf(initrdDir), 0555u);
    EXPECT_EQ(entriesIn(initrdDir), 1u);
}

TEST_F(InitrdPatcherTest, RealCpioAppendsNewcEntry) {
    ScopedEnv env("INJECTISO_CPIO", "");
    if (!ProcessRunner::isAvailable("cpio")) {
        GTEST_SKIP() << "cpio not installed";
    }
    
    fs::path seed = dir() / "seed";
    TestHelpers::writeText(seed / "init", "#!/bin/sh\n");
    ProcessRunner::Command pack;
    pack.argv = {"/bin/sh", "-c", "echo init | cpio -H newc -o > ../raw.cpio 2>/dev/null"};
    pack.workingDirectory = seed.string();
    ASSERT_EQ(ProcessRunner::run(pack).exitStatus, 0);
    
    fs::path realDir = dir() / "real";
    fs::create_directories(realDir);
    GzipStream::compressFile((dir() / "raw.cpio").string(), (realDir / "initrd.gz").string());
    
    InitrdPatcher::appendFile((realDir / "initrd.gz").string(), base.string(), "preseed.cfg");
    
    GzipStream::decompressFile((realDir / "initrd.gz").string(), (dir() / "result.cpio").string());
    std::string content = TestHelpers::readText(dir() / "result.cpio");
    EXPECT_NE(content.find("init"), std::string::npos);
    EXPECT_NE(content.find("preseed.cfg"), std::string::npos);
    EXPECT_NE(content.find("d-i debian-installer/locale"), std::string::npos);
    EXPECT_NE(content.find("TRAILER!!!"), std::string::npos);
}
