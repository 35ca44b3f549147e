#include "lib/path_guard.hpp"
#include "lib/errors.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using PathGuard::Requirement;
using TestHelpers::ScopedEnv;

class PathGuardTest : public TestHelpers::ScratchTest {};

TEST_F(PathGuardTest, ExpandsHomePrefix) {
    ScopedEnv home("HOME", "/home/builder");
    
    EXPECT_EQ(PathGuard::expandHome("~"), fs::path("/home/builder"));
    EXPECT_EQ(PathGuard::expandHome("~/isos/a.iso"), fs::path("/home/builder/isos/a.iso"));
    EXPECT_EQ(PathGuard::expandHome("~other/a.iso"), fs::path("~other/a.iso"));
    EXPECT_EQ(PathGuard::expandHome("a/~/b"), fs::path("a/~/b"));
}

TEST_F(PathGuardTest, ResolveNormalizes) {
    EXPECT_EQ(PathGuard::resolve("/srv/./images/../iso/"), fs::path("/srv/iso"));
    EXPECT_TRUE(PathGuard::resolve("relative.iso").is_absolute());
    EXPECT_THROW(PathGuard::resolve(""), NotFoundError);
}

TEST_F(PathGuardTest, ExistingFile) {
    TestHelpers::writeText(dir() / "a.iso", "x");
    
    EXPECT_EQ(PathGuard::require((dir() / "a.iso").string(), Requirement::EXISTING_FILE), dir() / "a.iso");
    EXPECT_THROW(PathGuard::require((dir() / "b.iso").string(), Requirement::EXISTING_FILE), NotFoundError);
    EXPECT_THROW(PathGuard::require(dir().string(), Requirement::EXISTING_FILE), NotFoundError);
}

TEST_F(PathGuardTest, ExistingDirectory) {
    TestHelpers::writeText(dir() / "file", "x");
    
    EXPECT_NO_THROW(PathGuard::require(dir().string(), Requirement::EXISTING_DIRECTORY));
    EXPECT_THROW(PathGuard::require((dir() / "missing").string(), Requirement::EXISTING_DIRECTORY),
                 NotADirectoryError);
    EXPECT_THROW(PathGuard::require((dir() / "file").string(), Requirement::EXISTING_DIRECTORY),
                 NotADirectoryError);
}

TEST_F(PathGuardTest, NonExistingRejectsDanglingSymlink) {
    TestHelpers::writeText(dir() / "taken", "x");
    fs::create_symlink(dir() / "nowhere", dir() / "dangling");
    
    EXPECT_NO_THROW(PathGuard::require((dir() / "free").string(), Requirement::NON_EXISTING));
    EXPECT_THROW(PathGuard::require((dir() / "taken").string(), Requirement::NON_EXISTING), AlreadyExistsError);
    EXPECT_THROW(PathGuard::require((dir() / "dangling").string(), Requirement::NON_EXISTING), AlreadyExistsError);
}

TEST_F(PathGuardTest, ExistingParent) {
    EXPECT_NO_THROW(PathGuard::require((dir() / "out.iso").string(), Requirement::EXISTING_PARENT));
    EXPECT_THROW(PathGuard::require((dir() / "no" / "out.iso").string(), Requirement::EXISTING_PARENT),
                 NotADirectoryError);
}

TEST_F(PathGuardTest, ErrorMessageNamesPath) {
    std::string missing = (dir() / "gone.iso").string();
    try {
        PathGuard::require(missing, Requirement::EXISTING_FILE);
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(std::string(e.what()), "No such file: '" + missing + "'");
    }
}
