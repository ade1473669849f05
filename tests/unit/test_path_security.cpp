#include <gtest/gtest.h>
#include "fsgate/path_security.hpp"
#include "fsgate/error.hpp"
#include "test_fixtures.hpp"
#include <filesystem>

using namespace fsgate;
using fsgate::testing::TempDir;
using fsgate::testing::make_config;

namespace fs = std::filesystem;

class PathSecurityTest : public ::testing::Test {
protected:
    TempDir outer;
    std::string allowed = outer.mkdir("allowed");
    std::string sibling = outer.mkdir("allowed-2");
};

TEST_F(PathSecurityTest, RootItselfAllowed) {
    auto cfg = make_config(allowed);
    PathSecurityPolicy policy(cfg);
    EXPECT_TRUE(policy.is_allowed(allowed));
}

TEST_F(PathSecurityTest, DescendantsAllowedEvenIfMissing) {
    auto cfg = make_config(allowed);
    PathSecurityPolicy policy(cfg);
    outer.write("allowed/a.txt", "x");
    EXPECT_TRUE(policy.is_allowed(allowed + "/a.txt"));
    EXPECT_TRUE(policy.is_allowed(allowed + "/not/yet/created.txt"));
}

TEST_F(PathSecurityTest, SiblingWithSharedPrefixDenied) {
    auto cfg = make_config(allowed);
    PathSecurityPolicy policy(cfg);
    EXPECT_FALSE(policy.is_allowed(sibling));
    EXPECT_FALSE(policy.is_allowed(sibling + "/file.txt"));
}

TEST_F(PathSecurityTest, OutsideDenied) {
    auto cfg = make_config(allowed);
    PathSecurityPolicy policy(cfg);
    EXPECT_FALSE(policy.is_allowed(outer.path()));
    EXPECT_FALSE(policy.is_allowed("/etc/passwd"));
    EXPECT_FALSE(policy.is_allowed(""));
}

TEST_F(PathSecurityTest, CheckThrowsNamingPath) {
    auto cfg = make_config(allowed);
    PathSecurityPolicy policy(cfg);
    try {
        policy.check("/etc/passwd", "readFile");
        FAIL() << "expected SecurityError";
    } catch (const SecurityError& e) {
        EXPECT_NE(std::string(e.what()).find("/etc/passwd"), std::string::npos);
    }
    EXPECT_NO_THROW(policy.check(allowed + "/x", "readFile"));
}

TEST_F(PathSecurityTest, ReservedDeviceNamesDenied) {
    auto cfg = make_config(allowed);
    PathSecurityPolicy policy(cfg);
    EXPECT_FALSE(policy.is_allowed(allowed + "/CON"));
    EXPECT_FALSE(policy.is_allowed(allowed + "/nul.txt"));
    EXPECT_FALSE(policy.is_allowed(allowed + "/com1/file"));
    EXPECT_TRUE(policy.is_allowed(allowed + "/console.txt"));
}

TEST(PathSecurityStatic, ReservedNames) {
    EXPECT_TRUE(PathSecurityPolicy::is_reserved_name("CON"));
    EXPECT_TRUE(PathSecurityPolicy::is_reserved_name("aux"));
    EXPECT_TRUE(PathSecurityPolicy::is_reserved_name("Lpt9.log"));
    EXPECT_FALSE(PathSecurityPolicy::is_reserved_name("COM10"));
    EXPECT_FALSE(PathSecurityPolicy::is_reserved_name("CONFIG"));
    EXPECT_FALSE(PathSecurityPolicy::is_reserved_name("readme.md"));
}

TEST(PathSecurityStatic, WithinComparesWholeSegments) {
    EXPECT_TRUE(PathSecurityPolicy::is_within("/a/b/c", "/a/b"));
    EXPECT_TRUE(PathSecurityPolicy::is_within("/a/b", "/a/b"));
    EXPECT_FALSE(PathSecurityPolicy::is_within("/a/bc", "/a/b"));
    EXPECT_FALSE(PathSecurityPolicy::is_within("/a", "/a/b"));
}

TEST_F(PathSecurityTest, SymlinkDeniedWhenDisallowed) {
    outer.write("secret.txt", "s");
    fs::create_symlink(outer.path("secret.txt"), allowed + "/link.txt");
    outer.write("allowed/real.txt", "r");
    fs::create_symlink(allowed + "/real.txt", allowed + "/inner-link.txt");

    auto cfg = make_config(allowed);
    PathSecurityPolicy policy(cfg);
    EXPECT_FALSE(policy.is_allowed(allowed + "/link.txt"));
    EXPECT_FALSE(policy.is_allowed(allowed + "/inner-link.txt"));
}

TEST_F(PathSecurityTest, SymlinkAllowedOnlyWhenTargetInside) {
    outer.write("secret.txt", "s");
    fs::create_symlink(outer.path("secret.txt"), allowed + "/link.txt");
    outer.write("allowed/real.txt", "r");
    fs::create_symlink(allowed + "/real.txt", allowed + "/inner-link.txt");

    auto cfg = make_config(allowed);
    cfg.symlinks_allowed = true;
    PathSecurityPolicy policy(cfg);
    EXPECT_TRUE(policy.is_allowed(allowed + "/inner-link.txt"));
    EXPECT_FALSE(policy.is_allowed(allowed + "/link.txt"));
}

TEST_F(PathSecurityTest, SymlinkedDirectoryCannotEscape) {
    fs::create_directory_symlink(outer.path(), allowed + "/up");
    auto cfg = make_config(allowed);
    cfg.symlinks_allowed = true;
    PathSecurityPolicy policy(cfg);
    EXPECT_FALSE(policy.is_allowed(allowed + "/up/allowed-2/x"));
}

TEST_F(PathSecurityTest, RequireWrite) {
    auto ro = make_config(allowed, false);
    PathSecurityPolicy read_only(ro);
    EXPECT_THROW(read_only.require_write("writeFile", allowed + "/a"), SecurityError);

    auto rw = make_config(allowed, true);
    PathSecurityPolicy writable(rw);
    EXPECT_NO_THROW(writable.require_write("writeFile", allowed + "/a"));
}

TEST_F(PathSecurityTest, MultipleRoots) {
    ServerConfig cfg;
    cfg.allowed_directories = {allowed, sibling};
    cfg.path_style = PathStyle::Posix;
    ConfigLoader::finalize(cfg);
    PathSecurityPolicy policy(cfg);
    EXPECT_TRUE(policy.is_allowed(allowed + "/a"));
    EXPECT_TRUE(policy.is_allowed(sibling + "/b"));
    EXPECT_FALSE(policy.is_allowed(outer.path("third")));
    EXPECT_EQ(policy.allowed_directories().size(), 2u);
}
