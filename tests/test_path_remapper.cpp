#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include "dirmirror/path_remapper.h"
#include "test_util.h"

using namespace dirmirror;

namespace {
    MirrorRoots make_roots(const std::string& watch, const std::string& output) {
        MirrorRoots roots;
        roots.watch_root = watch;
        roots.output_root = output;
        return roots;
    }
}

TEST(PathRemapperTest, RemapsNestedPath) {
    auto roots = make_roots("/home/a/src", "/mnt/backup");
    auto result = remap(roots, "/home/a/src/docs/x.txt");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), "/mnt/backup/docs/x.txt");
}

TEST(PathRemapperTest, WatchRootMapsToOutputRoot) {
    auto roots = make_roots("/home/a/src", "/mnt/backup");
    auto result = remap(roots, "/home/a/src");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), "/mnt/backup");
}

TEST(PathRemapperTest, RejectsPathOutsideWatchRoot) {
    auto roots = make_roots("/home/a/src", "/mnt/backup");
    auto result = remap(roots, "/etc/passwd");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code(), ErrorCode::PathNotContained);
}

TEST(PathRemapperTest, RejectsSiblingWithSharedPrefix) {
    auto roots = make_roots("/home/a/src", "/mnt/backup");
    auto result = remap(roots, "/home/a/src2/file");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code(), ErrorCode::PathNotContained);
}

TEST(PathRemapperTest, RejectsRelativePath) {
    auto roots = make_roots("/home/a/src", "/mnt/backup");
    EXPECT_FALSE(remap(roots, "docs/x.txt").ok());
    EXPECT_FALSE(remap(roots, "").ok());
}

TEST(PathRemapperTest, FilesystemRootAsWatchRoot) {
    auto roots = make_roots("/", "/mnt/backup");
    auto result = remap(roots, "/etc/hosts");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), "/mnt/backup/etc/hosts");
}

TEST(PathRemapperTest, LinkTargetInsideWatchRootIsRemapped) {
    auto roots = make_roots("/home/a/src", "/mnt/backup");
    EXPECT_EQ(remap_link_target(roots, "/home/a/src/lib/a.so"), "/mnt/backup/lib/a.so");
}

TEST(PathRemapperTest, LinkTargetOutsideOrRelativeIsKept) {
    auto roots = make_roots("/home/a/src", "/mnt/backup");
    EXPECT_EQ(remap_link_target(roots, "/usr/lib/a.so"), "/usr/lib/a.so");
    EXPECT_EQ(remap_link_target(roots, "../lib/a.so"), "../lib/a.so");
}

TEST(PathRemapperTest, IsUnderMatchesWholeComponents) {
    EXPECT_TRUE(is_under("/a/b", "/a/b"));
    EXPECT_TRUE(is_under("/a/b", "/a/b/c"));
    EXPECT_FALSE(is_under("/a/b", "/a/bc"));
    EXPECT_FALSE(is_under("/a/b", "/a"));
    EXPECT_TRUE(is_under("/", "/anything"));
}

TEST(PathRemapperTest, CanonicalizeResolvesSymlinkedRoot) {
    test::TempDir base;
    ASSERT_EQ(::mkdir((base / "real").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir((base / "out").c_str(), 0755), 0);
    ASSERT_EQ(::symlink((base / "real").c_str(), (base / "link").c_str()), 0);

    auto roots = canonicalize_roots(base / "link/", base / "out");
    ASSERT_TRUE(roots.ok()) << roots.error().to_string();
    EXPECT_EQ(roots.value().watch_root, base / "real");
    EXPECT_EQ(roots.value().output_root, base / "out");
}

TEST(PathRemapperTest, CanonicalizeRejectsMissingOrNonDirectory) {
    test::TempDir base;
    test::write_file(base / "file", "x");
    ASSERT_EQ(::mkdir((base / "out").c_str(), 0755), 0);

    auto missing = canonicalize_roots(base / "missing", base / "out");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::SetupFailure);

    auto not_dir = canonicalize_roots(base / "out", base / "file");
    ASSERT_FALSE(not_dir.ok());
    EXPECT_EQ(not_dir.error().code(), ErrorCode::SetupFailure);
}
