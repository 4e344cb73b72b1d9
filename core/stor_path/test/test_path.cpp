// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for path classification and the Path value type
 */

#include <gtest/gtest.h>

#include <set>
#include <sstream>
#include <stdexcept>

#include "stor_path.hpp"

using namespace stor;

// ============================================================================
// Classification
// ============================================================================

TEST(ClassifyTest, SwiftPrefix) {
  EXPECT_EQ(classify("swift://my/swift/path").kind(), PathKind::swift);
  EXPECT_EQ(classify("swift://my/swift/path", PathConvention::windows).kind(), PathKind::swift);
}

TEST(ClassifyTest, S3Prefix) {
  EXPECT_EQ(classify("s3://bucket/key").kind(), PathKind::s3);
}

TEST(ClassifyTest, PosixPath) {
  EXPECT_EQ(classify("my/posix/path", PathConvention::posix).kind(), PathKind::posix);
  EXPECT_EQ(classify("/abs/path", PathConvention::posix).kind(), PathKind::posix);
}

TEST(ClassifyTest, WindowsPathUnderWindowsConvention) {
  EXPECT_EQ(classify("C:\\my\\windows\\path", PathConvention::windows).kind(), PathKind::windows);
  EXPECT_EQ(classify("d:/data", PathConvention::windows).kind(), PathKind::windows);
  EXPECT_EQ(classify("\\\\server\\share", PathConvention::windows).kind(), PathKind::windows);
}

TEST(ClassifyTest, WindowsLookingPathUnderPosixConvention) {
  EXPECT_EQ(classify("C:\\my\\windows\\path", PathConvention::posix).kind(), PathKind::posix);
}

TEST(ClassifyTest, RelativePathUnderWindowsConventionIsPosix) {
  EXPECT_EQ(classify("relative\\dir", PathConvention::windows).kind(), PathKind::posix);
}

TEST(ClassifyTest, MalformedPrefixFallsBackToFilesystem) {
  EXPECT_EQ(classify("swift:/x", PathConvention::posix).kind(), PathKind::posix);
  EXPECT_EQ(classify("s3:x", PathConvention::posix).kind(), PathKind::posix);
  EXPECT_FALSE(is_obs_path("swift:/x"));
}

TEST(ClassifyTest, Predicates) {
  EXPECT_TRUE(is_swift_path("swift://t/c"));
  EXPECT_FALSE(is_swift_path("s3://b"));
  EXPECT_TRUE(is_s3_path("s3://b"));
  EXPECT_TRUE(is_obs_path("s3://b"));
  EXPECT_TRUE(is_obs_path("swift://t"));
  EXPECT_TRUE(is_filesystem_path("/tmp/x"));
  EXPECT_FALSE(is_filesystem_path("s3://b"));
}

TEST(ClassifyTest, KindStreaming) {
  std::ostringstream oss;
  oss << PathKind::swift << " " << PathKind::windows;
  EXPECT_EQ(oss.str(), "swift windows");
}

// ============================================================================
// Normalization
// ============================================================================

TEST(PathTest, PosixNormalization) {
  EXPECT_EQ(Path("a//b///c/", PathConvention::posix).str(), "a/b/c");
  EXPECT_EQ(Path("/", PathConvention::posix).str(), "/");
  EXPECT_EQ(Path("", PathConvention::posix).str(), ".");
  EXPECT_EQ(Path("./a/../b", PathConvention::posix).str(), "./a/../b");
}

TEST(PathTest, ObjectNormalization) {
  EXPECT_EQ(Path("s3://bucket//dir///key/").str(), "s3://bucket/dir/key");
  EXPECT_EQ(Path("swift:///tenant/c/").str(), "swift://tenant/c");
}

TEST(PathTest, WindowsNormalization) {
  Path p("C:/data//set/", PathConvention::windows);
  EXPECT_EQ(p.str(), "C:\\data\\set");
  EXPECT_EQ(Path("C:\\", PathConvention::windows).str(), "C:\\");
  EXPECT_EQ(Path("\\\\server\\\\share", PathConvention::windows).str(), "\\\\server\\share");
}

TEST(PathTest, Equality) {
  EXPECT_EQ(Path("a/b/", PathConvention::posix), Path("a//b", PathConvention::posix));
  EXPECT_NE(Path("s3://a/b"), Path("swift://a/b"));
}

TEST(PathTest, OrderingIsStrict) {
  std::set<Path> paths{Path("/b", PathConvention::posix), Path("/a", PathConvention::posix),
                       Path("/a/", PathConvention::posix)};
  EXPECT_EQ(paths.size(), 2u);
  EXPECT_EQ(paths.begin()->str(), "/a");
}

// ============================================================================
// Manipulation
// ============================================================================

TEST(PathTest, JoinKeepsKind) {
  Path base("s3://bucket/prefix");
  Path joined = base / "dir/file.txt";
  EXPECT_EQ(joined.kind(), PathKind::s3);
  EXPECT_EQ(joined.str(), "s3://bucket/prefix/dir/file.txt");

  Path win("C:\\data", PathConvention::windows);
  EXPECT_EQ((win / "sub/file").str(), "C:\\data\\sub\\file");
  EXPECT_EQ((win / "sub/file").kind(), PathKind::windows);
}

TEST(PathTest, JoinOnRoot) {
  EXPECT_EQ((Path("/", PathConvention::posix) / "etc").str(), "/etc");
  EXPECT_EQ((Path("s3://") / "bucket").str(), "s3://bucket");
  EXPECT_EQ((Path(".", PathConvention::posix) / "x").str(), "x");
  EXPECT_EQ((Path("/a", PathConvention::posix) / "").str(), "/a");
}

TEST(PathTest, ParentAndName) {
  Path p("/data/set/file.bin", PathConvention::posix);
  EXPECT_EQ(p.name(), "file.bin");
  EXPECT_EQ(p.parent().str(), "/data/set");
  EXPECT_EQ(Path("/data", PathConvention::posix).parent().str(), "/");
  EXPECT_EQ(Path("file", PathConvention::posix).parent().str(), ".");
  EXPECT_EQ(Path("file", PathConvention::posix).name(), "file");
}

TEST(PathTest, RootIsItsOwnParent) {
  Path root("/", PathConvention::posix);
  EXPECT_TRUE(root.is_root());
  EXPECT_EQ(root.parent(), root);
  EXPECT_EQ(root.name(), "");

  Path drive("C:\\", PathConvention::windows);
  EXPECT_TRUE(drive.is_root());
  EXPECT_EQ(drive.parent(), drive);
}

TEST(PathTest, ObjectParent) {
  EXPECT_EQ(Path("s3://bucket/a/b").parent().str(), "s3://bucket/a");
  EXPECT_EQ(Path("s3://bucket").parent().str(), "s3://");
  EXPECT_EQ(Path("s3://bucket").name(), "bucket");
  EXPECT_EQ(Path("s3://bucket").parent().kind(), PathKind::s3);
}

TEST(PathTest, RelativeTo) {
  Path base("/data", PathConvention::posix);
  EXPECT_EQ(Path("/data/a/b", PathConvention::posix).relative_to(base), std::string("a/b"));
  EXPECT_EQ(base.relative_to(base), std::string());
  EXPECT_FALSE(Path("/database/x", PathConvention::posix).relative_to(base).has_value());
  EXPECT_FALSE(Path("s3://data/a").relative_to(base).has_value());
  EXPECT_EQ(
    Path("x/y", PathConvention::posix).relative_to(Path(".", PathConvention::posix)),
    std::string("x/y")
  );
}

TEST(PathTest, WindowsRelativeToUsesForwardSlashes) {
  Path base("C:\\root", PathConvention::windows);
  EXPECT_EQ(
    Path("C:\\root\\a\\b", PathConvention::windows).relative_to(base), std::string("a/b")
  );
}

TEST(PathTest, ObjectLocation) {
  auto swift = Path("swift://tenant/container/dir/obj").object_location();
  EXPECT_EQ(swift.tenant, "tenant");
  EXPECT_EQ(swift.container, "container");
  EXPECT_EQ(swift.resource, "dir/obj");

  auto s3 = Path("s3://bucket/key/part").object_location();
  EXPECT_EQ(s3.tenant, "");
  EXPECT_EQ(s3.container, "bucket");
  EXPECT_EQ(s3.resource, "key/part");

  EXPECT_THROW(Path("/tmp", PathConvention::posix).object_location(), std::invalid_argument);
}
