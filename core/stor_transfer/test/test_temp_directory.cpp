// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TemporaryDirectory
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace stor::transfer;
namespace fs = std::filesystem;

class TemporaryDirectoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    parent_ = test::createTempDir("stor_tmpdir_test_");
    original_cwd_ = fs::current_path();
  }

  void TearDown() override {
    fs::current_path(original_cwd_);
    fs::remove_all(parent_);
  }

  std::string parent_;
  fs::path original_cwd_;
};

TEST_F(TemporaryDirectoryTest, CreatesAndRemovesWithoutChdir) {
  fs::path created;
  {
    TemporaryDirectory dir(TempDirOptions{parent_, false, "t_"});
    created = dir.path();
    EXPECT_TRUE(fs::is_directory(created));
    EXPECT_EQ(created.parent_path(), fs::path(parent_));
    EXPECT_EQ(created.filename().string().rfind("t_", 0), 0u);
    EXPECT_EQ(fs::current_path(), original_cwd_);
  }
  EXPECT_FALSE(fs::exists(created));
}

TEST_F(TemporaryDirectoryTest, ChdirAndRestore) {
  fs::path created;
  {
    TemporaryDirectory dir(TempDirOptions{parent_, true, "t_"});
    created = dir.path();
    EXPECT_EQ(fs::canonical(fs::current_path()), fs::canonical(created));
    dir.close();
    EXPECT_TRUE(dir.closed());
  }
  EXPECT_EQ(fs::current_path(), original_cwd_);
  EXPECT_FALSE(fs::exists(created));
}

TEST_F(TemporaryDirectoryTest, UniqueNames) {
  TemporaryDirectory a(TempDirOptions{parent_, false, "t_"});
  TemporaryDirectory b(TempDirOptions{parent_, false, "t_"});
  EXPECT_NE(a.path(), b.path());
}

TEST_F(TemporaryDirectoryTest, RemovesContents) {
  fs::path created;
  {
    TemporaryDirectory dir(TempDirOptions{parent_, false, "t_"});
    created = dir.path();
    test::writeFile((created / "nested" / "file.txt").string(), "data");
  }
  EXPECT_FALSE(fs::exists(created));
}

TEST_F(TemporaryDirectoryTest, AlreadyRemovedIsNotAnError) {
  TemporaryDirectory dir(TempDirOptions{parent_, false, "t_"});
  fs::remove_all(dir.path());
  EXPECT_NO_THROW(dir.close());
  EXPECT_NO_THROW(dir.close());
}

TEST_F(TemporaryDirectoryTest, ErrorInBodyStillCleansUpWithoutChdir) {
  fs::path created;
  EXPECT_THROW(
    with_temp_directory(
      TempDirOptions{parent_, false, "t_"},
      [&created](const fs::path& path) {
        created = path;
        throw std::runtime_error("body failed");
      }
    ),
    std::runtime_error
  );
  EXPECT_FALSE(created.empty());
  EXPECT_FALSE(fs::exists(created));
}

TEST_F(TemporaryDirectoryTest, ErrorInBodyStillCleansUpWithChdir) {
  fs::path created;
  EXPECT_THROW(
    with_temp_directory(
      TempDirOptions{parent_, true, "t_"},
      [&created](const fs::path& path) {
        created = path;
        throw std::runtime_error("body failed");
      }
    ),
    std::runtime_error
  );
  EXPECT_EQ(fs::current_path(), original_cwd_);
  EXPECT_FALSE(fs::exists(created));
}

TEST_F(TemporaryDirectoryTest, RemovedEvenWhenPreviousCwdIsGone) {
  fs::path scratch = fs::path(parent_) / "scratch";
  fs::create_directory(scratch);
  fs::current_path(scratch);

  TemporaryDirectory dir(TempDirOptions{parent_, true, "t_"});
  fs::path created = dir.path();
  fs::remove(scratch);

  EXPECT_THROW(dir.close(), fs::filesystem_error);
  EXPECT_TRUE(dir.closed());
  EXPECT_FALSE(fs::exists(created));
}

TEST_F(TemporaryDirectoryTest, WithTempDirectoryReturnsBodyResult) {
  int value = with_temp_directory(TempDirOptions{parent_, false, "t_"}, [](const fs::path& path) {
    return fs::is_directory(path) ? 42 : 0;
  });
  EXPECT_EQ(value, 42);
}

TEST_F(TemporaryDirectoryTest, MissingParentThrows) {
  EXPECT_THROW(
    TemporaryDirectory(TempDirOptions{parent_ + "/does/not/exist", false, "t_"}),
    fs::filesystem_error
  );
}
