// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for S3BackendClient using GoogleMock
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>

#include "s3_backend_client.hpp"
#include "s3_mocks.hpp"
#include "stor_errors.hpp"

using namespace stor;
using namespace stor::s3;
using namespace stor::s3::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;

class S3BackendClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    mock_ = std::make_shared<MockS3Client>();
    backend_ = std::make_unique<S3BackendClient>(mock_);
  }

  static S3Listing listing(
    std::vector<std::string> keys, std::vector<std::string> prefixes = {}
  ) {
    S3Listing l;
    l.keys = std::move(keys);
    l.prefixes = std::move(prefixes);
    return l;
  }

  static S3Result not_found() {
    return S3Result::Failure("Object not found", "NoSuchKey");
  }

  std::shared_ptr<MockS3Client> mock_;
  std::unique_ptr<S3BackendClient> backend_;
};

TEST_F(S3BackendClientTest, ExistsForObject) {
  EXPECT_CALL(*mock_, headObject("bucket", "dir/file")).WillOnce(Return(S3Result::Success(4)));
  EXPECT_TRUE(backend_->exists(Path("s3://bucket/dir/file")));
}

TEST_F(S3BackendClientTest, ExistsForPrefix) {
  EXPECT_CALL(*mock_, headObject("bucket", "dir")).WillOnce(Return(not_found()));
  EXPECT_CALL(*mock_, listPrefix("bucket", "dir/", "", _, 1))
    .WillOnce(DoAll(SetArgReferee<3>(listing({"dir/a"})), Return(S3Result::Success())));
  EXPECT_TRUE(backend_->exists(Path("s3://bucket/dir")));
}

TEST_F(S3BackendClientTest, MissingPath) {
  EXPECT_CALL(*mock_, headObject("bucket", "nope")).WillOnce(Return(not_found()));
  EXPECT_CALL(*mock_, listPrefix("bucket", "nope/", "", _, 1))
    .WillOnce(Return(S3Result::Success()));
  EXPECT_FALSE(backend_->exists(Path("s3://bucket/nope")));
}

TEST_F(S3BackendClientTest, HeadFailureIsNotAbsence) {
  EXPECT_CALL(*mock_, headObject("bucket", "k"))
    .WillOnce(Return(S3Result::Failure("Service Unavailable", "ServiceUnavailable", true)));
  try {
    backend_->exists(Path("s3://bucket/k"));
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(e.code(), "ServiceUnavailable");
    EXPECT_TRUE(e.retryable());
  }

  EXPECT_CALL(*mock_, headObject("bucket", "k"))
    .WillOnce(Return(S3Result::Failure("Forbidden", "AccessDenied", false)));
  EXPECT_THROW(backend_->is_directory(Path("s3://bucket/k")), BackendError);
}

TEST_F(S3BackendClientTest, BucketRootExistence) {
  EXPECT_CALL(*mock_, listPrefix("bucket", "", "/", _, 1))
    .WillOnce(Return(S3Result::Success()))
    .WillOnce(Return(S3Result::Failure("The specified bucket does not exist", "NoSuchBucket")))
    .WillOnce(Return(S3Result::Failure("Connection reset", "NetworkingError", true)));

  EXPECT_TRUE(backend_->exists(Path("s3://bucket")));
  EXPECT_FALSE(backend_->exists(Path("s3://bucket")));
  try {
    backend_->exists(Path("s3://bucket"));
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(e.code(), "NetworkingError");
    EXPECT_TRUE(e.retryable());
    EXPECT_EQ(e.key(), "s3://bucket");
  }
}

TEST_F(S3BackendClientTest, IsDirectory) {
  EXPECT_CALL(*mock_, headObject("bucket", "file")).WillOnce(Return(S3Result::Success(4)));
  EXPECT_FALSE(backend_->is_directory(Path("s3://bucket/file")));
  EXPECT_TRUE(backend_->is_directory(Path("s3://bucket")));
}

TEST_F(S3BackendClientTest, ListChildrenSkipsMarker) {
  EXPECT_CALL(*mock_, listPrefix("bucket", "dir/", "/", _, 0))
    .WillOnce(DoAll(
      SetArgReferee<3>(listing({"dir/", "dir/a.txt"}, {"dir/sub/"})), Return(S3Result::Success())
    ));

  auto children = backend_->list_children(Path("s3://bucket/dir"));
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0].path, Path("s3://bucket/dir/a.txt"));
  EXPECT_FALSE(children[0].directory);
  EXPECT_EQ(children[1].path, Path("s3://bucket/dir/sub"));
  EXPECT_TRUE(children[1].directory);
}

TEST_F(S3BackendClientTest, ListFailureThrowsBackendError) {
  EXPECT_CALL(*mock_, listPrefix("bucket", "dir/", "/", _, 0))
    .WillOnce(Return(S3Result::Failure("Access Denied", "AccessDenied", false)));
  try {
    backend_->list_children(Path("s3://bucket/dir"));
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(e.code(), "AccessDenied");
    EXPECT_FALSE(e.retryable());
    EXPECT_EQ(e.key(), "s3://bucket/dir");
  }
}

TEST_F(S3BackendClientTest, WriteFileReportsBytes) {
  std::istringstream in("payload");
  EXPECT_CALL(*mock_, uploadStream("bucket", "k/obj", _)).WillOnce(Return(S3Result::Success(7)));
  EXPECT_EQ(backend_->write_file(Path("s3://bucket/k/obj"), in), 7u);
}

TEST_F(S3BackendClientTest, RetryableWriteFailure) {
  std::istringstream in("payload");
  EXPECT_CALL(*mock_, uploadStream("bucket", "k", _))
    .WillOnce(Return(S3Result::Failure("Please slow down", "SlowDown", true)));
  try {
    backend_->write_file(Path("s3://bucket/k"), in);
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_TRUE(e.retryable());
    EXPECT_EQ(e.code(), "SlowDown");
  }
}

TEST_F(S3BackendClientTest, ReadFile) {
  std::ostringstream out;
  EXPECT_CALL(*mock_, downloadToStream("bucket", "k", _)).WillOnce(Return(S3Result::Success(3)));
  EXPECT_EQ(backend_->read_file(Path("s3://bucket/k"), out), 3u);
}

TEST_F(S3BackendClientTest, DirectoryMarkers) {
  EXPECT_CALL(*mock_, putEmptyObject("bucket", "a/b/")).WillOnce(Return(S3Result::Success()));
  backend_->make_directory(Path("s3://bucket/a/b"));

  EXPECT_CALL(*mock_, deleteObject("bucket", "a/b/")).WillOnce(Return(S3Result::Success()));
  backend_->remove_directory(Path("s3://bucket/a/b"));
}

TEST_F(S3BackendClientTest, RemoveFile) {
  EXPECT_CALL(*mock_, deleteObject("bucket", "a/f")).WillOnce(Return(S3Result::Success()));
  backend_->remove_file(Path("s3://bucket/a/f"));
}

TEST_F(S3BackendClientTest, RejectsNonS3Paths) {
  EXPECT_THROW(backend_->exists(Path("swift://t/c/o")), std::invalid_argument);
  EXPECT_THROW(backend_->exists(Path("s3://")), std::invalid_argument);
}

TEST_F(S3BackendClientTest, Properties) {
  EXPECT_TRUE(backend_->eventually_consistent());
  EXPECT_STREQ(backend_->name(), "s3");
}
