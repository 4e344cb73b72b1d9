// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_S3_CLIENT_HPP
#define STOR_S3_CLIENT_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace stor {
namespace s3 {

/**
 * S3 configuration options
 */
struct S3Config {
  std::string endpoint_url;  // e.g. "https://play.min.io"; empty for AWS S3
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  // TransferManager uses multipart above part_size
  uint64_t part_size = 64 * 1024 * 1024;  // 5MB..5GB
  int executor_thread_count = 4;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;

  // SDK-internal retries; the transfer engine re-queues retryable errors itself
  int max_sdk_retries = 0;
};

/**
 * Result of an S3 operation
 */
struct S3Result {
  bool success;
  uint64_t bytes;             // Bytes moved by upload/download
  std::string error_message;  // Error message if failed
  std::string error_code;     // Error code for classification
  bool is_retryable;          // True for transient errors

  static S3Result Success(uint64_t bytes = 0) {
    return {true, bytes, "", "", false};
  }

  static S3Result Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    return {false, 0, message, code, retryable};
  }
};

/**
 * One page-merged listing under a prefix
 */
struct S3Listing {
  std::vector<std::string> keys;      // Object keys directly under the prefix
  std::vector<std::string> prefixes;  // Common prefixes, each ending in the delimiter
};

/**
 * Object operations used by S3BackendClient. Separated from S3Client so the
 * backend mapping can be tested without a server.
 */
class IS3Client {
public:
  virtual ~IS3Client() = default;

  virtual S3Result uploadStream(
    const std::string& bucket, const std::string& key, std::istream& in
  ) = 0;
  virtual S3Result downloadToStream(
    const std::string& bucket, const std::string& key, std::ostream& out
  ) = 0;

  /**
   * HeadObject. A missing object fails with error_code "NoSuchKey"; any
   * other failure is a real error.
   */
  virtual S3Result headObject(const std::string& bucket, const std::string& key) = 0;

  /**
   * @param max_keys Stop after the first page holding this many entries (0 = all)
   */
  virtual S3Result listPrefix(
    const std::string& bucket, const std::string& prefix, const std::string& delimiter,
    S3Listing& listing, int max_keys = 0
  ) = 0;
  virtual S3Result deleteObject(const std::string& bucket, const std::string& key) = 0;

  /// Zero-byte object, used for "<dir>/" markers
  virtual S3Result putEmptyObject(const std::string& bucket, const std::string& key) = 0;
};

/**
 * S3 client wrapper around AWS SDK for C++
 *
 * Works with AWS S3 and S3-compatible storage like MinIO (path-style
 * addressing is used whenever a custom endpoint is set).
 *
 * Features:
 * - Multipart upload for large streams via TransferManager
 * - Streaming download into any std::ostream
 * - Paginated prefix listing with a delimiter
 * - Credential auto-detection from environment variables
 */
class S3Client : public IS3Client {
public:
  explicit S3Client(const S3Config& config);
  ~S3Client() override;

  // Non-copyable, non-movable
  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;
  S3Client(S3Client&&) = delete;
  S3Client& operator=(S3Client&&) = delete;

  /**
   * Upload the remaining contents of a seekable stream.
   *
   * The stream's buffer is handed to TransferManager directly, so large
   * files are not copied into memory.
   */
  S3Result uploadStream(const std::string& bucket, const std::string& key, std::istream& in)
    override;

  /**
   * GetObject with the response body written straight into out.
   */
  S3Result downloadToStream(const std::string& bucket, const std::string& key, std::ostream& out)
    override;

  S3Result headObject(const std::string& bucket, const std::string& key) override;

  S3Result listPrefix(
    const std::string& bucket, const std::string& prefix, const std::string& delimiter,
    S3Listing& listing, int max_keys = 0
  ) override;

  S3Result deleteObject(const std::string& bucket, const std::string& key) override;

  S3Result putEmptyObject(const std::string& bucket, const std::string& key) override;

  /**
   * Check if an error code is retryable
   */
  static bool isRetryableError(const std::string& error_code);

  const std::string& endpoint() const;
  const std::string& region() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace s3
}  // namespace stor

#endif  // STOR_S3_CLIENT_HPP
