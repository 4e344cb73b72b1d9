// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_S3_BACKEND_CLIENT_HPP
#define STOR_S3_BACKEND_CLIENT_HPP

#include <memory>
#include <string>

#include "backend_client.hpp"
#include "s3_client.hpp"

namespace stor {
namespace s3 {

/**
 * IBackendClient for s3:// paths.
 *
 * A directory is a key prefix. Empty directories are kept as zero-byte
 * "<key>/" marker objects; markers are never reported as children.
 * Failed requests throw BackendError carrying the S3 error code and
 * retryability.
 */
class S3BackendClient : public transfer::IBackendClient {
public:
  explicit S3BackendClient(std::shared_ptr<IS3Client> client);

  bool exists(const Path& path) override;
  bool is_directory(const Path& path) override;
  std::vector<transfer::DirectoryEntry> list_children(const Path& path) override;
  uint64_t read_file(const Path& path, std::ostream& out) override;
  uint64_t write_file(const Path& path, std::istream& in) override;
  void remove_file(const Path& path) override;
  void remove_directory(const Path& path) override;
  void make_directory(const Path& path) override;

  bool eventually_consistent() const override {
    return true;
  }

  const char* name() const override {
    return "s3";
  }

private:
  // HeadObject; false only for NoSuchKey
  bool object_exists(const std::string& bucket, const std::string& key);

  // True if any object lives under "<key>/"
  bool has_children(const std::string& bucket, const std::string& key);

  std::shared_ptr<IS3Client> client_;
};

}  // namespace s3
}  // namespace stor

#endif  // STOR_S3_BACKEND_CLIENT_HPP
