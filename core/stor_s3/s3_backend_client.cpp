// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_backend_client.hpp"

#include <stdexcept>

#include "stor_errors.hpp"

#define STOR_LOG_COMPONENT "s3_backend"
#include <stor_log_macros.hpp>

namespace stor {
namespace s3 {

using logging::kv;
using transfer::DirectoryEntry;

namespace {

struct BucketKey {
  std::string bucket;
  std::string key;
};

BucketKey split(const Path& path) {
  if (path.kind() != PathKind::s3) {
    throw std::invalid_argument("Not an S3 path: " + path.str());
  }
  auto location = path.object_location();
  if (location.container.empty()) {
    throw std::invalid_argument("S3 path has no bucket: " + path.str());
  }
  return {location.container, location.resource};
}

void check(const S3Result& result, const Path& path) {
  if (!result.success) {
    throw BackendError(path.str(), result.error_message, result.error_code, result.is_retryable);
  }
}

Path object_path(const std::string& bucket, const std::string& key) {
  return Path(std::string(S3_PREFIX) + bucket + "/" + key);
}

// Only "not found" codes mean absence; anything else is raised
bool found(const S3Result& result, const Path& path, const char* missing_code) {
  if (result.success) {
    return true;
  }
  if (result.error_code == missing_code) {
    return false;
  }
  throw BackendError(path.str(), result.error_message, result.error_code, result.is_retryable);
}

}  // namespace

S3BackendClient::S3BackendClient(std::shared_ptr<IS3Client> client)
    : client_(std::move(client)) {
  if (!client_) {
    throw std::invalid_argument("S3BackendClient requires a client");
  }
}

bool S3BackendClient::has_children(const std::string& bucket, const std::string& key) {
  S3Listing listing;
  std::string prefix = key.empty() ? "" : key + "/";
  auto result = client_->listPrefix(bucket, prefix, "", listing, 1);
  if (!result.success) {
    throw BackendError(
      object_path(bucket, key).str(), result.error_message, result.error_code, result.is_retryable
    );
  }
  return !listing.keys.empty();
}

bool S3BackendClient::object_exists(const std::string& bucket, const std::string& key) {
  return found(client_->headObject(bucket, key), object_path(bucket, key), "NoSuchKey");
}

bool S3BackendClient::exists(const Path& path) {
  auto bk = split(path);
  if (bk.key.empty()) {
    // Bucket root: reachable if it can be listed
    S3Listing listing;
    return found(client_->listPrefix(bk.bucket, "", "/", listing, 1), path, "NoSuchBucket");
  }
  return object_exists(bk.bucket, bk.key) || has_children(bk.bucket, bk.key);
}

bool S3BackendClient::is_directory(const Path& path) {
  auto bk = split(path);
  if (bk.key.empty()) {
    return true;
  }
  if (object_exists(bk.bucket, bk.key)) {
    return false;
  }
  return has_children(bk.bucket, bk.key);
}

std::vector<DirectoryEntry> S3BackendClient::list_children(const Path& path) {
  auto bk = split(path);
  const std::string prefix = bk.key.empty() ? "" : bk.key + "/";

  S3Listing listing;
  check(client_->listPrefix(bk.bucket, prefix, "/", listing), path);

  std::vector<DirectoryEntry> children;
  for (const auto& key : listing.keys) {
    if (key == prefix) {
      continue;  // marker for path itself
    }
    children.push_back({object_path(bk.bucket, key), false});
  }
  for (auto sub : listing.prefixes) {
    while (!sub.empty() && sub.back() == '/') {
      sub.pop_back();
    }
    children.push_back({object_path(bk.bucket, sub), true});
  }
  STOR_LOG_DEBUG(
    "Listed prefix" << kv("bucket", bk.bucket) << kv("prefix", prefix)
                    << kv("children", children.size())
  );
  return children;
}

uint64_t S3BackendClient::read_file(const Path& path, std::ostream& out) {
  auto bk = split(path);
  auto result = client_->downloadToStream(bk.bucket, bk.key, out);
  check(result, path);
  return result.bytes;
}

uint64_t S3BackendClient::write_file(const Path& path, std::istream& in) {
  auto bk = split(path);
  auto result = client_->uploadStream(bk.bucket, bk.key, in);
  check(result, path);
  return result.bytes;
}

void S3BackendClient::remove_file(const Path& path) {
  auto bk = split(path);
  check(client_->deleteObject(bk.bucket, bk.key), path);
}

void S3BackendClient::remove_directory(const Path& path) {
  auto bk = split(path);
  if (bk.key.empty()) {
    return;  // buckets are never deleted
  }
  check(client_->deleteObject(bk.bucket, bk.key + "/"), path);
}

void S3BackendClient::make_directory(const Path& path) {
  auto bk = split(path);
  if (bk.key.empty()) {
    return;
  }
  check(client_->putEmptyObject(bk.bucket, bk.key + "/"), path);
}

}  // namespace s3
}  // namespace stor
