// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/core/utils/threading/Executor.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/transfer/TransferHandle.h>
#include <aws/transfer/TransferManager.h>

#include <cstdlib>
#include <mutex>

#include "retry_handler.hpp"
#include "s3_client_test_helpers.hpp"

#define STOR_LOG_COMPONENT "s3_client"
#include <stor_log_macros.hpp>

namespace stor {
namespace s3 {

using logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// The AWS SDK requires InitAPI/ShutdownAPI to be called exactly once per process.
// A reference-counted singleton manages this lifecycle.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

std::string transferStatusToErrorCode(int status) {
  switch (static_cast<Aws::Transfer::TransferStatus>(status)) {
    case Aws::Transfer::TransferStatus::CANCELED:
      return "TransferCanceled";
    case Aws::Transfer::TransferStatus::FAILED:
      return "TransferFailed";
    case Aws::Transfer::TransferStatus::ABORTED:
      return "TransferAborted";
    case Aws::Transfer::TransferStatus::NOT_STARTED:
      return "TransferNotStarted";
    case Aws::Transfer::TransferStatus::IN_PROGRESS:
      return "TransferInProgress";
    default:
      return "TransferError";
  }
}

std::string normalizeEndpoint(const std::string& endpoint) {
  std::string out = endpoint;
  while (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

uint64_t clampPartSize(uint64_t part_size) {
  constexpr uint64_t MIN_PART_SIZE = 5 * 1024 * 1024;            // 5MB
  constexpr uint64_t MAX_PART_SIZE = 5ULL * 1024 * 1024 * 1024;  // 5GB
  if (part_size < MIN_PART_SIZE) {
    return MIN_PART_SIZE;
  }
  if (part_size > MAX_PART_SIZE) {
    return MAX_PART_SIZE;
  }
  return part_size;
}

namespace {

template<typename ErrorT>
S3Result failureFrom(const ErrorT& error, const std::string& key) {
  std::string code = error.GetExceptionName();
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = "S3 request failed";
  }
  bool retryable = S3Client::isRetryableError(code) || error.ShouldRetry();
  STOR_LOG_DEBUG(
    "S3 request failed" << kv("key", key) << kv("code", code) << kv("retryable", retryable)
  );
  return S3Result::Failure(message, code, retryable);
}

}  // namespace

// =============================================================================
// S3Client Implementation
// =============================================================================

class S3Client::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;
  std::shared_ptr<Aws::Utils::Threading::PooledThreadExecutor> executor;
  std::shared_ptr<Aws::Transfer::TransferManager> transfer_manager;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must go before release(), which may call ShutdownAPI().
    // TransferManager uses the client and executor, so it goes first.
    transfer_manager.reset();
    client.reset();
    executor.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      client_config.endpointOverride = normalizeEndpoint(config.endpoint_url);
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("StorS3Retry", config.max_sdk_retries);

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Custom endpoints (MinIO) need path-style addressing
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );

    executor = Aws::MakeShared<Aws::Utils::Threading::PooledThreadExecutor>(
      "StorS3Executor", config.executor_thread_count
    );

    Aws::Transfer::TransferManagerConfiguration transfer_config(executor.get());
    transfer_config.s3Client = client;

    uint64_t part_size = clampPartSize(config.part_size);
    if (part_size != config.part_size) {
      STOR_LOG_WARN(
        "part_size outside S3 limits, clamped" << kv("requested", config.part_size)
                                               << kv("using", part_size)
      );
    }
    transfer_config.bufferSize = part_size;

    transfer_manager = Aws::Transfer::TransferManager::Create(transfer_config);
  }
};

S3Client::S3Client(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  STOR_LOG_DEBUG(
    "S3 client ready" << kv("endpoint", impl_->config.endpoint_url)
                      << kv("region", impl_->config.region)
  );
}

S3Client::~S3Client() = default;

S3Result S3Client::uploadStream(const std::string& bucket, const std::string& key, std::istream& in) {
  // Shares the caller's stream buffer; valid because this call blocks until
  // the transfer finishes
  auto body = Aws::MakeShared<Aws::IOStream>("StorUpload", in.rdbuf());

  auto handle = impl_->transfer_manager->UploadFile(
    body, bucket.c_str(), key.c_str(), "application/octet-stream",
    Aws::Map<Aws::String, Aws::String>()
  );
  handle->WaitUntilFinished();

  auto status = handle->GetStatus();
  if (status == Aws::Transfer::TransferStatus::COMPLETED) {
    uint64_t bytes = handle->GetBytesTransferred();
    STOR_LOG_DEBUG("S3 upload succeeded" << kv("bucket", bucket) << kv("key", key) << kv("bytes", bytes));
    return S3Result::Success(bytes);
  }

  auto error = handle->GetLastError();
  std::string error_code = error.GetExceptionName();
  if (error_code.empty()) {
    error_code = transferStatusToErrorCode(static_cast<int>(status));
  }
  std::string error_msg = error.GetMessage();
  if (error_msg.empty()) {
    error_msg = "Transfer failed with status: " + std::to_string(static_cast<int>(status));
  }
  bool retryable = isRetryableError(error_code) || error.ShouldRetry();

  STOR_LOG_ERROR(
    "S3 upload failed" << kv("key", key) << kv("error", error_msg) << kv("code", error_code)
                       << kv("retryable", retryable)
  );
  return S3Result::Failure(error_msg, error_code, retryable);
}

S3Result S3Client::downloadToStream(
  const std::string& bucket, const std::string& key, std::ostream& out
) {
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetResponseStreamFactory([&out]() {
    return Aws::New<Aws::IOStream>("StorDownload", out.rdbuf());
  });

  auto outcome = impl_->client->GetObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom(outcome.GetError(), key);
  }
  out.flush();
  if (!out) {
    return S3Result::Failure("Failed to write downloaded object", "WriteError");
  }
  return S3Result::Success(static_cast<uint64_t>(outcome.GetResult().GetContentLength()));
}

S3Result S3Client::headObject(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  if (outcome.IsSuccess()) {
    return S3Result::Success(static_cast<uint64_t>(outcome.GetResult().GetContentLength()));
  }
  // HEAD responses carry no body, so a 404 has no exception name
  if (outcome.GetError().GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
    return S3Result::Failure("Object not found", "NoSuchKey");
  }
  return failureFrom(outcome.GetError(), key);
}

S3Result S3Client::listPrefix(
  const std::string& bucket, const std::string& prefix, const std::string& delimiter,
  S3Listing& listing, int max_keys
) {
  Aws::S3::Model::ListObjectsV2Request request;
  request.SetBucket(bucket);
  request.SetPrefix(prefix);
  if (!delimiter.empty()) {
    request.SetDelimiter(delimiter);
  }
  if (max_keys > 0) {
    request.SetMaxKeys(max_keys);
  }

  while (true) {
    auto outcome = impl_->client->ListObjectsV2(request);
    if (!outcome.IsSuccess()) {
      return failureFrom(outcome.GetError(), prefix);
    }
    const auto& result = outcome.GetResult();
    for (const auto& object : result.GetContents()) {
      listing.keys.emplace_back(object.GetKey());
    }
    for (const auto& common : result.GetCommonPrefixes()) {
      listing.prefixes.emplace_back(common.GetPrefix());
    }

    if (max_keys > 0 || !result.GetIsTruncated()) {
      break;
    }
    request.SetContinuationToken(result.GetNextContinuationToken());
    STOR_LOG_DEBUG_EVERY_N(
      10, "Listing continues" << kv("bucket", bucket) << kv("prefix", prefix)
                              << kv("keys", listing.keys.size())
    );
  }
  return S3Result::Success();
}

S3Result S3Client::deleteObject(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom(outcome.GetError(), key);
  }
  return S3Result::Success();
}

S3Result S3Client::putEmptyObject(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetBody(Aws::MakeShared<Aws::StringStream>("StorMarker"));
  request.SetContentLength(0);

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom(outcome.GetError(), key);
  }
  return S3Result::Success();
}

bool S3Client::isRetryableError(const std::string& error_code) {
  // Single source of truth for retryable codes
  return transfer::RetryHandler::is_retryable_code(error_code);
}

const std::string& S3Client::endpoint() const {
  return impl_->config.endpoint_url;
}

const std::string& S3Client::region() const {
  return impl_->config.region;
}

}  // namespace s3
}  // namespace stor
