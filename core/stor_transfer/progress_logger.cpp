// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_logger.hpp"

#include <iomanip>
#include <sstream>

#define STOR_LOG_COMPONENT "progress"
#include <stor_log_macros.hpp>

namespace stor {
namespace transfer {

using logging::kv;

namespace {

std::string transfer_line(size_t n, size_t total, uint64_t bytes, double elapsed) {
  double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
  double rate = elapsed > 0.0 ? mb / elapsed : 0.0;
  std::ostringstream oss;
  oss << n << "/" << total << "\t" << std::fixed << std::setprecision(2) << mb << " MB\t" << rate
      << " MB/s";
  return oss.str();
}

}  // namespace

ProgressLogger::ProgressLogger(size_t total, const ProgressLoggerOptions& options, Emitter emitter)
    : total_(total)
    , options_(options)
    , emitter_(std::move(emitter))
    , started_at_(std::chrono::steady_clock::now())
    , last_emit_at_(started_at_) {}

ProgressLogger::~ProgressLogger() {
  // A subclass that skipped close_on_destroy() can no longer format its
  // message here; still surface the failures.
  if (!closed_ && !failures_.empty()) {
    STOR_LOG_ERROR(
      "Progress logger destroyed without close" << kv("failures", failures_.size())
                                                << kv("total", total_)
    );
  }
}

void ProgressLogger::add_result(const ProgressResult& result) {
  std::string message;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++num_results_;
    ++results_since_emit_;
    total_bytes_ += result.bytes;
    if (!result.success) {
      failures_.push_back(result);
    }

    auto now = std::chrono::steady_clock::now();
    bool count_due = options_.log_every_n > 0 && results_since_emit_ >= options_.log_every_n;
    bool time_due = now - last_emit_at_ >= options_.log_interval;
    if (count_due || time_due) {
      results_since_emit_ = 0;
      last_emit_at_ = now;
      message = progress_message();
    }
  }
  if (!message.empty()) {
    emit(message);
  }
}

std::vector<ProgressResult> ProgressLogger::close() {
  std::string message;
  std::vector<ProgressResult> failures;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return failures_;
    }
    closed_ = true;
    message = progress_message();
    failures = failures_;
  }
  if (!message.empty()) {
    emit(message);
  }
  return failures;
}

bool ProgressLogger::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool ProgressLogger::has_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !failures_.empty();
}

std::vector<ProgressResult> ProgressLogger::failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

void ProgressLogger::close_on_destroy() noexcept {
  if (closed()) {
    return;
  }
  try {
    auto failures = close();
    if (!failures.empty()) {
      STOR_LOG_ERROR(
        "Batch finished with failures" << kv("failures", failures.size()) << kv("total", total_)
                                       << kv("first_key", failures.front().key)
      );
    }
  } catch (const std::exception& e) {
    STOR_LOG_ERROR("Failed to close progress logger" << kv("error", e.what()));
  }
}

double ProgressLogger::elapsed_seconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
}

void ProgressLogger::emit(const std::string& message) {
  if (emitter_) {
    emitter_(message);
  } else {
    STOR_LOG_INFO(message);
  }
}

// =============================================================================
// Concrete loggers
// =============================================================================

UploadProgressLogger::~UploadProgressLogger() {
  close_on_destroy();
}

std::string UploadProgressLogger::progress_message() const {
  return transfer_line(num_results(), total(), total_bytes(), elapsed_seconds());
}

DownloadProgressLogger::~DownloadProgressLogger() {
  close_on_destroy();
}

std::string DownloadProgressLogger::progress_message() const {
  return transfer_line(num_results(), total(), total_bytes(), elapsed_seconds());
}

DeleteProgressLogger::~DeleteProgressLogger() {
  close_on_destroy();
}

std::string DeleteProgressLogger::progress_message() const {
  return std::to_string(num_results()) + "/" + std::to_string(total());
}

}  // namespace transfer
}  // namespace stor
