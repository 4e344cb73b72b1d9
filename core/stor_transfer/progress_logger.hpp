// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_PROGRESS_LOGGER_HPP
#define STOR_PROGRESS_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace stor {
namespace transfer {

/**
 * Outcome of one manifest item
 */
struct ProgressResult {
  std::string key;
  uint64_t bytes = 0;
  bool success = false;
  std::string error;

  static ProgressResult Success(const std::string& key, uint64_t bytes = 0) {
    ProgressResult r;
    r.key = key;
    r.bytes = bytes;
    r.success = true;
    return r;
  }

  static ProgressResult Failure(const std::string& key, const std::string& error) {
    ProgressResult r;
    r.key = key;
    r.error = error;
    return r;
  }
};

struct ProgressLoggerOptions {
  size_t log_every_n = 100;                   // Emit after this many results
  std::chrono::milliseconds log_interval{5000};  // ...or after this much time
};

/**
 * Scoped accumulator of per-item results for one batch.
 *
 * Subclasses only format the progress line. add_result() may be called from
 * any worker thread. A progress line is emitted every log_every_n results or
 * every log_interval, whichever comes first; empty messages are never
 * emitted.
 *
 * Concrete loggers must call close_on_destroy() from their destructor so a
 * logger that was never closed still emits its final line.
 */
class ProgressLogger {
public:
  using Emitter = std::function<void(const std::string&)>;

  /**
   * @param total Number of items expected in the batch
   * @param emitter Receives each progress line (default: STOR_LOG_INFO)
   */
  explicit ProgressLogger(
    size_t total, const ProgressLoggerOptions& options = {}, Emitter emitter = {}
  );
  virtual ~ProgressLogger();

  ProgressLogger(const ProgressLogger&) = delete;
  ProgressLogger& operator=(const ProgressLogger&) = delete;

  void add_result(const ProgressResult& result);

  /**
   * Emit the final message and return the failures. Idempotent; later calls
   * return the same failures without emitting again.
   */
  std::vector<ProgressResult> close();

  bool closed() const;
  bool has_failures() const;
  std::vector<ProgressResult> failures() const;

protected:
  /**
   * Current summary line. Called with the logger's lock held; use the
   * accessors below only.
   */
  virtual std::string progress_message() const = 0;

  /// Closes if still open and logs an ERROR when failures were recorded
  void close_on_destroy() noexcept;

  size_t total() const {
    return total_;
  }
  size_t num_results() const {
    return num_results_;
  }
  size_t num_failures() const {
    return failures_.size();
  }
  uint64_t total_bytes() const {
    return total_bytes_;
  }
  double elapsed_seconds() const;

private:
  void emit(const std::string& message);

  const size_t total_;
  const ProgressLoggerOptions options_;
  Emitter emitter_;

  mutable std::mutex mutex_;
  size_t num_results_ = 0;
  uint64_t total_bytes_ = 0;
  std::vector<ProgressResult> failures_;
  std::chrono::steady_clock::time_point started_at_;
  std::chrono::steady_clock::time_point last_emit_at_;
  size_t results_since_emit_ = 0;
  bool closed_ = false;
};

/**
 * "<n>/<total>\t<MB> MB\t<MB/s> MB/s"
 */
class UploadProgressLogger : public ProgressLogger {
public:
  using ProgressLogger::ProgressLogger;
  ~UploadProgressLogger() override;

protected:
  std::string progress_message() const override;
};

class DownloadProgressLogger : public ProgressLogger {
public:
  using ProgressLogger::ProgressLogger;
  ~DownloadProgressLogger() override;

protected:
  std::string progress_message() const override;
};

/**
 * "<n>/<total>"
 */
class DeleteProgressLogger : public ProgressLogger {
public:
  using ProgressLogger::ProgressLogger;
  ~DeleteProgressLogger() override;

protected:
  std::string progress_message() const override;
};

}  // namespace transfer
}  // namespace stor

#endif  // STOR_PROGRESS_LOGGER_HPP
