// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_RETRY_HANDLER_HPP
#define STOR_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <random>
#include <set>
#include <string>

namespace stor {
namespace transfer {

/**
 * Backoff for transfer items that failed with a retryable backend error
 */
struct RetryConfig {
  int max_retries = 3;
  std::chrono::milliseconds initial_delay{500};
  std::chrono::milliseconds max_delay{30000};
  double multiplier = 2.0;
  double jitter_factor = 0.5;  // 0 disables jitter; delay scaled by [1-f, 1+f]
};

/**
 * Decides whether a failed item is re-queued and when it becomes eligible
 * again. Shared by all workers of a batch.
 */
class RetryHandler {
public:
  using Clock = std::chrono::steady_clock;

  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  bool should_retry(int retries_done) const {
    return retries_done < config_.max_retries;
  }

  /**
   * initial_delay * multiplier^retries_done, capped at max_delay, jittered,
   * never below 1ms.
   */
  std::chrono::milliseconds delay_for(int retries_done) const {
    const double base = static_cast<double>(config_.initial_delay.count());
    const double cap = static_cast<double>(config_.max_delay.count());
    double delay = std::min(base * std::pow(config_.multiplier, retries_done), cap);

    if (config_.jitter_factor > 0.0) {
      delay *= jitter();
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay, 1.0)));
  }

  Clock::time_point next_attempt_at(int retries_done) const {
    return Clock::now() + delay_for(retries_done);
  }

  const RetryConfig& config() const {
    return config_;
  }

  /**
   * Backend error codes worth another attempt: throttling, timeouts and
   * dropped connections. Object-store clients use this to mark
   * BackendError::retryable().
   */
  static bool is_retryable_code(const std::string& code) {
    static const std::set<std::string> codes = {
      "RequestTimeout",
      "ServiceUnavailable",
      "InternalError",
      "SlowDown",
      "RequestTimeTooSkewed",
      "OperationAborted",
      "Throttling",
      "ThrottlingException",
      "ConnectionReset",
      "ConnectionTimeout",
      "ConnectionRefused",
      "NetworkingError",
      "TransientError",
    };
    return codes.count(code) > 0;
  }

private:
  double jitter() const {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(
      1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
    );
    return dist(rng_);
  }

  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace transfer
}  // namespace stor

#endif  // STOR_RETRY_HANDLER_HPP
