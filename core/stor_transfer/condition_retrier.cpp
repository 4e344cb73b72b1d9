// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "condition_retrier.hpp"

#include <string>
#include <thread>

#include "stor_errors.hpp"

#define STOR_LOG_COMPONENT "condition_retrier"
#include <stor_log_macros.hpp>

namespace stor {
namespace transfer {

using logging::kv;

ConditionRetrier::ConditionRetrier(const ConditionRetryConfig& config, Sleeper sleeper)
    : config_(config)
    , sleeper_(std::move(sleeper)) {
  if (config_.max_attempts < 1) {
    throw InvalidCondition(
      "max_attempts must be at least 1, got " + std::to_string(config_.max_attempts)
    );
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

bool ConditionRetrier::wait_until(const std::function<bool()>& condition) {
  attempts_ = 0;
  if (!condition) {
    throw InvalidCondition("condition must be callable");
  }

  while (true) {
    ++attempts_;
    if (condition()) {
      return true;
    }
    if (attempts_ >= config_.max_attempts) {
      break;
    }
    STOR_LOG_DEBUG(
      "Condition not met, retrying" << kv("attempt", attempts_)
                                    << kv("max_attempts", config_.max_attempts)
                                    << kv("interval_ms", config_.interval.count())
    );
    sleeper_(config_.interval);
  }

  STOR_LOG_DEBUG("Condition not met after all attempts" << kv("attempts", attempts_));
  return false;
}

}  // namespace transfer
}  // namespace stor
