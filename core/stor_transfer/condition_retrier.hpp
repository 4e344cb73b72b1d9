// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_CONDITION_RETRIER_HPP
#define STOR_CONDITION_RETRIER_HPP

#include <chrono>
#include <functional>
#include <type_traits>
#include <utility>

namespace stor {
namespace transfer {

struct ConditionRetryConfig {
  std::chrono::milliseconds interval{1000};  // Sleep between evaluations
  int max_attempts = 5;                      // Total evaluations, >= 1
};

/**
 * Polls a predicate until it returns true or the attempt budget runs out.
 *
 * Used to wait for eventually consistent object stores to expose a freshly
 * written object. Exhaustion is reported through the return value, not an
 * exception. Exceptions thrown by the predicate propagate unchanged.
 */
class ConditionRetrier {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param sleeper Replaces std::this_thread::sleep_for (tests)
   * @throws InvalidCondition if config.max_attempts < 1
   */
  explicit ConditionRetrier(const ConditionRetryConfig& config = {}, Sleeper sleeper = {});

  /**
   * Evaluate condition up to max_attempts times, sleeping interval between
   * evaluations but never after the last one.
   *
   * @return true as soon as condition() returns true, false on exhaustion
   * @throws InvalidCondition if condition is empty
   */
  bool wait_until(const std::function<bool()>& condition);

  /// Evaluations made by the last wait_until call
  int attempts() const {
    return attempts_;
  }

  const ConditionRetryConfig& config() const {
    return config_;
  }

private:
  ConditionRetryConfig config_;
  Sleeper sleeper_;
  int attempts_ = 0;
};

/**
 * One-shot form of ConditionRetrier::wait_until.
 */
template<typename Condition>
bool wait_until(Condition&& condition, std::chrono::milliseconds interval, int max_attempts) {
  static_assert(
    std::is_invocable_r<bool, Condition>::value, "condition must be callable with no arguments"
  );
  ConditionRetrier retrier(ConditionRetryConfig{interval, max_attempts});
  return retrier.wait_until(std::function<bool()>(std::forward<Condition>(condition)));
}

}  // namespace transfer
}  // namespace stor

#endif  // STOR_CONDITION_RETRIER_HPP
