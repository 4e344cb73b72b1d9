// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <set>

#include "retry_handler.hpp"

namespace stor {
namespace transfer {
namespace test {

using std::chrono::milliseconds;

class RetryHandlerTest : public ::testing::Test {
protected:
  static RetryConfig fixed(int max_retries = 3) {
    RetryConfig config;
    config.max_retries = max_retries;
    config.initial_delay = milliseconds(100);
    config.max_delay = milliseconds(1000);
    config.jitter_factor = 0.0;
    return config;
  }
};

TEST_F(RetryHandlerTest, DelayDoublesPerRetry) {
  RetryHandler handler(fixed());
  EXPECT_EQ(handler.delay_for(0), milliseconds(100));
  EXPECT_EQ(handler.delay_for(1), milliseconds(200));
  EXPECT_EQ(handler.delay_for(2), milliseconds(400));
}

TEST_F(RetryHandlerTest, DelayIsCapped) {
  RetryHandler handler(fixed());
  EXPECT_EQ(handler.delay_for(10), milliseconds(1000));
}

TEST_F(RetryHandlerTest, CustomMultiplier) {
  RetryConfig config = fixed();
  config.multiplier = 1.5;
  RetryHandler handler(config);
  EXPECT_EQ(handler.delay_for(2), milliseconds(225));
}

TEST_F(RetryHandlerTest, ZeroInitialDelayStillWaits) {
  RetryConfig config = fixed();
  config.initial_delay = milliseconds(0);
  RetryHandler handler(config);
  EXPECT_EQ(handler.delay_for(0), milliseconds(1));
}

TEST_F(RetryHandlerTest, RetryBudget) {
  RetryHandler handler(fixed(2));
  EXPECT_TRUE(handler.should_retry(0));
  EXPECT_TRUE(handler.should_retry(1));
  EXPECT_FALSE(handler.should_retry(2));

  RetryHandler none(fixed(0));
  EXPECT_FALSE(none.should_retry(0));
}

TEST_F(RetryHandlerTest, JitterStaysInRange) {
  RetryConfig config = fixed();
  config.initial_delay = milliseconds(1000);
  config.max_delay = milliseconds(10000);
  config.jitter_factor = 0.5;
  RetryHandler handler(config);

  std::set<int64_t> seen;
  for (int i = 0; i < 100; ++i) {
    auto delay = handler.delay_for(0).count();
    EXPECT_GE(delay, 500);
    EXPECT_LE(delay, 1500);
    seen.insert(delay);
  }
  EXPECT_GT(seen.size(), 1u);
}

TEST_F(RetryHandlerTest, NextAttemptIsInFuture) {
  RetryHandler handler(fixed());
  auto before = RetryHandler::Clock::now();
  EXPECT_GE(handler.next_attempt_at(1) - before, milliseconds(200));
}

TEST_F(RetryHandlerTest, RetryableCodes) {
  EXPECT_TRUE(RetryHandler::is_retryable_code("SlowDown"));
  EXPECT_TRUE(RetryHandler::is_retryable_code("RequestTimeout"));
  EXPECT_TRUE(RetryHandler::is_retryable_code("ConnectionReset"));
  EXPECT_TRUE(RetryHandler::is_retryable_code("ThrottlingException"));

  EXPECT_FALSE(RetryHandler::is_retryable_code("NoSuchKey"));
  EXPECT_FALSE(RetryHandler::is_retryable_code("AccessDenied"));
  EXPECT_FALSE(RetryHandler::is_retryable_code("NotVisible"));
  EXPECT_FALSE(RetryHandler::is_retryable_code(""));
}

}  // namespace test
}  // namespace transfer
}  // namespace stor
