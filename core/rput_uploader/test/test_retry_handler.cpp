// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RetryHandler
 */

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

#include "retry_handler.hpp"

using namespace rput::uploader;

class RetryHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    RetryConfig config;
    config.try_times = 5;
    config.initial_delay = std::chrono::milliseconds(1000);
    config.max_delay = std::chrono::milliseconds(60000);
    config.exponential_base = 2.0;
    handler_ = std::make_unique<RetryHandler>(config);
  }

  std::unique_ptr<RetryHandler> handler_;
};

TEST_F(RetryHandlerTest, ExponentialBackoff) {
  EXPECT_EQ(handler_->getDelay(0).count(), 1000);
  EXPECT_EQ(handler_->getDelay(1).count(), 2000);
  EXPECT_EQ(handler_->getDelay(2).count(), 4000);
  EXPECT_EQ(handler_->getDelay(3).count(), 8000);
}

TEST_F(RetryHandlerTest, MaxDelayCap) {
  // 2^10 * 1000 = 1,024,000 ms, capped at 60,000
  EXPECT_EQ(handler_->getDelay(10).count(), 60000);
}

TEST_F(RetryHandlerTest, ShouldRetry) {
  EXPECT_TRUE(handler_->shouldRetry(1));
  EXPECT_TRUE(handler_->shouldRetry(4));
  EXPECT_FALSE(handler_->shouldRetry(5));  // try_times = 5
  EXPECT_FALSE(handler_->shouldRetry(10));
}

TEST_F(RetryHandlerTest, TryTimes) {
  EXPECT_EQ(handler_->tryTimes(), 5);
}

TEST(RetryHandlerDefaultsTest, ImmediateRetryByDefault) {
  RetryHandler handler;
  EXPECT_EQ(handler.tryTimes(), 3);
  EXPECT_EQ(handler.getDelay(0).count(), 0);
  EXPECT_EQ(handler.getDelay(5).count(), 0);
}

TEST(RetryHandlerDefaultsTest, TryTimesClampedToOne) {
  RetryConfig config;
  config.try_times = 0;
  RetryHandler handler(config);
  EXPECT_EQ(handler.tryTimes(), 1);

  config.try_times = -3;
  EXPECT_EQ(RetryHandler(config).tryTimes(), 1);
}

// ============================================================================
// run() Tests
// ============================================================================

class RetryRunTest : public ::testing::Test {
protected:
  RetryHandler makeHandler(int try_times) {
    RetryConfig config;
    config.try_times = try_times;
    return RetryHandler(config);
  }

  std::vector<int> retries_;
};

TEST_F(RetryRunTest, SuccessOnFirstAttempt) {
  auto handler = makeHandler(3);
  int calls = 0;
  PutStatus status = handler.run(
    [&] {
      calls++;
      return PutStatus::Ok();
    },
    [&](int attempts_made, const PutStatus&) { retries_.push_back(attempts_made); }
  );

  EXPECT_TRUE(status.ok());
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(retries_.empty());
}

TEST_F(RetryRunTest, SucceedsAfterFailures) {
  auto handler = makeHandler(3);
  int calls = 0;
  PutStatus status = handler.run(
    [&] {
      calls++;
      return calls < 3 ? PutStatus::Failure(PutErrorCode::kServerError) : PutStatus::Ok();
    },
    [&](int attempts_made, const PutStatus&) { retries_.push_back(attempts_made); }
  );

  EXPECT_TRUE(status.ok());
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(retries_, (std::vector<int>{1, 2}));
}

TEST_F(RetryRunTest, ReturnsLastFailure) {
  auto handler = makeHandler(4);
  int calls = 0;
  PutStatus status = handler.run(
    [&] {
      calls++;
      return PutStatus::Failure(PutErrorCode::kServerError, "attempt " + std::to_string(calls));
    },
    [&](int attempts_made, const PutStatus&) { retries_.push_back(attempts_made); }
  );

  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.code, PutErrorCode::kServerError);
  EXPECT_EQ(status.message, "attempt 4");
  EXPECT_EQ(calls, 4);
  EXPECT_EQ(retries_.size(), 3u);
}

TEST_F(RetryRunTest, SingleAttemptNeverRetries) {
  auto handler = makeHandler(1);
  int calls = 0;
  PutStatus status = handler.run(
    [&] {
      calls++;
      return PutStatus::Failure(PutErrorCode::kTransportError);
    },
    [&](int attempts_made, const PutStatus&) { retries_.push_back(attempts_made); }
  );

  EXPECT_FALSE(status.ok());
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(retries_.empty());
}

TEST_F(RetryRunTest, ExceptionBecomesTransportError) {
  auto handler = makeHandler(2);
  int calls = 0;
  PutStatus status = handler.run(
    [&]() -> PutStatus {
      calls++;
      throw std::runtime_error("connection reset");
    },
    [&](int attempts_made, const PutStatus& err) {
      retries_.push_back(attempts_made);
      EXPECT_EQ(err.code, PutErrorCode::kTransportError);
    }
  );

  EXPECT_EQ(status.code, PutErrorCode::kTransportError);
  EXPECT_EQ(status.message, "connection reset");
  EXPECT_EQ(calls, 2);
}

TEST_F(RetryRunTest, BackoffSleepsBetweenAttempts) {
  RetryConfig config;
  config.try_times = 3;
  config.initial_delay = std::chrono::milliseconds(20);
  RetryHandler handler(config);

  auto start = std::chrono::steady_clock::now();
  handler.run(
    [] { return PutStatus::Failure(PutErrorCode::kServerError); }, [](int, const PutStatus&) {}
  );
  auto elapsed = std::chrono::steady_clock::now() - start;

  // 20ms + 40ms
  EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 60);
}
