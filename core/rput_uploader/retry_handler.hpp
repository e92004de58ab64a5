// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_RETRY_HANDLER_HPP
#define RPUT_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <string>
#include <thread>

#include "put_types.hpp"

namespace rput {
namespace uploader {

/**
 * Configuration for per-block retry behavior
 */
struct RetryConfig {
  int try_times = 3;                           // Total attempts, including the first one
  std::chrono::milliseconds initial_delay{0};  // 0 retries immediately
  std::chrono::milliseconds max_delay{30000};  // Cap for the backoff delay
  double exponential_base = 2.0;               // Exponential backoff base
};

/**
 * Bounded retry loop around a single fallible operation
 *
 * Each attempt runs to completion; there is no timeout at this layer.
 * Stateless after construction, so one handler may be shared by
 * concurrently running blocks.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config) {
    if (config_.try_times < 1) {
      config_.try_times = 1;
    }
  }

  /**
   * Delay before the next attempt
   *
   * Delay formula: initial_delay * (base ^ retry_count), capped at max_delay
   *
   * @param retry_count Number of retries already made (0-indexed)
   */
  std::chrono::milliseconds getDelay(int retry_count) const {
    if (config_.initial_delay.count() <= 0) {
      return std::chrono::milliseconds(0);
    }

    double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                      std::pow(config_.exponential_base, static_cast<double>(retry_count));
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
  }

  /**
   * @param attempts_made Attempts already made, including the first one
   * @return true if attempts_made < try_times
   */
  bool shouldRetry(int attempts_made) const {
    return attempts_made < config_.try_times;
  }

  int tryTimes() const {
    return config_.try_times;
  }

  const RetryConfig& config() const {
    return config_;
  }

  /**
   * Run attempt() until it succeeds or the attempt budget is spent
   *
   * @param attempt Callable returning PutStatus
   * @param on_retry Callable(int attempts_made, const PutStatus& err), invoked
   *                 before each retry
   * @return The first successful status, or the last failure
   */
  template <typename Attempt, typename OnRetry>
  PutStatus run(Attempt&& attempt, OnRetry&& on_retry) const {
    int attempts_made = 0;
    while (true) {
      PutStatus status;
      try {
        status = attempt();
      } catch (const std::exception& e) {
        status = PutStatus::Failure(PutErrorCode::kTransportError, e.what());
      }
      ++attempts_made;

      if (status.ok() || !shouldRetry(attempts_made)) {
        return status;
      }

      on_retry(attempts_made, status);

      auto delay = getDelay(attempts_made - 1);
      if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
      }
    }
  }

private:
  RetryConfig config_;
};

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_RETRY_HANDLER_HPP
