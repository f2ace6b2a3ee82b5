#pragma once

#include "registry/registry_error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace modelpush::upload {

constexpr std::uint32_t kDefaultMaxAttempts = 5U;
constexpr std::chrono::milliseconds kDefaultInitialBackoff{200};
constexpr double kDefaultBackoffMultiplier = 2.0;
constexpr std::chrono::milliseconds kDefaultMaxBackoff{5'000};

// Bounded exponential backoff for idempotent registry calls. `max_attempts`
// counts the first try, so 1 disables retries.
struct RetryPolicy {
  std::uint32_t max_attempts = kDefaultMaxAttempts;
  std::chrono::milliseconds initial_backoff = kDefaultInitialBackoff;
  double backoff_multiplier = kDefaultBackoffMultiplier;
  std::chrono::milliseconds max_backoff = kDefaultMaxBackoff;
};

bool ValidateRetryPolicy(const RetryPolicy& policy, std::string& error);

// Delay before the next attempt after `failed_attempts` consecutive failures:
// initial * multiplier^(failed_attempts - 1), capped at max_backoff.
std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy, std::uint32_t failed_attempts);

// Remaining attempts under a fixed budget.
std::uint32_t ComputeRetryAttemptsRemaining(std::uint32_t max_attempts,
                                            std::uint32_t attempts_used_total);

using Sleeper = std::function<void(std::chrono::milliseconds)>;
using StopPredicate = std::function<bool()>;

// Real-time sleeper used outside tests.
Sleeper ThreadSleeper();

struct RetryAttemptResult {
  bool succeeded = false;
  // Set when `should_stop` fired while waiting out a backoff.
  bool cancelled = false;
  std::uint32_t attempts_used_total = 0;
  registry::RegistryError last_error;
};

// Runs `operation` until it succeeds, fails with a non-transient error, the
// attempt budget is spent, or `should_stop` reports cancellation between
// attempts. `on_retry` is called before each backoff wait with the attempt
// that just failed.
RetryAttemptResult ExecuteWithRetry(
    const RetryPolicy& policy, const std::function<bool(registry::RegistryError&)>& operation,
    const std::function<void(std::uint32_t, const registry::RegistryError&,
                             std::chrono::milliseconds)>& on_retry,
    const Sleeper& sleeper, const StopPredicate& should_stop);

} // namespace modelpush::upload
