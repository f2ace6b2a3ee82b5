#include "upload/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace modelpush::upload {

bool ValidateRetryPolicy(const RetryPolicy& policy, std::string& error) {
  if (policy.max_attempts == 0U) {
    error = "max_attempts must be at least 1";
    return false;
  }
  if (policy.initial_backoff.count() < 0 || policy.max_backoff.count() < 0) {
    error = "backoff durations cannot be negative";
    return false;
  }
  if (!std::isfinite(policy.backoff_multiplier) || policy.backoff_multiplier < 1.0) {
    error = "backoff_multiplier must be a finite number >= 1.0";
    return false;
  }
  return true;
}

std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy,
                                         const std::uint32_t failed_attempts) {
  if (failed_attempts == 0U) {
    return std::chrono::milliseconds(0);
  }
  const double cap = static_cast<double>(policy.max_backoff.count());
  double delay = static_cast<double>(policy.initial_backoff.count());
  for (std::uint32_t i = 1; i < failed_attempts && delay < cap; ++i) {
    delay *= policy.backoff_multiplier;
  }
  delay = std::min(delay, cap);
  return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

std::uint32_t ComputeRetryAttemptsRemaining(const std::uint32_t max_attempts,
                                            const std::uint32_t attempts_used_total) {
  if (attempts_used_total >= max_attempts) {
    return 0U;
  }
  return max_attempts - attempts_used_total;
}

Sleeper ThreadSleeper() {
  return [](const std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
  };
}

RetryAttemptResult ExecuteWithRetry(
    const RetryPolicy& policy, const std::function<bool(registry::RegistryError&)>& operation,
    const std::function<void(std::uint32_t, const registry::RegistryError&,
                             std::chrono::milliseconds)>& on_retry,
    const Sleeper& sleeper, const StopPredicate& should_stop) {
  RetryAttemptResult result;

  while (ComputeRetryAttemptsRemaining(policy.max_attempts, result.attempts_used_total) > 0U) {
    ++result.attempts_used_total;
    registry::RegistryError error;
    if (operation(error)) {
      result.succeeded = true;
      result.last_error = registry::RegistryError{};
      return result;
    }
    result.last_error = error;

    if (!registry::IsTransient(error.code) ||
        ComputeRetryAttemptsRemaining(policy.max_attempts, result.attempts_used_total) == 0U) {
      return result;
    }

    const std::chrono::milliseconds backoff = ComputeBackoff(policy, result.attempts_used_total);
    if (on_retry) {
      on_retry(result.attempts_used_total, error, backoff);
    }
    if (should_stop && should_stop()) {
      result.cancelled = true;
      return result;
    }
    if (sleeper) {
      sleeper(backoff);
    }
    if (should_stop && should_stop()) {
      result.cancelled = true;
      return result;
    }
  }

  return result;
}

} // namespace modelpush::upload
