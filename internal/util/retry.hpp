#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::util {

/*
  Bounded exponential backoff.

  Attempt n (1-based) that fails retryably sleeps
  min(initial_backoff * multiplier^(n-1), max_backoff) before attempt n+1.
*/
struct RetryPolicy {
  std::uint32_t             max_attempts{5};
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{30000};
  double                    multiplier{2.0};

  std::chrono::milliseconds BackoffFor(std::uint32_t attempt) const {
    double delay = static_cast<double>(initial_backoff.count());
    for (std::uint32_t i = 1; i < attempt; ++i) {
      delay *= multiplier;
      if (delay >= static_cast<double>(max_backoff.count())) break;
    }
    return std::min(std::chrono::milliseconds(static_cast<std::int64_t>(delay)), max_backoff);
  }
};

/*
  Runs `fn(attempt)` until it succeeds, throws a non-retryable error, or the
  attempt budget is exhausted. Only ProvisionError with retryable() set is
  retried; every other exception propagates on the first occurrence.

  `on_retry(attempt, error, delay)` is invoked before each backoff sleep.
*/
template <typename Fn>
auto RetryWithBackoff(const RetryPolicy& policy, const CancellationToken& token, const std::string& what, Fn&& fn,
                      const std::function<void(std::uint32_t, const ProvisionError&, std::chrono::milliseconds)>& on_retry = {})
    -> decltype(fn(std::uint32_t{1})) {
  const std::uint32_t attempts = std::max<std::uint32_t>(policy.max_attempts, 1);

  for (std::uint32_t attempt = 1;; ++attempt) {
    token.ThrowIfCancelled(what);
    try {
      return fn(attempt);
    } catch (const ProvisionError& e) {
      if (!e.retryable() || attempt >= attempts) {
        throw;
      }
      const auto delay = policy.BackoffFor(attempt);
      if (on_retry) on_retry(attempt, e, delay);
      if (!token.WaitFor(delay)) {
        throw Cancelled(what + ": " + token.Reason());
      }
    }
  }
}

} // namespace meshdeploy::util
