#include "internal/util/retry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace {

using meshdeploy::util::CancellationToken;
using meshdeploy::util::ProvisionError;
using meshdeploy::util::RetryPolicy;
using meshdeploy::util::RetryWithBackoff;
using namespace std::chrono_literals;

RetryPolicy FastPolicy(std::uint32_t attempts) {
  RetryPolicy policy;
  policy.max_attempts    = attempts;
  policy.initial_backoff = 1ms;
  policy.max_backoff     = 4ms;
  policy.multiplier      = 2.0;
  return policy;
}

void TestBackoffGrowsAndCaps() {
  RetryPolicy policy;
  policy.initial_backoff = 500ms;
  policy.max_backoff     = 3000ms;
  policy.multiplier      = 2.0;

  assert(policy.BackoffFor(1) == 500ms);
  assert(policy.BackoffFor(2) == 1000ms);
  assert(policy.BackoffFor(3) == 2000ms);
  assert(policy.BackoffFor(4) == 3000ms);
  assert(policy.BackoffFor(40) == 3000ms);
}

void TestRetryableErrorsAreRetriedUntilSuccess() {
  CancellationToken          token;
  std::vector<std::uint32_t> retried;
  const auto result = RetryWithBackoff(
      FastPolicy(5), token, "flaky",
      [](std::uint32_t attempt) {
        if (attempt < 3) throw ProvisionError("rate limited", true);
        return attempt;
      },
      [&](std::uint32_t attempt, const ProvisionError&, std::chrono::milliseconds) { retried.push_back(attempt); });

  assert(result == 3);
  assert((retried == std::vector<std::uint32_t>{1, 2}));
}

void TestFatalErrorIsNotRetried() {
  CancellationToken token;
  int               calls = 0;
  try {
    RetryWithBackoff(FastPolicy(5), token, "fatal", [&](std::uint32_t) -> int {
      ++calls;
      throw ProvisionError("unauthorized", false);
    });
    assert(false);
  } catch (const ProvisionError& e) {
    assert(!e.retryable());
  }
  assert(calls == 1);
}

void TestAttemptBudgetIsHonoured() {
  CancellationToken token;
  int               calls = 0;
  try {
    RetryWithBackoff(FastPolicy(3), token, "exhausted", [&](std::uint32_t) -> int {
      ++calls;
      throw ProvisionError("quota", true);
    });
    assert(false);
  } catch (const ProvisionError& e) {
    assert(e.retryable());
  }
  assert(calls == 3);
}

void TestCancellationInterruptsBackoff() {
  CancellationToken token;
  RetryPolicy       policy = FastPolicy(10);
  policy.initial_backoff   = 10s;
  policy.max_backoff       = 10s;

  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(20ms);
    token.Cancel("operator abort");
  });

  const auto started = std::chrono::steady_clock::now();
  try {
    RetryWithBackoff(policy, token, "slow", [](std::uint32_t) -> int { throw ProvisionError("busy", true); });
    assert(false);
  } catch (const meshdeploy::util::Cancelled& e) {
    assert(std::string(e.what()).find("operator abort") != std::string::npos);
  }
  canceller.join();
  assert(std::chrono::steady_clock::now() - started < 5s);
}

void TestTokenDeadline() {
  auto token = CancellationToken::WithTimeout(10ms);
  assert(!token.IsCancelled());
  assert(token.Remaining().has_value());
  assert(!token.WaitFor(1s));
  assert(token.IsCancelled());

  CancellationToken unbounded;
  assert(!unbounded.Remaining().has_value());
  assert(unbounded.WaitFor(1ms));
  unbounded.Cancel("first");
  unbounded.Cancel("second");
  assert(unbounded.Reason() == "first");
}

} // namespace

int main() {
  TestBackoffGrowsAndCaps();
  TestRetryableErrorsAreRetriedUntilSuccess();
  TestFatalErrorIsNotRetried();
  TestAttemptBudgetIsHonoured();
  TestCancellationInterruptsBackoff();
  TestTokenDeadline();

  std::cout << "meshdeploy_unit_retry: pass\n";
  return 0;
}
