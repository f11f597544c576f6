#include "cancellation.hpp"

#include "internal/util/errors.hpp"

namespace meshdeploy::util {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

CancellationToken CancellationToken::WithTimeout(std::chrono::milliseconds timeout) {
  CancellationToken token;
  if (timeout.count() > 0) {
    token.state_->deadline = Clock::now() + timeout;
  }
  return token;
}

void CancellationToken::Cancel(const std::string& reason) {
  {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) return;
    state_->cancelled = true;
    state_->reason    = reason;
  }
  state_->cv.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  if (state_->cancelled) return true;
  return state_->deadline && Clock::now() >= *state_->deadline;
}

void CancellationToken::ThrowIfCancelled(const std::string& what) const {
  if (IsCancelled()) {
    throw Cancelled(what + ": " + Reason());
  }
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  std::unique_lock lock(state_->mutex);
  auto             until = Clock::now() + duration;
  if (state_->deadline && *state_->deadline < until) {
    until = *state_->deadline;
  }

  state_->cv.wait_until(lock, until, [&] { return state_->cancelled; });

  if (state_->cancelled) return false;
  return !(state_->deadline && Clock::now() >= *state_->deadline);
}

std::string CancellationToken::Reason() const {
  std::lock_guard lock(state_->mutex);
  if (state_->cancelled) return state_->reason;
  if (state_->deadline && Clock::now() >= *state_->deadline) return "deadline exceeded";
  return {};
}

std::optional<std::chrono::milliseconds> CancellationToken::Remaining() const {
  std::lock_guard lock(state_->mutex);
  if (!state_->deadline) return std::nullopt;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*state_->deadline - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // namespace meshdeploy::util
