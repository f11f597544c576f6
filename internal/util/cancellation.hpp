#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace meshdeploy::util {

/*
  Cooperative cancellation shared between the coordinating flow and the
  tasks it fans out.

  A token is cancelled either explicitly (Cancel) or implicitly once its
  deadline passes. Long waits use WaitFor so that a cancellation wakes them
  immediately instead of after the full delay.
*/
class CancellationToken {
 public:
  using Clock = std::chrono::steady_clock;

  CancellationToken();

  static CancellationToken WithTimeout(std::chrono::milliseconds timeout);

  void Cancel(const std::string& reason = "cancelled");

  bool IsCancelled() const;

  // Throws util::Cancelled naming `what` if the token is cancelled.
  void ThrowIfCancelled(const std::string& what) const;

  // Sleeps up to `duration`. Returns false if the token was cancelled first.
  bool WaitFor(std::chrono::milliseconds duration) const;

  std::string Reason() const;

  // Time left before the deadline, if one is set.
  std::optional<std::chrono::milliseconds> Remaining() const;

 private:
  struct State {
    mutable std::mutex               mutex;
    std::condition_variable          cv;
    bool                             cancelled = false;
    std::string                      reason;
    std::optional<Clock::time_point> deadline;
  };

  std::shared_ptr<State> state_;
};

} // namespace meshdeploy::util
