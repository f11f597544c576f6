#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/capability/execution.hpp"
#include "internal/util/time.hpp"

namespace meshdeploy::supervisor {

struct OutputLine {
  std::uint64_t             sequence = 0;
  capability::OutputChannel channel  = capability::OutputChannel::kStdout;
  std::string               text;
  util::TimePoint           time;
};

// Empty fields match everything.
struct OutputFilter {
  std::optional<capability::OutputChannel> channel;
  std::string                              prefix;

  bool Matches(const OutputLine& line) const;
};

class OutputBroadcast;

/*
  A reader registered on one service's output. Sees every matching line
  published after it was created and nothing from before. Cancelled on
  destruction.
*/
class OutputSubscription {
 public:
  OutputSubscription(std::shared_ptr<OutputBroadcast> source, std::uint64_t id, std::uint64_t cursor, OutputFilter filter);
  ~OutputSubscription();

  OutputSubscription(const OutputSubscription&)            = delete;
  OutputSubscription& operator=(const OutputSubscription&) = delete;

  /*
    Next matching line. Returns nullopt on timeout, after Cancel, or once the
    stream is closed and drained; Ended() tells those cases apart.
  */
  std::optional<OutputLine> Next(std::chrono::milliseconds timeout);

  bool Ended() const;

  // Lines that were evicted before this reader got to them.
  std::uint64_t Dropped() const;

  void Cancel();

 private:
  std::shared_ptr<OutputBroadcast> source_;
  const std::uint64_t              id_;
  std::uint64_t                    cursor_;
  const OutputFilter               filter_;
  std::uint64_t                    dropped_{0};
  bool                             ended_{false};
};

/*
  Fan-out of a process's output lines to any number of independent readers.

  Lines are kept in a bounded ring; the oldest lines are evicted once
  `capacity` is reached. When nobody is subscribed each line is handed to the
  fallback sink instead, so output is never silently discarded.
*/
class OutputBroadcast : public std::enable_shared_from_this<OutputBroadcast> {
 public:
  using FallbackSink = std::function<void(const OutputLine&)>;

  static std::shared_ptr<OutputBroadcast> Create(std::size_t capacity, FallbackSink fallback = {});

  void Publish(capability::OutputChannel channel, const std::string& text);

  // No more lines will arrive; readers drain what is buffered, then end.
  void Close();

  bool Closed() const;

  std::unique_ptr<OutputSubscription> Subscribe(OutputFilter filter = {});

  std::size_t Subscribers() const;

  std::uint64_t Published() const;

 private:
  friend class OutputSubscription;

  OutputBroadcast(std::size_t capacity, FallbackSink fallback);

  enum class ReadResult { kLine, kTimeout, kCancelled, kEnded };

  ReadResult Read(std::uint64_t id, std::uint64_t& cursor, const OutputFilter& filter, std::chrono::milliseconds timeout, OutputLine& out,
                  std::uint64_t& dropped);
  void       Unsubscribe(std::uint64_t id);

  const std::size_t  capacity_;
  const FallbackSink fallback_;

  mutable std::mutex               mutex_;
  std::condition_variable          cv_;
  std::deque<OutputLine>           lines_;
  std::uint64_t                    next_sequence_{1};
  std::map<std::uint64_t, bool>    subscribers_;  // id -> cancelled
  std::uint64_t                    next_subscriber_{1};
  bool                             closed_{false};
};

} // namespace meshdeploy::supervisor
