#include "internal/supervisor/output_broadcast.hpp"

#include <utility>

namespace meshdeploy::supervisor {

bool OutputFilter::Matches(const OutputLine& line) const {
  if (channel && *channel != line.channel) {
    return false;
  }
  return line.text.compare(0, prefix.size(), prefix) == 0;
}

// ------------------------------------------------------------
// OutputSubscription
// ------------------------------------------------------------

OutputSubscription::OutputSubscription(std::shared_ptr<OutputBroadcast> source, std::uint64_t id, std::uint64_t cursor, OutputFilter filter)
    : source_(std::move(source)), id_(id), cursor_(cursor), filter_(std::move(filter)) {
}

OutputSubscription::~OutputSubscription() {
  source_->Unsubscribe(id_);
}

std::optional<OutputLine> OutputSubscription::Next(std::chrono::milliseconds timeout) {
  if (ended_) {
    return std::nullopt;
  }

  OutputLine line;
  switch (source_->Read(id_, cursor_, filter_, timeout, line, dropped_)) {
    case OutputBroadcast::ReadResult::kLine:
      return line;
    case OutputBroadcast::ReadResult::kTimeout:
      return std::nullopt;
    case OutputBroadcast::ReadResult::kCancelled:
    case OutputBroadcast::ReadResult::kEnded:
      ended_ = true;
      return std::nullopt;
  }
  return std::nullopt;
}

bool OutputSubscription::Ended() const {
  return ended_;
}

std::uint64_t OutputSubscription::Dropped() const {
  return dropped_;
}

void OutputSubscription::Cancel() {
  std::lock_guard lock(source_->mutex_);
  auto it = source_->subscribers_.find(id_);
  if (it != source_->subscribers_.end()) {
    it->second = true;
  }
  source_->cv_.notify_all();
}

// ------------------------------------------------------------
// OutputBroadcast
// ------------------------------------------------------------

std::shared_ptr<OutputBroadcast> OutputBroadcast::Create(std::size_t capacity, FallbackSink fallback) {
  return std::shared_ptr<OutputBroadcast>(new OutputBroadcast(capacity, std::move(fallback)));
}

OutputBroadcast::OutputBroadcast(std::size_t capacity, FallbackSink fallback) : capacity_(capacity == 0 ? 1 : capacity), fallback_(std::move(fallback)) {
}

void OutputBroadcast::Publish(capability::OutputChannel channel, const std::string& text) {
  OutputLine line{0, channel, text, util::Now()};
  bool       unobserved = false;
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return;
    }
    line.sequence = next_sequence_++;
    if (subscribers_.empty()) {
      unobserved = true;
    } else {
      lines_.push_back(line);
      while (lines_.size() > capacity_) {
        lines_.pop_front();
      }
    }
  }

  if (unobserved) {
    if (fallback_) {
      fallback_(line);
    }
    return;
  }
  cv_.notify_all();
}

void OutputBroadcast::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool OutputBroadcast::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::unique_ptr<OutputSubscription> OutputBroadcast::Subscribe(OutputFilter filter) {
  std::lock_guard lock(mutex_);
  const auto      id = next_subscriber_++;
  subscribers_.emplace(id, false);
  return std::make_unique<OutputSubscription>(shared_from_this(), id, next_sequence_, std::move(filter));
}

std::size_t OutputBroadcast::Subscribers() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

std::uint64_t OutputBroadcast::Published() const {
  std::lock_guard lock(mutex_);
  return next_sequence_ - 1;
}

OutputBroadcast::ReadResult OutputBroadcast::Read(std::uint64_t id, std::uint64_t& cursor, const OutputFilter& filter, std::chrono::milliseconds timeout,
                                                  OutputLine& out, std::uint64_t& dropped) {
  std::unique_lock lock(mutex_);
  const auto       deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    auto sub = subscribers_.find(id);
    if (sub == subscribers_.end() || sub->second) {
      return ReadResult::kCancelled;
    }

    if (!lines_.empty() && lines_.front().sequence > cursor) {
      dropped += lines_.front().sequence - cursor;
      cursor = lines_.front().sequence;
    }
    for (const auto& line : lines_) {
      if (line.sequence < cursor) {
        continue;
      }
      cursor = line.sequence + 1;
      if (filter.Matches(line)) {
        out = line;
        return ReadResult::kLine;
      }
    }

    if (closed_) {
      return ReadResult::kEnded;
    }
    if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
      return ReadResult::kTimeout;
    }
  }
}

void OutputBroadcast::Unsubscribe(std::uint64_t id) {
  {
    std::lock_guard lock(mutex_);
    subscribers_.erase(id);
    if (subscribers_.empty()) {
      lines_.clear();
    }
  }
  cv_.notify_all();
}

} // namespace meshdeploy::supervisor
