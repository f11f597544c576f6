#include "internal/supervisor/process_supervisor.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::supervisor {

std::shared_ptr<ProcessSupervisor> ProcessSupervisor::Create(std::string service_id, std::shared_ptr<capability::ExecutionCapability> executor,
                                                             SupervisorOptions options) {
  return std::shared_ptr<ProcessSupervisor>(new ProcessSupervisor(std::move(service_id), std::move(executor), std::move(options)));
}

ProcessSupervisor::ProcessSupervisor(std::string service_id, std::shared_ptr<capability::ExecutionCapability> executor, SupervisorOptions options)
    : service_id_(std::move(service_id)), executor_(std::move(executor)), options_(std::move(options)) {
  const auto id    = service_id_;
  const auto level = options_.unobserved_output_level;
  output_          = OutputBroadcast::Create(options_.output_buffer_lines, [id, level](const OutputLine& line) {
    observability::LogServiceOutput(level, id, capability::ToString(line.channel), line.text);
  });
}

void ProcessSupervisor::Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact, const capability::LaunchRequest& request) {
  {
    std::lock_guard lock(mutex_);
    if (handle_ || exit_code_) {
      throw util::InvalidState("service " + service_id_ + " was already launched");
    }
  }

  std::weak_ptr<ProcessSupervisor> weak = shared_from_this();
  capability::ProcessObserver      observer;
  observer.on_line = [weak](capability::OutputChannel channel, const std::string& line) {
    if (auto self = weak.lock()) {
      self->OnLine(channel, line);
    }
  };
  observer.on_exit = [weak](int exit_code) {
    if (auto self = weak.lock()) {
      self->OnExit(exit_code);
    }
  };

  auto handle = executor_->Launch(host, artifact, request, std::move(observer));

  std::lock_guard lock(mutex_);
  handle_ = std::move(handle);
  MESHDEPLOY_LOG_DEBUG("Process launched", {observability::StringField("service", service_id_), observability::StringField("process", handle_->Describe())});
}

void ProcessSupervisor::OnLine(capability::OutputChannel channel, const std::string& line) {
  if (channel == capability::OutputChannel::kStdout) {
    std::unique_lock lock(mutex_);
    if (!listening_ && line.compare(0, options_.ready_marker.size(), options_.ready_marker) == 0) {
      listening_ = true;
      lock.unlock();
      cv_.notify_all();
      return;
    }
  }
  output_->Publish(channel, line);
}

void ProcessSupervisor::OnExit(int exit_code) {
  ExitListener listener;
  bool         stop_requested = false;
  {
    std::lock_guard lock(mutex_);
    if (exit_code_) {
      return;
    }
    exit_code_     = exit_code;
    stop_requested = stop_requested_;
    listener       = exit_listener_;
  }
  cv_.notify_all();
  output_->Close();

  if (stop_requested) {
    MESHDEPLOY_LOG_DEBUG("Process exited", {observability::StringField("service", service_id_), observability::IntField("exit_code", exit_code)});
  } else if (exit_code != 0) {
    MESHDEPLOY_LOG_WARN("Process exited unexpectedly", {observability::StringField("service", service_id_), observability::IntField("exit_code", exit_code)});
  } else {
    MESHDEPLOY_LOG_INFO("Process completed", {observability::StringField("service", service_id_)});
  }

  if (listener) {
    listener(service_id_, exit_code, stop_requested);
  }
}

void ProcessSupervisor::AwaitListening(std::chrono::milliseconds timeout, const util::CancellationToken& token) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const auto slice    = std::chrono::milliseconds(50);

  std::unique_lock lock(mutex_);
  while (true) {
    if (listening_) {
      return;
    }
    if (exit_code_) {
      throw util::ProcessCrash(service_id_, *exit_code_,
                               "service " + service_id_ + " exited with status " + std::to_string(*exit_code_) + " before it was listening");
    }
    if (token.IsCancelled()) {
      throw util::Cancelled("waiting for " + service_id_ + " to listen: " + token.Reason());
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw util::Cancelled("service " + service_id_ + " did not report listening within " + std::to_string(timeout.count()) + "ms");
    }
    cv_.wait_until(lock, std::min(deadline, now + slice));
  }
}

bool ProcessSupervisor::Listening() const {
  std::lock_guard lock(mutex_);
  return listening_;
}

std::shared_ptr<capability::ProcessHandle> ProcessSupervisor::HandleOrThrow(const char* operation) const {
  std::lock_guard lock(mutex_);
  if (!handle_) {
    throw util::InvalidState(std::string(operation) + ": service " + service_id_ + " was never launched");
  }
  return handle_;
}

void ProcessSupervisor::Start() {
  auto handle = HandleOrThrow("start");
  {
    std::lock_guard lock(mutex_);
    if (exit_code_) {
      throw util::ProcessCrash(service_id_, *exit_code_, "service " + service_id_ + " exited before it was started");
    }
  }
  executor_->Signal(*handle, capability::ProcessSignal::kStart);
}

std::optional<int> ProcessSupervisor::Stop(std::chrono::milliseconds grace, std::chrono::milliseconds kill_timeout) {
  std::shared_ptr<capability::ProcessHandle> handle;
  {
    std::lock_guard lock(mutex_);
    if (exit_code_) {
      return exit_code_;
    }
    if (!handle_) {
      return std::nullopt;
    }
    stop_requested_ = true;
    handle          = handle_;
  }

  try {
    executor_->Signal(*handle, capability::ProcessSignal::kStop);
  } catch (const std::exception& e) {
    MESHDEPLOY_LOG_WARN("Graceful stop failed, killing", {observability::StringField("service", service_id_), observability::StringField("error", e.what())});
  }
  if (auto code = WaitExit(grace)) {
    return code;
  }

  MESHDEPLOY_LOG_WARN("Process ignored stop request, killing",
                      {observability::StringField("service", service_id_), observability::DurationField("grace", grace)});
  executor_->Signal(*handle, capability::ProcessSignal::kKill);
  return WaitExit(kill_timeout);
}

bool ProcessSupervisor::StopRequested() const {
  std::lock_guard lock(mutex_);
  return stop_requested_;
}

bool ProcessSupervisor::Exited() const {
  std::lock_guard lock(mutex_);
  return exit_code_.has_value();
}

int ProcessSupervisor::ExitCode(bool wait) {
  std::unique_lock lock(mutex_);
  if (!wait) {
    if (!exit_code_) {
      throw util::StillRunning("service " + service_id_ + " is still running");
    }
    return *exit_code_;
  }
  if (!handle_ && !exit_code_) {
    throw util::InvalidState("service " + service_id_ + " was never launched");
  }
  cv_.wait(lock, [this] { return exit_code_.has_value(); });
  return *exit_code_;
}

std::optional<int> ProcessSupervisor::WaitExit(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return exit_code_.has_value(); });
  return exit_code_;
}

std::unique_ptr<OutputSubscription> ProcessSupervisor::Subscribe(OutputFilter filter) {
  return output_->Subscribe(std::move(filter));
}

void ProcessSupervisor::SetExitListener(ExitListener listener) {
  std::lock_guard lock(mutex_);
  exit_listener_ = std::move(listener);
}

void ProcessSupervisor::DetachExitListener() {
  std::lock_guard lock(mutex_);
  exit_listener_ = nullptr;
}

std::string ProcessSupervisor::Describe() const {
  std::lock_guard lock(mutex_);
  return handle_ ? handle_->Describe() : service_id_ + " (not launched)";
}

} // namespace meshdeploy::supervisor
