#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "internal/capability/execution.hpp"
#include "internal/supervisor/output_broadcast.hpp"
#include "internal/util/cancellation.hpp"

namespace meshdeploy::supervisor {

struct SupervisorOptions {
  std::size_t               output_buffer_lines{4096};
  std::string               ready_marker{"ready"};
  spdlog::level::level_enum unobserved_output_level{spdlog::level::info};
};

/*
  Owns the running process of one service.

  The process announces that every sink is bound by printing a line that
  starts with the ready marker on stdout; that line is consumed here and not
  broadcast. Start() then lets it dial its peers.

  Created through Create() because the executor callbacks hold a weak
  reference back to the supervisor. No lock is held while calling the
  executor.
*/
class ProcessSupervisor : public std::enable_shared_from_this<ProcessSupervisor> {
 public:
  // (service id, exit code, whether a stop had been requested)
  using ExitListener = std::function<void(const std::string&, int, bool)>;

  static std::shared_ptr<ProcessSupervisor> Create(std::string service_id, std::shared_ptr<capability::ExecutionCapability> executor,
                                                   SupervisorOptions options = {});

  ProcessSupervisor(const ProcessSupervisor&)            = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  const std::string& ServiceId() const {
    return service_id_;
  }

  // Throws whatever the executor throws; the process may exit before this returns.
  void Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact, const capability::LaunchRequest& request);

  /*
    Blocks until the ready line arrives. Throws util::ProcessCrash if the
    process exits first and util::Cancelled on timeout or cancellation.
  */
  void AwaitListening(std::chrono::milliseconds timeout, const util::CancellationToken& token);

  bool Listening() const;

  // Connect sub-phase signal.
  void Start();

  /*
    Graceful stop, escalating to a kill after `grace`. Returns the exit code,
    or nullopt if the process outlived the kill timeout as well.
  */
  std::optional<int> Stop(std::chrono::milliseconds grace, std::chrono::milliseconds kill_timeout);

  bool StopRequested() const;

  bool Exited() const;

  // Throws util::StillRunning when `wait` is false and the process has not exited.
  int ExitCode(bool wait);

  std::optional<int> WaitExit(std::chrono::milliseconds timeout);

  std::unique_ptr<OutputSubscription> Subscribe(OutputFilter filter = {});

  void SetExitListener(ExitListener listener);

  void DetachExitListener();

  std::string Describe() const;

 private:
  ProcessSupervisor(std::string service_id, std::shared_ptr<capability::ExecutionCapability> executor, SupervisorOptions options);

  void OnLine(capability::OutputChannel channel, const std::string& line);
  void OnExit(int exit_code);

  std::shared_ptr<capability::ProcessHandle> HandleOrThrow(const char* operation) const;

  const std::string                                 service_id_;
  std::shared_ptr<capability::ExecutionCapability> executor_;
  const SupervisorOptions                           options_;
  std::shared_ptr<OutputBroadcast>                  output_;

  mutable std::mutex                         mutex_;
  std::condition_variable                    cv_;
  std::shared_ptr<capability::ProcessHandle> handle_;
  bool                                       listening_{false};
  bool                                       stop_requested_{false};
  std::optional<int>                         exit_code_;
  ExitListener                               exit_listener_;
};

} // namespace meshdeploy::supervisor
