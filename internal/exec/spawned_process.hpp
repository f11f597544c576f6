#pragma once

#include <memory>
#include <string>
#include <utility>

#include "internal/capability/execution.hpp"
#include "internal/exec/process_runner.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::exec {

// Process handle for services started through a ProcessRunner.
class SpawnedProcess : public capability::ProcessHandle {
 public:
  SpawnedProcess(std::string service_id, std::string host_id, bool remote, std::string location, std::shared_ptr<ChildProcess> child)
      : service_id_(std::move(service_id)),
        host_id_(std::move(host_id)),
        remote_(remote),
        location_(std::move(location)),
        child_(std::move(child)) {
  }

  std::string Describe() const override {
    return service_id_ + "@" + host_id_ + " pid=" + std::to_string(child_->Pid()) + " dir=" + location_;
  }

  const std::string& ServiceId() const {
    return service_id_;
  }

  bool Remote() const {
    return remote_;
  }

  // Working directory on the host the process runs on.
  const std::string& Location() const {
    return location_;
  }

  ChildProcess& Child() {
    return *child_;
  }

  // The connect sub-phase is announced with a "start" line on stdin.
  void SendStartLine() {
    if (!child_->WriteStdin("start\n")) {
      throw util::ProcessCrash(service_id_, child_->ExitCode().value_or(-1), "stdin of " + service_id_ + " is closed");
    }
  }

 private:
  const std::string             service_id_;
  const std::string             host_id_;
  const bool                    remote_;
  const std::string             location_;
  std::shared_ptr<ChildProcess> child_;
};

inline SpawnedProcess& AsSpawned(capability::ProcessHandle& process) {
  auto* spawned = dynamic_cast<SpawnedProcess*>(&process);
  if (!spawned) {
    throw util::InvalidState("process " + process.Describe() + " was not started by this executor");
  }
  return *spawned;
}

} // namespace meshdeploy::exec
