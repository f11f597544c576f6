#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/capability/build.hpp"
#include "internal/capability/provisioning.hpp"
#include "internal/model/endpoint.hpp"

namespace meshdeploy::capability {

enum class OutputChannel : std::uint8_t {
  kStdout = 0,
  kStderr = 1,
};

constexpr std::string_view ToString(OutputChannel channel) {
  return channel == OutputChannel::kStderr ? "stderr" : "stdout";
}

enum class ProcessSignal : std::uint8_t {
  kStart = 0,  // connect sub-phase: the process may now dial its peers
  kStop  = 1,  // graceful termination request
  kKill  = 2,  // forced termination
};

struct LaunchRequest {
  std::string              deployment_id;
  std::string              service_id;
  std::vector<std::string> args;
};

/*
  Push-side of a launched process. The transport invokes on_line for every
  complete output line and on_exit exactly once with the numeric status
  (128 + signal number for signal deaths). Both may run on a transport owned
  thread, and may run before Launch returns.
*/
struct ProcessObserver {
  std::function<void(OutputChannel, const std::string&)> on_line;
  std::function<void(int)>                                on_exit;
};

class ProcessHandle {
 public:
  virtual ~ProcessHandle() = default;

  virtual std::string Describe() const = 0;
};

/*
  Transport that places artifacts on hosts and runs them.

  PlaceArtifact throws util::PlacementError. Launch starts the process; the
  process reports that its sinks are bound by printing a "ready" line.
*/
class ExecutionCapability {
 public:
  virtual ~ExecutionCapability() = default;

  virtual void PlaceArtifact(const ProvisionedHandle& host, const Artifact& artifact, const model::ServiceWiring& wiring) = 0;

  virtual std::shared_ptr<ProcessHandle> Launch(const ProvisionedHandle& host, const Artifact& artifact, const LaunchRequest& request,
                                                ProcessObserver observer) = 0;

  virtual void Signal(ProcessHandle& process, ProcessSignal signal) = 0;
};

} // namespace meshdeploy::capability
