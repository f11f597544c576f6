#include "internal/exec/executor_router.hpp"

#include "internal/exec/spawned_process.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::exec {

ExecutorRouter::ExecutorRouter(std::shared_ptr<capability::ExecutionCapability> local, std::shared_ptr<capability::ExecutionCapability> remote)
    : local_(std::move(local)), remote_(std::move(remote)) {
}

capability::ExecutionCapability& ExecutorRouter::For(const capability::ProvisionedHandle& host) const {
  const auto& executor = host.local ? local_ : remote_;
  if (!executor) {
    throw util::PlacementError(std::string("no ") + (host.local ? "local" : "remote") + " executor for host " + host.host_id);
  }
  return *executor;
}

void ExecutorRouter::PlaceArtifact(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                   const model::ServiceWiring& wiring) {
  For(host).PlaceArtifact(host, artifact, wiring);
}

std::shared_ptr<capability::ProcessHandle> ExecutorRouter::Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                                                  const capability::LaunchRequest& request, capability::ProcessObserver observer) {
  return For(host).Launch(host, artifact, request, std::move(observer));
}

void ExecutorRouter::Signal(capability::ProcessHandle& process, capability::ProcessSignal signal) {
  auto& executor = AsSpawned(process).Remote() ? remote_ : local_;
  if (!executor) {
    throw util::InvalidState("no executor owns " + process.Describe());
  }
  executor->Signal(process, signal);
}

} // namespace meshdeploy::exec
