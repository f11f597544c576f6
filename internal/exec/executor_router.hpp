#pragma once

#include <memory>

#include "internal/capability/execution.hpp"

namespace meshdeploy::exec {

// Sends local hosts to one executor and everything else to another.
class ExecutorRouter : public capability::ExecutionCapability {
 public:
  ExecutorRouter(std::shared_ptr<capability::ExecutionCapability> local, std::shared_ptr<capability::ExecutionCapability> remote);

  void PlaceArtifact(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                     const model::ServiceWiring& wiring) override;

  std::shared_ptr<capability::ProcessHandle> Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                                    const capability::LaunchRequest& request, capability::ProcessObserver observer) override;

  void Signal(capability::ProcessHandle& process, capability::ProcessSignal signal) override;

 private:
  capability::ExecutionCapability& For(const capability::ProvisionedHandle& host) const;

  std::shared_ptr<capability::ExecutionCapability> local_;
  std::shared_ptr<capability::ExecutionCapability> remote_;
};

} // namespace meshdeploy::exec
