#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/capability/execution.hpp"
#include "internal/exec/process_runner.hpp"

namespace meshdeploy::exec {

struct LocalExecutorOptions {
  std::filesystem::path work_root{"/tmp/meshdeploy"};
};

/*
  Runs services on the operator machine.

  Each service gets <work_root>/<deployment>/<service>/ holding a copy of the
  artifact and wiring.json. The process is started in that directory with
  MESHDEPLOY_CONFIG pointing at the wiring file.
*/
class LocalExecutor : public capability::ExecutionCapability {
 public:
  explicit LocalExecutor(LocalExecutorOptions options, std::shared_ptr<ProcessRunner> runner = nullptr);

  void PlaceArtifact(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                     const model::ServiceWiring& wiring) override;

  std::shared_ptr<capability::ProcessHandle> Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                                    const capability::LaunchRequest& request, capability::ProcessObserver observer) override;

  void Signal(capability::ProcessHandle& process, capability::ProcessSignal signal) override;

  std::filesystem::path ServiceDirectory(const std::string& deployment_id, const std::string& service_id) const;

 private:
  const LocalExecutorOptions     options_;
  std::shared_ptr<ProcessRunner> runner_;
};

} // namespace meshdeploy::exec
