#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/capability/execution.hpp"
#include "internal/exec/process_runner.hpp"
#include "internal/exec/ssh_command.hpp"

namespace meshdeploy::exec {

struct SshExecutorOptions {
  SshOptions                ssh;
  std::string               remote_root{"/tmp/meshdeploy"};
  std::filesystem::path     staging_root{"/tmp/meshdeploy-staging"};
  std::chrono::milliseconds command_timeout{120000};
};

/*
  Runs services on remote hosts over ssh.

  Placement creates <remote_root>/<deployment>/<service>/ and copies the
  artifact and wiring.json there with scp. The launched ssh session keeps
  the remote process's stdio attached; the remote shell records its pid in
  .pid so stop and kill reach the real process rather than the session.
*/
class SshExecutor : public capability::ExecutionCapability {
 public:
  explicit SshExecutor(SshExecutorOptions options, std::shared_ptr<ProcessRunner> runner = nullptr);

  void PlaceArtifact(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                     const model::ServiceWiring& wiring) override;

  std::shared_ptr<capability::ProcessHandle> Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                                    const capability::LaunchRequest& request, capability::ProcessObserver observer) override;

  void Signal(capability::ProcessHandle& process, capability::ProcessSignal signal) override;

  std::string RemoteDirectory(const std::string& deployment_id, const std::string& service_id) const;

 private:
  struct Remote;

  // Runs a short command to completion; throws util::PlacementError on failure.
  void RunChecked(const std::vector<std::string>& argv, const std::string& what) const;

  // Best effort remote `kill -<signal>` of the recorded pid.
  bool KillRemote(const capability::ProvisionedHandle& host, const std::string& dir, const char* signal) const;

  const SshExecutorOptions       options_;
  std::shared_ptr<ProcessRunner> runner_;
};

} // namespace meshdeploy::exec
