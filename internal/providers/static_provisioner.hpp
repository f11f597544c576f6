#pragma once

#include <chrono>
#include <memory>

#include "internal/capability/provisioning.hpp"
#include "internal/exec/process_runner.hpp"
#include "internal/exec/ssh_command.hpp"

namespace meshdeploy::providers {

struct StaticProvisionerOptions {
  exec::SshOptions          ssh;
  bool                      probe{true};
  std::chrono::milliseconds probe_timeout{15000};
};

/*
  Machines that already exist and are reached over ssh.

  Host properties: "address" (public), "private_address", "user",
  "ssh_port", "identity_file". Provisioning validates the properties and,
  when probing is enabled, runs `ssh <host> true`; a failed connection is
  reported as retryable so the caller's backoff covers machines that are
  still booting.
*/
class StaticProvisioner : public capability::ProvisioningCapability {
 public:
  explicit StaticProvisioner(StaticProvisionerOptions options, std::shared_ptr<exec::ProcessRunner> runner = nullptr);

  capability::ProvisionedHandle Provision(const capability::ProvisionRequest& request) override;
  void                          Deprovision(const capability::ProvisionedHandle& handle) override;

 private:
  void Probe(const capability::ProvisionedHandle& handle);

  const StaticProvisionerOptions       options_;
  std::shared_ptr<exec::ProcessRunner> runner_;
};

} // namespace meshdeploy::providers
