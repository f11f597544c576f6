#pragma once

#include <string>
#include <vector>

#include "internal/capability/provisioning.hpp"

namespace meshdeploy::exec {

struct SshOptions {
  std::string              ssh_binary{"ssh"};
  std::string              scp_binary{"scp"};
  std::vector<std::string> extra_options;  // passed before the target, e.g. {"-o", "StrictHostKeyChecking=no"}
};

/*
  Address the operator machine uses to reach a provisioned host: the public
  address, then the private one. Handle attributes "user", "ssh_port" and
  "identity_file" refine the ssh invocation.
*/
std::string SshTarget(const capability::ProvisionedHandle& host);

// argv for `ssh [options] target command`.
std::vector<std::string> SshArgv(const SshOptions& options, const capability::ProvisionedHandle& host, const std::string& remote_command);

// argv for an ssh session that only holds a port forward, e.g. {"-L", "21000:10.0.0.5:22000"}.
std::vector<std::string> SshForwardArgv(const SshOptions& options, const capability::ProvisionedHandle& host,
                                        const std::vector<std::string>& forward);

// argv for copying a local file to `remote_path` on `host`.
std::vector<std::string> ScpArgv(const SshOptions& options, const capability::ProvisionedHandle& host, const std::string& local_path,
                                 const std::string& remote_path);

} // namespace meshdeploy::exec
