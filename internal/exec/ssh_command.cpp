#include "internal/exec/ssh_command.hpp"

#include "internal/util/errors.hpp"

namespace meshdeploy::exec {
namespace {

void AppendCommon(std::vector<std::string>& argv, const SshOptions& options, const capability::ProvisionedHandle& host,
                  const char* port_flag) {
  argv.insert(argv.end(), {"-o", "BatchMode=yes"});
  const auto port = host.Attribute("ssh_port");
  if (!port.empty()) {
    argv.insert(argv.end(), {port_flag, port});
  }
  const auto identity = host.Attribute("identity_file");
  if (!identity.empty()) {
    argv.insert(argv.end(), {"-i", identity});
  }
  argv.insert(argv.end(), options.extra_options.begin(), options.extra_options.end());
}

} // namespace

std::string SshTarget(const capability::ProvisionedHandle& host) {
  const auto& address = host.public_address.empty() ? host.private_address : host.public_address;
  if (address.empty()) {
    throw util::NetworkError("host " + host.host_id + " has no address reachable over ssh");
  }
  const auto user = host.Attribute("user");
  return user.empty() ? address : user + "@" + address;
}

std::vector<std::string> SshArgv(const SshOptions& options, const capability::ProvisionedHandle& host, const std::string& remote_command) {
  std::vector<std::string> argv{options.ssh_binary};
  AppendCommon(argv, options, host, "-p");
  argv.push_back(SshTarget(host));
  argv.push_back(remote_command);
  return argv;
}

std::vector<std::string> SshForwardArgv(const SshOptions& options, const capability::ProvisionedHandle& host,
                                        const std::vector<std::string>& forward) {
  std::vector<std::string> argv{options.ssh_binary, "-N", "-o", "ExitOnForwardFailure=yes"};
  AppendCommon(argv, options, host, "-p");
  argv.insert(argv.end(), forward.begin(), forward.end());
  argv.push_back(SshTarget(host));
  return argv;
}

std::vector<std::string> ScpArgv(const SshOptions& options, const capability::ProvisionedHandle& host, const std::string& local_path,
                                 const std::string& remote_path) {
  std::vector<std::string> argv{options.scp_binary, "-q"};
  AppendCommon(argv, options, host, "-P");
  argv.push_back(local_path);
  argv.push_back(SshTarget(host) + ":" + remote_path);
  return argv;
}

} // namespace meshdeploy::exec
