#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/capability/network.hpp"
#include "internal/exec/process_runner.hpp"
#include "internal/exec/ssh_command.hpp"

namespace meshdeploy::providers {

struct SshNetworkOptions {
  exec::SshOptions          ssh;
  // A forward that has not failed within this window is considered up.
  std::chrono::milliseconds tunnel_settle{750};
  std::chrono::milliseconds close_timeout{3000};
};

/*
  Network operations for machines reached over ssh.

  Tunnels are ssh port forwards held open by a background ssh session:
  -L when the source is the operator machine, -R when the destination is.
  Static machines have no firewall API, so ingress rules are only recorded
  and logged for the operator.
*/
class SshNetwork : public capability::NetworkCapability {
 public:
  explicit SshNetwork(SshNetworkOptions options, std::shared_ptr<exec::ProcessRunner> runner = nullptr);
  ~SshNetwork() override;

  capability::NetworkResource OpenIngress(const capability::IngressRule& rule) override;
  capability::TunnelResult    OpenTunnel(const capability::TunnelRequest& request) override;
  void                        Close(const capability::NetworkResource& resource) override;

  std::size_t OpenTunnels() const;

 private:
  std::string NextId(const std::string& kind);

  const SshNetworkOptions              options_;
  std::shared_ptr<exec::ProcessRunner> runner_;

  mutable std::mutex                                         mutex_;
  std::uint64_t                                              next_id_{1};
  std::map<std::string, std::shared_ptr<exec::ChildProcess>> tunnels_;
};

} // namespace meshdeploy::providers
