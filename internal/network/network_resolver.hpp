#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/capability/network.hpp"
#include "internal/model/connection.hpp"
#include "internal/model/endpoint.hpp"
#include "internal/model/host.hpp"
#include "internal/model/service.hpp"
#include "internal/network/port_allocator.hpp"
#include "internal/util/cancellation.hpp"

namespace meshdeploy::network {

struct ResolverOptions {
  std::uint16_t base_port{21000};
  std::string   default_ingress_cidr{"0.0.0.0/0"};
  bool          unix_sockets_same_host{false};
  std::string   socket_dir{"/tmp"};
};

/*
  Turns declared connections into concrete endpoints.

  For every physical sub-connection the destination machine gets a fresh port
  and the pair of hosts is classified:
    same-host            -> loop-back (or a unix socket when enabled)
    same-private-network -> destination private address
    cross-network        -> destination public address plus an ingress rule,
                            or a tunnel when the destination has no public
                            address and one side is the operator machine

  Ports a service exposes to the internet are reserved on its machine before
  any connection is resolved, and get an ingress rule unless the host is the
  operator machine.

  Ingress rules and tunnels are recorded and released by ReleaseAll, which
  never throws.
*/
class NetworkResolver {
 public:
  NetworkResolver(std::string deployment_id, std::shared_ptr<capability::NetworkCapability> network, ResolverOptions options = {});

  NetworkResolver(const NetworkResolver&)            = delete;
  NetworkResolver& operator=(const NetworkResolver&) = delete;

  static model::Relationship Classify(const model::Host& a, const model::Host& b);

  // Ports are allocated per machine: every local host is the operator
  // machine, other hosts are told apart by address.
  static std::string MachineKey(const model::Host& host, const capability::ProvisionedHandle& handle);

  // One wiring per service in `services`, connected or not. Hosts must be
  // provisioned. Throws util::NetworkError, util::Cancelled.
  std::map<std::string, model::ServiceWiring> Resolve(const std::vector<model::Connection>& connections,
                                                      const std::map<std::string, const model::Service*>& services,
                                                      const util::CancellationToken& token);

  std::vector<capability::NetworkResource> Resources() const;

  // Returns one message per resource that failed to close.
  std::vector<std::string> ReleaseAll();

 private:
  struct Link {
    model::BindSpec bind;
    model::Endpoint endpoint;
  };

  Link ResolveLink(const model::Service& source, const model::Service& destination);
  void ExposePorts(const model::Service& service);
  void Track(const capability::NetworkResource& resource);

  const std::string                               deployment_id_;
  std::shared_ptr<capability::NetworkCapability> network_;
  const ResolverOptions                           options_;
  PortAllocator                                   ports_;

  mutable std::mutex                       mutex_;
  std::vector<capability::NetworkResource> resources_;
};

} // namespace meshdeploy::network
