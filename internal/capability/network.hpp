#pragma once

#include <cstdint>
#include <string>

#include "internal/capability/provisioning.hpp"
#include "internal/model/endpoint.hpp"

namespace meshdeploy::capability {

// Allow `source_cidr` to reach `port` on `destination`.
struct IngressRule {
  std::string       deployment_id;
  ProvisionedHandle destination;
  std::uint16_t     port = 0;
  std::string       source_cidr;
};

// Make `destination_port` on `destination` reachable from `source`.
struct TunnelRequest {
  std::string       deployment_id;
  ProvisionedHandle source;
  ProvisionedHandle destination;
  std::uint16_t     destination_port = 0;
};

// Opaque record of something that must be closed at teardown.
struct NetworkResource {
  std::string id;
  std::string kind;  // "ingress" | "tunnel"
  std::string description;
};

struct TunnelResult {
  NetworkResource resource;
  model::Endpoint endpoint;  // as seen from the tunnel source
};

/*
  Firewall and tunnel operations needed by cross-network connections.
  Open* throw util::NetworkError.
*/
class NetworkCapability {
 public:
  virtual ~NetworkCapability() = default;

  virtual NetworkResource OpenIngress(const IngressRule& rule) = 0;
  virtual TunnelResult    OpenTunnel(const TunnelRequest& request) = 0;
  virtual void            Close(const NetworkResource& resource) = 0;
};

} // namespace meshdeploy::capability
