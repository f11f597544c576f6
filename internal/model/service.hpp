#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/port.hpp"
#include "internal/model/state_machine.hpp"

namespace meshdeploy::model {

class Host;

/*
  kManaged services are built, placed, launched and stopped by the
  deployment. kExternal services run outside its control (a client on the
  operator machine, a third-party process): they only declare source ports,
  and their resolved endpoints are read back through Deployment::Wiring.
*/
enum class ServiceKind : std::uint8_t {
  kManaged  = 0,
  kExternal = 1,
};

constexpr std::string_view ToString(ServiceKind kind) {
  return kind == ServiceKind::kExternal ? "external" : "managed";
}

struct ServiceDecl {
  std::string                id;
  std::string                host_id;
  std::string                source_ref;
  std::vector<PortDecl>      ports;
  std::vector<std::string>   args;
  ServiceKind                kind = ServiceKind::kManaged;
  // Opened to the internet on the service's host for its whole lifetime.
  std::vector<std::uint16_t> external_ports;
};

/*
  Executable unit bound to a host.

  The service does not own its host; both are owned by the deployment and the
  host outlives every service that references it. Port names keep their
  declaration order.
*/
class Service {
 public:
  Service(std::string deployment_id, ServiceDecl decl, Host* host);

  Service(const Service&)            = delete;
  Service& operator=(const Service&) = delete;

  const std::string& Id() const {
    return id_;
  }

  const std::string& SourceRef() const {
    return source_ref_;
  }

  const std::vector<std::string>& Args() const {
    return args_;
  }

  ServiceKind Kind() const {
    return kind_;
  }

  bool IsExternal() const {
    return kind_ == ServiceKind::kExternal;
  }

  const std::vector<std::uint16_t>& ExternalPorts() const {
    return external_ports_;
  }

  Host& GetHost() const {
    return *host_;
  }

  // Throws util::DeclarationError for a merged source, a duplicate name or a
  // sink on an external service.
  void AddPort(const PortDecl& decl);

  // Throws util::DeclarationError if `name` was never declared.
  PortRef GetPort(const std::string& name) const;

  std::optional<Port> FindPort(const std::string& name) const;

  std::vector<Port> Ports() const;

  ServiceState State() const;

  // Throws util::InvalidState on an illegal transition.
  void TransitionTo(ServiceState next);

  // Like TransitionTo but returns false instead of throwing.
  bool TryTransitionTo(ServiceState next);

 private:
  const std::string              deployment_id_;
  const std::string              id_;
  const std::string              source_ref_;
  const std::vector<std::string> args_;
  const ServiceKind              kind_;
  const std::vector<std::uint16_t> external_ports_;
  Host*                          host_;

  mutable std::mutex          mutex_;
  std::vector<std::string>    port_order_;
  std::map<std::string, Port> ports_;
  ServiceState                state_{ServiceState::kDeclared};
};

} // namespace meshdeploy::model
