#include "internal/model/service.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace meshdeploy::model {

Service::Service(std::string deployment_id, ServiceDecl decl, Host* host)
    : deployment_id_(std::move(deployment_id)),
      id_(std::move(decl.id)),
      source_ref_(std::move(decl.source_ref)),
      args_(std::move(decl.args)),
      kind_(decl.kind),
      external_ports_(std::move(decl.external_ports)),
      host_(host) {
  if (host_ == nullptr) {
    throw util::DeclarationError("service " + id_ + " has no host");
  }
  if (kind_ == ServiceKind::kManaged && source_ref_.empty()) {
    throw util::DeclarationError("service " + id_ + " has no source reference");
  }
  for (const auto port : external_ports_) {
    if (port == 0) {
      throw util::DeclarationError("service " + id_ + ": external port 0 is not a port");
    }
  }
  for (const auto& port : decl.ports) {
    AddPort(port);
  }
}

void Service::AddPort(const PortDecl& decl) {
  if (decl.name.empty()) {
    throw util::DeclarationError("service " + id_ + ": port name must not be empty");
  }
  if (decl.merged && decl.direction == PortDirection::kSource) {
    throw util::DeclarationError("service " + id_ + ": source port '" + decl.name + "' cannot be merged");
  }
  if (kind_ == ServiceKind::kExternal && decl.direction == PortDirection::kSink) {
    throw util::DeclarationError("service " + id_ + " is external and cannot accept connections on '" + decl.name + "'");
  }

  std::lock_guard lock(mutex_);
  if (ports_.contains(decl.name)) {
    throw util::DeclarationError("service " + id_ + ": port '" + decl.name + "' declared twice");
  }
  ports_.emplace(decl.name, Port{id_, decl.name, decl.direction, decl.merged});
  port_order_.push_back(decl.name);
}

PortRef Service::GetPort(const std::string& name) const {
  std::lock_guard lock(mutex_);
  if (!ports_.contains(name)) {
    throw util::DeclarationError("service " + id_ + " has no port '" + name + "'");
  }
  return PortRef{deployment_id_, id_, name};
}

std::optional<Port> Service::FindPort(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto it = ports_.find(name);
  if (it == ports_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Port> Service::Ports() const {
  std::lock_guard lock(mutex_);
  std::vector<Port> out;
  out.reserve(port_order_.size());
  for (const auto& name : port_order_) {
    out.push_back(ports_.at(name));
  }
  return out;
}

ServiceState Service::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void Service::TransitionTo(ServiceState next) {
  std::lock_guard lock(mutex_);
  if (!CanTransition(state_, next)) {
    throw util::InvalidState("service " + id_ + ": cannot go from " + std::string(ToString(state_)) + " to " + std::string(ToString(next)));
  }
  state_ = next;
}

bool Service::TryTransitionTo(ServiceState next) {
  std::lock_guard lock(mutex_);
  if (!CanTransition(state_, next)) {
    return false;
  }
  state_ = next;
  return true;
}

} // namespace meshdeploy::model
