#include "internal/network/network_resolver.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::network {

NetworkResolver::NetworkResolver(std::string deployment_id, std::shared_ptr<capability::NetworkCapability> network, ResolverOptions options)
    : deployment_id_(std::move(deployment_id)), network_(std::move(network)), options_(std::move(options)), ports_(options_.base_port) {
}

model::Relationship NetworkResolver::Classify(const model::Host& a, const model::Host& b) {
  return a.RelationshipTo(b);
}

std::string NetworkResolver::MachineKey(const model::Host& host, const capability::ProvisionedHandle& handle) {
  if (handle.local || host.GetLocality().kind == model::LocalityKind::kLocal) {
    return "local";
  }
  if (!handle.public_address.empty()) {
    return "public:" + handle.public_address;
  }
  if (!handle.private_address.empty()) {
    return "private:" + host.GetLocality().network_id + "/" + handle.private_address;
  }
  return "host:" + host.Id();
}

NetworkResolver::Link NetworkResolver::ResolveLink(const model::Service& source, const model::Service& destination) {
  const auto& from = source.GetHost();
  const auto& to   = destination.GetHost();

  auto from_handle = from.Handle();
  auto to_handle   = to.Handle();
  if (!from_handle || !to_handle) {
    throw util::InvalidState("connection " + source.Id() + " -> " + destination.Id() + " resolved before its hosts were provisioned");
  }

  const auto relationship = Classify(from, to);
  const bool tunnel       = relationship == model::Relationship::kCrossNetwork && to_handle->public_address.empty() &&
                      (from_handle->local || to_handle->local);
  const auto from_machine = MachineKey(from, *from_handle);
  const auto to_machine   = MachineKey(to, *to_handle);

  // a tunnel may open the destination port number on the source machine too
  const auto port = tunnel ? ports_.AllocateOnAll({to_machine, from_machine}) : ports_.Allocate(to_machine);
  Link       link;
  link.bind.port         = port;
  link.bind.peer_service = source.Id();
  link.endpoint.port     = port;

  switch (relationship) {
    case model::Relationship::kSameHost:
      if (options_.unix_sockets_same_host) {
        const auto path = options_.socket_dir + "/" + deployment_id_ + "-" + destination.Id() + "-" + std::to_string(port) + ".sock";
        link.bind       = {model::TransportKind::kUnix, path, 0, source.Id()};
        link.endpoint   = {model::TransportKind::kUnix, path, 0};
        return link;
      }
      link.bind.bind_address = "127.0.0.1";
      link.endpoint.address  = "127.0.0.1";
      return link;

    case model::Relationship::kSamePrivateNetwork:
      link.bind.bind_address = to.AddressFor(from);
      link.endpoint.address  = link.bind.bind_address;
      return link;

    case model::Relationship::kCrossNetwork:
      break;
  }

  if (!network_) {
    throw util::NetworkError("connection " + source.Id() + " -> " + destination.Id() + " crosses networks but no network capability is configured");
  }

  if (!to_handle->public_address.empty()) {
    capability::IngressRule rule;
    rule.deployment_id = deployment_id_;
    rule.destination   = *to_handle;
    rule.port          = port;
    rule.source_cidr   = from_handle->public_address.empty() ? options_.default_ingress_cidr : from_handle->public_address + "/32";

    auto resource = network_->OpenIngress(rule);
    Track(resource);
    MESHDEPLOY_LOG_DEBUG("Ingress opened", {observability::StringField("resource", resource.id), observability::StringField("host", to.Id()),
                                            observability::IntField("port", port), observability::StringField("source_cidr", rule.source_cidr)});

    link.bind.bind_address = "0.0.0.0";
    link.endpoint.address  = to_handle->public_address;
    return link;
  }

  if (tunnel) {
    auto result = network_->OpenTunnel(capability::TunnelRequest{deployment_id_, *from_handle, *to_handle, port});
    Track(result.resource);
    if (result.endpoint.transport == model::TransportKind::kTcp && result.endpoint.port != port) {
      ports_.Reserve(from_machine, result.endpoint.port);
    }
    MESHDEPLOY_LOG_DEBUG("Tunnel opened", {observability::StringField("resource", result.resource.id), observability::StringField("from", from.Id()),
                                           observability::StringField("to", to.Id()), observability::StringField("endpoint", result.endpoint.ToString())});

    link.bind.bind_address = "127.0.0.1";
    link.endpoint          = result.endpoint;
    return link;
  }

  throw util::NetworkError("host " + to.Id() + " is not reachable from " + from.Id() + ": no public address and no tunnel path");
}

void NetworkResolver::Track(const capability::NetworkResource& resource) {
  std::lock_guard lock(mutex_);
  resources_.push_back(resource);
}

void NetworkResolver::ExposePorts(const model::Service& service) {
  const auto& host   = service.GetHost();
  const auto  handle = host.Handle();
  if (!handle) {
    throw util::InvalidState("service " + service.Id() + " exposes ports before host " + host.Id() + " was provisioned");
  }

  const auto machine = MachineKey(host, *handle);
  for (const auto port : service.ExternalPorts()) {
    if (!ports_.Reserve(machine, port)) {
      throw util::NetworkError("service " + service.Id() + ": port " + std::to_string(port) + " on host " + host.Id() + " is already taken");
    }
    if (handle->local) {
      continue;
    }
    if (handle->public_address.empty()) {
      throw util::NetworkError("service " + service.Id() + " exposes port " + std::to_string(port) + " but host " + host.Id() +
                               " has no public address");
    }
    if (!network_) {
      throw util::NetworkError("service " + service.Id() + " exposes ports but no network capability is configured");
    }

    const auto resource = network_->OpenIngress(capability::IngressRule{deployment_id_, *handle, port, options_.default_ingress_cidr});
    Track(resource);
    MESHDEPLOY_LOG_INFO("Port exposed", {observability::StringField("service", service.Id()), observability::StringField("host", host.Id()),
                                         observability::IntField("port", port), observability::StringField("resource", resource.id)});
  }
}

std::map<std::string, model::ServiceWiring> NetworkResolver::Resolve(const std::vector<model::Connection>& connections,
                                                                     const std::map<std::string, const model::Service*>& services,
                                                                     const util::CancellationToken& token) {
  std::map<std::string, model::ServiceWiring> wiring;
  for (const auto& [id, service] : services) {
    auto& entry         = wiring[id];
    entry.deployment_id = deployment_id_;
    entry.service_id    = id;
    entry.args          = service->Args();
  }

  for (const auto& [id, service] : services) {
    token.ThrowIfCancelled("expose ports of " + id);
    ExposePorts(*service);
  }

  auto lookup = [&](const std::string& id) -> const model::Service& {
    auto it = services.find(id);
    if (it == services.end()) {
      throw util::DeclarationError("connection references unknown service " + id);
    }
    return *it->second;
  };

  for (const auto& connection : connections) {
    token.ThrowIfCancelled("resolve connection " + std::to_string(connection.id));

    const auto& source = lookup(connection.source.service_id);
    for (const auto& [key, target] : connection.Destinations()) {
      const auto& destination = lookup(target.service_id);
      const auto  sink        = destination.FindPort(target.port);
      const auto  link        = ResolveLink(source, destination);

      auto& dst_wiring = wiring[destination.Id()];
      dst_wiring.binds[target.port].push_back(link.bind);
      dst_wiring.merged_sinks[target.port] = sink && sink->merged;

      auto& src_wiring = wiring[source.Id()];
      if (connection.IsDemux()) {
        src_wiring.demux[connection.source.port][key] = link.endpoint;
      } else {
        src_wiring.connects[connection.source.port] = link.endpoint;
      }
    }
  }

  return wiring;
}

std::vector<capability::NetworkResource> NetworkResolver::Resources() const {
  std::lock_guard lock(mutex_);
  return resources_;
}

std::vector<std::string> NetworkResolver::ReleaseAll() {
  std::vector<capability::NetworkResource> resources;
  {
    std::lock_guard lock(mutex_);
    resources.swap(resources_);
  }

  std::vector<std::string> failures;
  for (auto it = resources.rbegin(); it != resources.rend(); ++it) {
    try {
      network_->Close(*it);
    } catch (const std::exception& e) {
      failures.push_back("close " + it->kind + " " + it->id + ": " + e.what());
      MESHDEPLOY_LOG_WARN("Failed to close network resource",
                          {observability::StringField("resource", it->id), observability::StringField("kind", it->kind),
                           observability::StringField("error", e.what())});
    }
  }
  ports_.Reset();
  return failures;
}

} // namespace meshdeploy::network
