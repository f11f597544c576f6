#include "internal/topology/topology_loader.hpp"

#include "internal/config/yaml_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::topology {
namespace {

model::PortDirection ParseDirection(const std::string& service_id, const v1::PortSpec& port) {
  if (port.direction() == "source") return model::PortDirection::kSource;
  if (port.direction() == "sink") return model::PortDirection::kSink;
  throw util::DeclarationError("port " + service_id + "." + port.name() + ": direction must be source or sink, got '" +
                               port.direction() + "'");
}

model::ServiceKind ParseKind(const v1::ServiceSpec& service) {
  if (service.kind().empty() || service.kind() == "managed") return model::ServiceKind::kManaged;
  if (service.kind() == "external") return model::ServiceKind::kExternal;
  throw util::DeclarationError("service " + service.id() + ": kind must be managed or external, got '" + service.kind() + "'");
}

model::PortRef Resolve(core::Deployment& deployment, const std::string& path) {
  const auto [service, port] = ParsePortPath(path);
  return deployment.Port(service, port);
}

} // namespace

TopologySpec LoadTopology(const std::string& path) {
  TopologySpec spec;
  config::LoadYamlFileInto(path, &spec);
  return spec;
}

TopologySpec LoadTopologyFromString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw util::ConfigError("Failed to parse topology: " + std::string(e.what()));
  }
  TopologySpec spec;
  config::ParseYamlInto(node, &spec, "topology");
  return spec;
}

model::Locality ParseLocality(const std::string& text) {
  if (text.empty() || text == "local") return model::Locality::Local();
  if (text == "public") return model::Locality::Public();

  constexpr std::string_view kPrivate = "private:";
  if (text.starts_with(kPrivate) && text.size() > kPrivate.size()) {
    return model::Locality::PrivateNetwork(text.substr(kPrivate.size()));
  }
  throw util::DeclarationError("invalid locality '" + text + "' (expected local, public or private:<network>)");
}

std::pair<std::string, std::string> ParsePortPath(const std::string& text) {
  const auto dot = text.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == text.size()) {
    throw util::DeclarationError("invalid port reference '" + text + "' (expected <service>.<port>)");
  }
  return {text.substr(0, dot), text.substr(dot + 1)};
}

void ApplyTopology(const TopologySpec& spec, core::Deployment& deployment) {
  for (const auto& host : spec.hosts()) {
    model::HostDecl decl;
    decl.id       = host.id();
    decl.provider = host.provider().empty() ? "local" : host.provider();
    decl.locality = ParseLocality(host.locality());
    decl.properties.insert(host.properties().begin(), host.properties().end());
    deployment.AddHost(std::move(decl));
  }

  for (const auto& service : spec.services()) {
    model::ServiceDecl decl;
    decl.id         = service.id();
    decl.host_id    = service.host();
    decl.source_ref = service.source_ref();
    decl.args.assign(service.args().begin(), service.args().end());
    decl.kind = ParseKind(service);
    for (const auto port : service.external_ports()) {
      if (port > 65535) {
        throw util::DeclarationError("service " + service.id() + ": external port " + std::to_string(port) + " out of range");
      }
      decl.external_ports.push_back(static_cast<std::uint16_t>(port));
    }
    for (const auto& port : service.ports()) {
      decl.ports.push_back({port.name(), ParseDirection(service.id(), port), port.merged()});
    }
    deployment.AddService(std::move(decl));
  }

  for (const auto& connection : spec.connections()) {
    const auto source = Resolve(deployment, connection.from());
    if (connection.demux().empty()) {
      if (connection.to().empty()) {
        throw util::DeclarationError("connection from " + connection.from() + " has neither 'to' nor 'demux'");
      }
      deployment.Connect(source, Resolve(deployment, connection.to()));
      continue;
    }
    if (!connection.to().empty()) {
      throw util::DeclarationError("connection from " + connection.from() + " sets both 'to' and 'demux'");
    }
    model::DemuxMap targets;
    for (const auto& [key, path] : connection.demux()) {
      targets.emplace(key, Resolve(deployment, path));
    }
    deployment.ConnectDemux(source, targets);
  }

  MESHDEPLOY_LOG_INFO("Topology declared", {observability::StringField("deployment", deployment.Id()),
                                            observability::IntField("hosts", spec.hosts_size()),
                                            observability::IntField("services", spec.services_size()),
                                            observability::IntField("connections", spec.connections_size())});
}

} // namespace meshdeploy::topology
