#include "internal/exec/wiring_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace meshdeploy::exec {
namespace {

namespace pb = meshdeploy::wiring::v1;

void FillEndpoint(const model::Endpoint& endpoint, pb::Endpoint* out) {
  out->set_transport(std::string(model::ToString(endpoint.transport)));
  out->set_address(endpoint.address);
  out->set_port(endpoint.port);
}

model::TransportKind ParseTransport(const std::string& transport) {
  if (transport.empty() || transport == "tcp") return model::TransportKind::kTcp;
  if (transport == "unix") return model::TransportKind::kUnix;
  throw util::ConfigError("unknown transport '" + transport + "'");
}

model::Endpoint ReadEndpoint(const pb::Endpoint& endpoint) {
  model::Endpoint out;
  out.transport = ParseTransport(endpoint.transport());
  out.address   = endpoint.address();
  out.port      = static_cast<std::uint16_t>(endpoint.port());
  return out;
}

} // namespace

pb::ServiceWiring ToProto(const model::ServiceWiring& wiring) {
  pb::ServiceWiring out;
  out.set_deployment_id(wiring.deployment_id);
  out.set_service_id(wiring.service_id);

  for (const auto& [port, binds] : wiring.binds) {
    auto& list = (*out.mutable_binds())[port];
    for (const auto& bind : binds) {
      auto* b = list.add_binds();
      b->set_transport(std::string(model::ToString(bind.transport)));
      b->set_bind_address(bind.bind_address);
      b->set_port(bind.port);
      b->set_peer_service(bind.peer_service);
    }
  }
  for (const auto& [port, merged] : wiring.merged_sinks) {
    (*out.mutable_merged())[port] = merged;
  }
  for (const auto& [port, endpoint] : wiring.connects) {
    FillEndpoint(endpoint, &(*out.mutable_connects())[port]);
  }
  for (const auto& [port, targets] : wiring.demux) {
    auto& demux = (*out.mutable_demux())[port];
    for (const auto& [key, endpoint] : targets) {
      FillEndpoint(endpoint, &(*demux.mutable_targets())[key]);
    }
  }
  for (const auto& arg : wiring.args) {
    out.add_args(arg);
  }
  return out;
}

model::ServiceWiring FromProto(const pb::ServiceWiring& proto) {
  model::ServiceWiring out;
  out.deployment_id = proto.deployment_id();
  out.service_id    = proto.service_id();

  for (const auto& [port, list] : proto.binds()) {
    auto& binds = out.binds[port];
    for (const auto& bind : list.binds()) {
      binds.push_back({ParseTransport(bind.transport()), bind.bind_address(), static_cast<std::uint16_t>(bind.port()),
                       bind.peer_service()});
    }
  }
  for (const auto& [port, merged] : proto.merged()) out.merged_sinks[port] = merged;
  for (const auto& [port, endpoint] : proto.connects()) out.connects[port] = ReadEndpoint(endpoint);
  for (const auto& [port, targets] : proto.demux()) {
    for (const auto& [key, endpoint] : targets.targets()) {
      out.demux[port][key] = ReadEndpoint(endpoint);
    }
  }
  out.args.assign(proto.args().begin(), proto.args().end());
  return out;
}

std::string EncodeWiringJson(const model::ServiceWiring& wiring) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(wiring), &json, options);
  if (!status.ok()) {
    throw util::PlacementError("failed to encode wiring for " + wiring.service_id + ": " + std::string(status.message()));
  }
  return json;
}

model::ServiceWiring DecodeWiringJson(const std::string& json) {
  pb::ServiceWiring proto;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &proto, options);
  if (!status.ok()) {
    throw util::ConfigError("invalid wiring document: " + std::string(status.message()));
  }
  return FromProto(proto);
}

} // namespace meshdeploy::exec
