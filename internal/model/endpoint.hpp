#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace meshdeploy::model {

enum class TransportKind : std::uint8_t {
  kTcp = 0,
  kUnix = 1,
};

constexpr std::string_view ToString(TransportKind kind) {
  return kind == TransportKind::kUnix ? "unix" : "tcp";
}

// Where a sender connects to.
struct Endpoint {
  TransportKind transport = TransportKind::kTcp;
  std::string   address;
  std::uint16_t port = 0;

  std::string ToString() const {
    return address + ":" + std::to_string(port);
  }

  bool operator==(const Endpoint&) const = default;
};

// What a receiver listens on: "listen on this local port".
struct BindSpec {
  TransportKind transport = TransportKind::kTcp;
  std::string   bind_address;
  std::uint16_t port = 0;
  std::string   peer_service;  // sender on the other side, informational

  bool operator==(const BindSpec&) const = default;
};

/*
  Fully-resolved runtime configuration handed to a service before it starts.

  - binds:   sink port -> listening sockets (more than one only for merged ports)
  - connects: plain source port -> destination endpoint
  - demux:   demux source port -> key -> destination endpoint
*/
struct ServiceWiring {
  std::string deployment_id;
  std::string service_id;

  std::map<std::string, std::vector<BindSpec>>             binds;
  std::map<std::string, bool>                              merged_sinks;
  std::map<std::string, Endpoint>                          connects;
  std::map<std::string, std::map<std::uint32_t, Endpoint>> demux;
  std::vector<std::string>                                 args;

  bool operator==(const ServiceWiring&) const = default;
};

} // namespace meshdeploy::model
