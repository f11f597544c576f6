#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

namespace meshdeploy::model {

enum class PortDirection : std::uint8_t {
  kSource = 0,
  kSink   = 1,
};

constexpr std::string_view ToString(PortDirection direction) {
  return direction == PortDirection::kSink ? "sink" : "source";
}

// A port as declared on a service. Only sinks may be merged.
struct PortDecl {
  std::string   name;
  PortDirection direction = PortDirection::kSource;
  bool          merged    = false;
};

struct Port {
  std::string   service_id;
  std::string   name;
  PortDirection direction = PortDirection::kSource;
  bool          merged    = false;
};

/*
  Reference to a port of a service registered in a specific deployment.
  Obtained from Service::GetPort so the name is known to exist.
*/
struct PortRef {
  std::string deployment_id;
  std::string service_id;
  std::string port;

  std::string ToString() const {
    return service_id + "." + port;
  }

  bool operator==(const PortRef&) const = default;

  bool operator<(const PortRef& other) const {
    return std::tie(deployment_id, service_id, port) < std::tie(other.deployment_id, other.service_id, other.port);
  }
};

} // namespace meshdeploy::model
