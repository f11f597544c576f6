#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace meshdeploy::model {

enum class LocalityKind : std::uint8_t {
  kLocal          = 0,
  kPrivateNetwork = 1,
  kPublic         = 2,
};

/*
  Network locality class of a host: the operator machine, a member of a
  private network identified by `network_id`, or a host only reachable
  through its public address.
*/
struct Locality {
  LocalityKind kind = LocalityKind::kLocal;
  std::string  network_id;

  static Locality Local() {
    return {LocalityKind::kLocal, {}};
  }

  static Locality PrivateNetwork(std::string id) {
    return {LocalityKind::kPrivateNetwork, std::move(id)};
  }

  static Locality Public() {
    return {LocalityKind::kPublic, {}};
  }

  std::string ToString() const {
    switch (kind) {
      case LocalityKind::kLocal:
        return "local";
      case LocalityKind::kPrivateNetwork:
        return "private:" + network_id;
      case LocalityKind::kPublic:
        return "public";
    }
    return "unknown";
  }

  bool operator==(const Locality&) const = default;
};

// Binary flavour an artifact has to be built for.
enum class HostTargetKind : std::uint8_t {
  kLocal = 0,
  kLinux = 1,
};

constexpr std::string_view ToString(HostTargetKind kind) {
  return kind == HostTargetKind::kLocal ? "local" : "linux";
}

} // namespace meshdeploy::model
