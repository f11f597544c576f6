#pragma once

#include <cstdint>
#include <string_view>

namespace meshdeploy::model {

enum class HostState : std::uint8_t {
  kDeclared    = 0,
  kProvisioned = 1,
  kReleased    = 2,
};

enum class ServiceState : std::uint8_t {
  kDeclared      = 0,
  kArtifactReady = 1,
  kDeployed      = 2,
  kRunning       = 3,
  kStopped       = 4,
  kFailed        = 5,
};

enum class DeploymentState : std::uint8_t {
  kEmpty           = 0,
  kDeclared        = 1,
  kProvisioned     = 2,
  kDeployed        = 3,
  kStarted         = 4,
  kStopped         = 5,
  kPartiallyFailed = 6,
  kTornDown        = 7,
};

constexpr bool IsTerminal(ServiceState state) {
  return state == ServiceState::kStopped || state == ServiceState::kFailed;
}

constexpr bool CanTransition(HostState from, HostState to) {
  if (from == to) {
    return true;
  }
  if (from == HostState::kReleased) {
    return false;
  }
  // a declared host that never got provisioned is released without a handle
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr bool CanTransition(ServiceState from, ServiceState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == ServiceState::kFailed) {
    return true;
  }
  if (to == ServiceState::kStopped) {
    return from == ServiceState::kRunning;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr bool CanTransition(DeploymentState from, DeploymentState to) {
  if (from == to) {
    return from == DeploymentState::kDeclared;
  }
  if (from == DeploymentState::kTornDown) {
    return false;
  }
  // teardown is the terminal cleanup path and is reachable from everywhere
  if (to == DeploymentState::kTornDown) {
    return from != DeploymentState::kEmpty;
  }

  switch (from) {
    case DeploymentState::kEmpty:
      return to == DeploymentState::kDeclared;
    case DeploymentState::kDeclared:
      return to == DeploymentState::kProvisioned;
    case DeploymentState::kProvisioned:
      return to == DeploymentState::kDeployed;
    case DeploymentState::kDeployed:
      return to == DeploymentState::kStarted;
    case DeploymentState::kStarted:
      return to == DeploymentState::kStopped || to == DeploymentState::kPartiallyFailed;
    case DeploymentState::kPartiallyFailed:
    case DeploymentState::kStopped:
    case DeploymentState::kTornDown:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(HostState state) {
  switch (state) {
    case HostState::kDeclared:
      return "declared";
    case HostState::kProvisioned:
      return "provisioned";
    case HostState::kReleased:
      return "released";
  }
  return "unknown";
}

constexpr std::string_view ToString(ServiceState state) {
  switch (state) {
    case ServiceState::kDeclared:
      return "declared";
    case ServiceState::kArtifactReady:
      return "artifact-ready";
    case ServiceState::kDeployed:
      return "deployed";
    case ServiceState::kRunning:
      return "running";
    case ServiceState::kStopped:
      return "stopped";
    case ServiceState::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr std::string_view ToString(DeploymentState state) {
  switch (state) {
    case DeploymentState::kEmpty:
      return "empty";
    case DeploymentState::kDeclared:
      return "declared";
    case DeploymentState::kProvisioned:
      return "provisioned";
    case DeploymentState::kDeployed:
      return "deployed";
    case DeploymentState::kStarted:
      return "started";
    case DeploymentState::kStopped:
      return "stopped";
    case DeploymentState::kPartiallyFailed:
      return "partially-failed";
    case DeploymentState::kTornDown:
      return "torn-down";
  }
  return "unknown";
}

} // namespace meshdeploy::model
