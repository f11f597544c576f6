#pragma once

#include <string>
#include <utility>

#include "internal/core/deployment.hpp"
#include "internal/model/locality.hpp"
#include "internal/model/port.hpp"
#include "meshdeploy/topology/v1/topology.pb.h"

namespace meshdeploy::topology {

using TopologySpec = meshdeploy::topology::v1::TopologySpec;

// Throws util::ConfigError for unreadable or malformed files.
TopologySpec LoadTopology(const std::string& path);
TopologySpec LoadTopologyFromString(const std::string& yaml);

// "local", "public", "private:<network>". Throws util::DeclarationError.
model::Locality ParseLocality(const std::string& text);

// "<service>.<port>" split at the last dot. Throws util::DeclarationError.
std::pair<std::string, std::string> ParsePortPath(const std::string& text);

/*
  Declares every host, service, port and connection of `spec` on
  `deployment`, in file order. Errors are the declaration API's own
  (util::DeclarationError), so a bad file fails at the first bad entry.
*/
void ApplyTopology(const TopologySpec& spec, core::Deployment& deployment);

} // namespace meshdeploy::topology
