#pragma once

#include <string>

#include "internal/model/locality.hpp"

namespace meshdeploy::capability {

struct Artifact {
  std::string           source_ref;
  model::HostTargetKind target = model::HostTargetKind::kLocal;
  std::string           path;  // executable on the machine running the orchestrator
};

/*
  Turns a source reference into a runnable artifact for a host kind.
  Throws util::BuildError.
*/
class BuildCapability {
 public:
  virtual ~BuildCapability() = default;

  virtual Artifact Build(const std::string& source_ref, model::HostTargetKind target) = 0;
};

} // namespace meshdeploy::capability
