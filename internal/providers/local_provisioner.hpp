#pragma once

#include "internal/capability/provisioning.hpp"

namespace meshdeploy::providers {

// The operator machine. Nothing is created or released.
class LocalProvisioner : public capability::ProvisioningCapability {
 public:
  capability::ProvisionedHandle Provision(const capability::ProvisionRequest& request) override;
  void                          Deprovision(const capability::ProvisionedHandle& handle) override;

  model::HostTargetKind TargetKind() const override {
    return model::HostTargetKind::kLocal;
  }
};

} // namespace meshdeploy::providers
