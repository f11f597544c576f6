#pragma once

#include <map>
#include <string>

#include "internal/model/locality.hpp"

namespace meshdeploy::capability {

struct ProvisionRequest {
  std::string                        deployment_id;
  std::string                        host_id;
  model::Locality                    locality;
  std::map<std::string, std::string> properties;  // machine class, image, region, ...
};

/*
  Handle returned by a provider once the resource exists.

  `public_address` is empty for hosts that are not reachable from outside
  their private network. `attributes` carries provider specific values that
  transports need later (ssh user, key file, instance id).
*/
struct ProvisionedHandle {
  std::string                        handle_id;
  std::string                        provider;
  std::string                        host_id;
  bool                               local = false;
  std::string                        private_address;
  std::string                        public_address;
  std::map<std::string, std::string> attributes;

  std::string Attribute(const std::string& key, const std::string& fallback = {}) const {
    auto it = attributes.find(key);
    return it == attributes.end() ? fallback : it->second;
  }
};

/*
  Provider API for one host kind.

  Provision throws util::ProvisionError; retryable() distinguishes transient
  provider failures (quota, rate limit, unreachable) from fatal ones
  (authorization, invalid spec). Deprovision may throw; callers collect the
  failure during teardown.
*/
class ProvisioningCapability {
 public:
  virtual ~ProvisioningCapability() = default;

  virtual ProvisionedHandle Provision(const ProvisionRequest& request) = 0;
  virtual void              Deprovision(const ProvisionedHandle& handle) = 0;

  virtual model::HostTargetKind TargetKind() const {
    return model::HostTargetKind::kLinux;
  }
};

} // namespace meshdeploy::capability
