#include "internal/providers/local_provisioner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::providers {

capability::ProvisionedHandle LocalProvisioner::Provision(const capability::ProvisionRequest& request) {
  if (request.locality.kind != model::LocalityKind::kLocal) {
    throw util::ProvisionError("local provider cannot provide host " + request.host_id + " with locality " + request.locality.ToString(), false);
  }

  capability::ProvisionedHandle handle;
  handle.handle_id       = "local:" + request.deployment_id + ":" + request.host_id;
  handle.provider        = "local";
  handle.host_id         = request.host_id;
  handle.local           = true;
  handle.private_address = "127.0.0.1";
  handle.attributes      = request.properties;
  return handle;
}

void LocalProvisioner::Deprovision(const capability::ProvisionedHandle& handle) {
  MESHDEPLOY_LOG_DEBUG("Local host released", {observability::StringField("host", handle.host_id)});
}

} // namespace meshdeploy::providers
