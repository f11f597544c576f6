#include "internal/providers/static_provisioner.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::providers {
namespace {

// ssh reports its own connection failures with 255.
constexpr int kSshConnectionFailure = 255;

std::string Property(const capability::ProvisionRequest& request, const std::string& key) {
  auto it = request.properties.find(key);
  return it == request.properties.end() ? std::string{} : it->second;
}

} // namespace

StaticProvisioner::StaticProvisioner(StaticProvisionerOptions options, std::shared_ptr<exec::ProcessRunner> runner)
    : options_(std::move(options)), runner_(runner ? std::move(runner) : std::make_shared<exec::ProcessRunner>()) {
}

capability::ProvisionedHandle StaticProvisioner::Provision(const capability::ProvisionRequest& request) {
  capability::ProvisionedHandle handle;
  handle.handle_id       = "static:" + request.deployment_id + ":" + request.host_id;
  handle.provider        = "static";
  handle.host_id         = request.host_id;
  handle.public_address  = Property(request, "address");
  handle.private_address = Property(request, "private_address");
  handle.attributes      = request.properties;

  if (handle.public_address.empty() && handle.private_address.empty()) {
    throw util::ProvisionError("static host " + request.host_id + " declares neither address nor private_address", false);
  }
  if (request.locality.kind == model::LocalityKind::kPrivateNetwork && handle.private_address.empty()) {
    throw util::ProvisionError("static host " + request.host_id + " is in private network " + request.locality.network_id +
                                   " but has no private_address",
                               false);
  }
  if (request.locality.kind == model::LocalityKind::kPublic) {
    // only reachable from outside: the private address is never handed out
    if (handle.public_address.empty()) {
      throw util::ProvisionError("public static host " + request.host_id + " has no address", false);
    }
    handle.private_address.clear();
  }

  if (options_.probe) {
    Probe(handle);
  }
  return handle;
}

void StaticProvisioner::Probe(const capability::ProvisionedHandle& handle) {
  exec::ProcessRunner::RunResult result;
  try {
    result = runner_->Run({exec::SshArgv(options_.ssh, handle, "true"), {}, {}}, options_.probe_timeout);
  } catch (const std::system_error& e) {
    throw util::ProvisionError("cannot run ssh for " + handle.host_id + ": " + e.what(), false);
  } catch (const util::NetworkError& e) {
    throw util::ProvisionError(e.what(), false);
  }

  if (result.timed_out) {
    throw util::ProvisionError("ssh probe of " + handle.host_id + " timed out", true);
  }
  if (result.exit_code == kSshConnectionFailure) {
    throw util::ProvisionError("ssh probe of " + handle.host_id + " failed: " + result.output, true);
  }
  if (result.exit_code != 0) {
    throw util::ProvisionError("ssh probe of " + handle.host_id + " exited " + std::to_string(result.exit_code), false);
  }
}

void StaticProvisioner::Deprovision(const capability::ProvisionedHandle& handle) {
  MESHDEPLOY_LOG_DEBUG("Static host released", {observability::StringField("host", handle.host_id),
                                                observability::StringField("address", exec::SshTarget(handle))});
}

} // namespace meshdeploy::providers
