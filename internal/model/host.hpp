#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "internal/capability/provisioning.hpp"
#include "internal/model/locality.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/retry.hpp"

namespace meshdeploy::model {

struct HostDecl {
  std::string                        id;
  std::string                        provider;
  Locality                           locality;
  std::map<std::string, std::string> properties;
};

enum class Relationship : std::uint8_t {
  kSameHost           = 0,
  kSamePrivateNetwork = 1,
  kCrossNetwork       = 2,
};

constexpr std::string_view ToString(Relationship relationship) {
  switch (relationship) {
    case Relationship::kSameHost:
      return "same-host";
    case Relationship::kSamePrivateNetwork:
      return "same-private-network";
    case Relationship::kCrossNetwork:
      return "cross-network";
  }
  return "unknown";
}

/*
  A compute location owned by one deployment.

  Provision and Deprovision are idempotent and may be called from worker
  threads; field access is guarded by mutex_ while provision_mutex_ keeps a
  second caller from racing the provider.
*/
class Host {
 public:
  Host(std::string deployment_id, HostDecl decl, std::shared_ptr<capability::ProvisioningCapability> provisioner);

  Host(const Host&)            = delete;
  Host& operator=(const Host&) = delete;

  const std::string& Id() const {
    return decl_.id;
  }

  const std::string& Provider() const {
    return decl_.provider;
  }

  const Locality& GetLocality() const {
    return decl_.locality;
  }

  HostTargetKind TargetKind() const;

  HostState State() const;

  // Throws util::ProvisionError after the retry budget, util::Cancelled.
  capability::ProvisionedHandle Provision(const util::RetryPolicy& policy, const util::CancellationToken& token);

  std::optional<capability::ProvisionedHandle> Handle() const;

  Relationship RelationshipTo(const Host& peer) const;

  // Address `peer` uses to reach this host. Requires this host provisioned.
  std::string AddressFor(const Host& peer) const;

  // Releases the provider resource. Rethrows provider failures; the host then
  // stays provisioned so a later attempt can retry.
  void Deprovision();

  std::uint32_t ProvisionAttempts() const;

 private:
  const std::string                                     deployment_id_;
  const HostDecl                                        decl_;
  std::shared_ptr<capability::ProvisioningCapability> provisioner_;

  mutable std::mutex                           mutex_;
  std::mutex                                   provision_mutex_;
  HostState                                    state_{HostState::kDeclared};
  std::optional<capability::ProvisionedHandle> handle_;
  std::uint32_t                                attempts_{0};
};

} // namespace meshdeploy::model
