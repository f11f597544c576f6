#include "internal/model/host.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::model {

Host::Host(std::string deployment_id, HostDecl decl, std::shared_ptr<capability::ProvisioningCapability> provisioner)
    : deployment_id_(std::move(deployment_id)), decl_(std::move(decl)), provisioner_(std::move(provisioner)) {
  if (!provisioner_) {
    throw util::DeclarationError("host " + decl_.id + ": no provisioner for provider '" + decl_.provider + "'");
  }
}

HostTargetKind Host::TargetKind() const {
  return provisioner_->TargetKind();
}

HostState Host::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

capability::ProvisionedHandle Host::Provision(const util::RetryPolicy& policy, const util::CancellationToken& token) {
  std::lock_guard provision_lock(provision_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (state_ == HostState::kProvisioned) {
      return *handle_;
    }
    if (state_ == HostState::kReleased) {
      throw util::InvalidState("host " + decl_.id + " was already released");
    }
  }

  observability::SpanScope span("host.provision");
  span.SetAttribute("host", decl_.id);
  span.SetAttribute("provider", decl_.provider);

  capability::ProvisionRequest request{deployment_id_, decl_.id, decl_.locality, decl_.properties};

  auto on_retry = [this](std::uint32_t attempt, const util::ProvisionError& e, std::chrono::milliseconds delay) {
    MESHDEPLOY_LOG_WARN("Provisioning attempt failed, retrying",
                        {observability::StringField("host", decl_.id), observability::IntField("attempt", attempt),
                         observability::DurationField("backoff", delay), observability::StringField("error", e.what())});
  };

  try {
    auto handle = util::RetryWithBackoff(
        policy, token, "provision host " + decl_.id,
        [&](std::uint32_t attempt) {
          {
            std::lock_guard lock(mutex_);
            attempts_ = attempt;
          }
          try {
            auto result = provisioner_->Provision(request);
            observability::Metrics::Instance().RecordProvisionAttempt(decl_.provider, true);
            return result;
          } catch (const util::ProvisionError&) {
            observability::Metrics::Instance().RecordProvisionAttempt(decl_.provider, false);
            throw;
          }
        },
        on_retry);

    std::lock_guard lock(mutex_);
    handle_ = std::move(handle);
    state_  = HostState::kProvisioned;
    MESHDEPLOY_LOG_INFO("Host provisioned", {observability::StringField("host", decl_.id), observability::StringField("handle", handle_->handle_id),
                                             observability::IntField("attempts", attempts_)});
    return *handle_;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw;
  }
}

std::optional<capability::ProvisionedHandle> Host::Handle() const {
  std::lock_guard lock(mutex_);
  return handle_;
}

Relationship Host::RelationshipTo(const Host& peer) const {
  if (&peer == this || peer.Id() == Id()) {
    return Relationship::kSameHost;
  }

  const auto& mine   = decl_.locality;
  const auto& theirs = peer.GetLocality();
  if (mine.kind == LocalityKind::kLocal && theirs.kind == LocalityKind::kLocal) {
    return Relationship::kSameHost;
  }
  if (mine.kind == LocalityKind::kPrivateNetwork && theirs.kind == LocalityKind::kPrivateNetwork && mine.network_id == theirs.network_id) {
    return Relationship::kSamePrivateNetwork;
  }
  return Relationship::kCrossNetwork;
}

std::string Host::AddressFor(const Host& peer) const {
  auto handle = Handle();
  if (!handle) {
    throw util::InvalidState("host " + decl_.id + " is not provisioned");
  }

  switch (RelationshipTo(peer)) {
    case Relationship::kSameHost:
      return "127.0.0.1";
    case Relationship::kSamePrivateNetwork:
      if (!handle->private_address.empty()) {
        return handle->private_address;
      }
      break;
    case Relationship::kCrossNetwork:
      if (!handle->public_address.empty()) {
        return handle->public_address;
      }
      break;
  }
  throw util::NetworkError("host " + decl_.id + " has no address reachable from " + peer.Id());
}

void Host::Deprovision() {
  std::lock_guard provision_lock(provision_mutex_);

  capability::ProvisionedHandle handle;
  {
    std::lock_guard lock(mutex_);
    if (state_ == HostState::kReleased) {
      return;
    }
    if (state_ == HostState::kDeclared) {
      state_ = HostState::kReleased;
      return;
    }
    handle = *handle_;
  }

  provisioner_->Deprovision(handle);

  std::lock_guard lock(mutex_);
  state_ = HostState::kReleased;
  MESHDEPLOY_LOG_INFO("Host released", {observability::StringField("host", decl_.id), observability::StringField("handle", handle.handle_id)});
}

std::uint32_t Host::ProvisionAttempts() const {
  std::lock_guard lock(mutex_);
  return attempts_;
}

} // namespace meshdeploy::model
