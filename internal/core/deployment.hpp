#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>

#include "internal/capability/build.hpp"
#include "internal/capability/execution.hpp"
#include "internal/capability/network.hpp"
#include "internal/capability/provisioning.hpp"
#include "internal/graph/connection_graph.hpp"
#include "internal/model/connection.hpp"
#include "internal/model/endpoint.hpp"
#include "internal/model/host.hpp"
#include "internal/model/service.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/network/network_resolver.hpp"
#include "internal/supervisor/process_supervisor.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"

namespace meshdeploy::core {

struct DeploymentOptions {
  std::size_t               provision_concurrency{8};
  util::RetryPolicy         provision_retry;
  std::chrono::milliseconds listen_timeout{60000};
  std::chrono::milliseconds stop_grace{10000};
  std::chrono::milliseconds kill_timeout{5000};
  std::chrono::milliseconds deploy_timeout{0};  // 0 = no deadline
  std::chrono::milliseconds start_timeout{0};
  std::size_t               output_buffer_lines{4096};
  spdlog::level::level_enum unobserved_output_level{spdlog::level::info};
  network::ResolverOptions  network;
};

// External collaborators. Provisioners are keyed by HostDecl::provider.
struct Capabilities {
  std::map<std::string, std::shared_ptr<capability::ProvisioningCapability>> provisioners;
  std::shared_ptr<capability::BuildCapability>                               builder;
  std::shared_ptr<capability::ExecutionCapability>                           executor;
  std::shared_ptr<capability::NetworkCapability>                             network;
};

enum class EventKind : std::uint8_t {
  kStateChanged     = 0,
  kServiceCrashed   = 1,
  kServiceCompleted = 2,
  kTeardownFailure  = 3,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kStateChanged:
      return "state-changed";
    case EventKind::kServiceCrashed:
      return "service-crashed";
    case EventKind::kServiceCompleted:
      return "service-completed";
    case EventKind::kTeardownFailure:
      return "teardown-failure";
  }
  return "unknown";
}

struct DeploymentEvent {
  EventKind       kind = EventKind::kStateChanged;
  std::string     service_id;
  int             exit_code = 0;
  std::string     message;
  util::TimePoint time;
};

// Teardown never throws; whatever could not be released is listed here.
struct TeardownReport {
  std::vector<std::string> failures;

  bool Clean() const {
    return failures.empty();
  }
};

struct HostSnapshot {
  std::string      id;
  std::string      provider;
  model::HostState state = model::HostState::kDeclared;
  model::Locality  locality;
  std::string      address;
};

struct ServiceSnapshot {
  std::string         id;
  std::string         host_id;
  model::ServiceKind  kind  = model::ServiceKind::kManaged;
  model::ServiceState state = model::ServiceState::kDeclared;
  std::optional<int>  exit_code;
};

struct DeploymentStatus {
  std::string                  id;
  model::DeploymentState       state = model::DeploymentState::kEmpty;
  std::vector<HostSnapshot>    hosts;
  std::vector<ServiceSnapshot> services;
};

/*
  One coordinated topology: owns its hosts, services and connections and
  drives them through

    Empty -> Declared -> Provisioned -> Deployed -> Started
          -> {Stopped | PartiallyFailed} -> TornDown

  External services take part in network resolution only: they are never
  built, placed, launched or stopped.

  Lifecycle calls (Deploy, Start, Stop, Teardown) are serialized. A failed or
  cancelled Deploy or Start tears everything down before the error reaches
  the caller. Declarations are rejected once Deploy has been called.
*/
class Deployment {
 public:
  using EventListener = std::function<void(const DeploymentEvent&)>;

  Deployment(std::string id, Capabilities capabilities, DeploymentOptions options = {});
  ~Deployment();

  Deployment(const Deployment&)            = delete;
  Deployment& operator=(const Deployment&) = delete;

  const std::string& Id() const {
    return id_;
  }

  // ---- declaration (throws util::DeclarationError) ----
  model::Host&      AddHost(model::HostDecl decl);
  model::Service&   AddService(model::ServiceDecl decl);
  model::PortRef    AddPort(const std::string& service_id, const model::PortDecl& decl);
  model::PortRef    Port(const std::string& service_id, const std::string& port) const;
  model::Connection Connect(const model::PortRef& source, const model::PortRef& destination);
  model::Connection ConnectDemux(const model::PortRef& source, const model::DemuxMap& destinations);

  // ---- lifecycle ----
  void           Deploy();
  void           Start();
  TeardownReport Stop();
  TeardownReport Teardown();

  // Cancels the Deploy or Start in flight, if any.
  void Cancel(const std::string& reason = "cancelled by caller");

  // ---- observation ----
  model::DeploymentState State() const;
  model::HostState       HostStateOf(const std::string& host_id) const;
  model::ServiceState    ServiceStateOf(const std::string& service_id) const;
  model::ServiceKind     ServiceKindOf(const std::string& service_id) const;
  // Resolved once Deploy has run; for external services this is the only
  // way their endpoints reach anyone.
  model::ServiceWiring   Wiring(const std::string& service_id) const;
  DeploymentStatus       Status() const;

  std::vector<model::Connection> Connections() const;

  std::vector<capability::NetworkResource> NetworkResources() const;

  // Lines emitted after this call. Throws util::NotFound, util::InvalidState before launch.
  std::unique_ptr<supervisor::OutputSubscription> Subscribe(const std::string& service_id, supervisor::OutputFilter filter = {});

  // Throws util::StillRunning when `wait` is false and the process is alive.
  int ExitCode(const std::string& service_id, bool wait = false);

  // Events not yet drained, oldest first.
  std::vector<DeploymentEvent> DrainEvents();
  std::vector<DeploymentEvent> Events() const;
  void                         SetEventListener(EventListener listener);

 private:
  struct ExitRelay {
    std::mutex  mutex;
    Deployment* owner = nullptr;
  };

  void                    CheckDeclarable(const std::string& what) const;
  void                    MarkDeclared();
  void                    SetState(model::DeploymentState next);
  util::CancellationToken BeginOperation(std::chrono::milliseconds timeout);
  void                    EndOperation();
  void                    Publish(DeploymentEvent event);

  model::Service& ServiceOrThrow(const std::string& service_id) const;
  std::shared_ptr<supervisor::ProcessSupervisor> SupervisorOrThrow(const std::string& service_id) const;

  void ProvisionHosts(util::CancellationToken& token);
  void ResolveNetwork(const util::CancellationToken& token);
  void BuildArtifacts(util::CancellationToken& token);
  void PlaceArtifacts(util::CancellationToken& token);
  void LaunchService(const std::string& service_id, const util::CancellationToken& token);
  void OnServiceExit(const std::string& service_id, int exit_code, bool stop_requested);
  void UpdateRunningGauge() const;

  std::vector<std::string> StopServices();
  TeardownReport           TeardownLocked(bool services_stopped);

  const std::string       id_;
  const Capabilities      capabilities_;
  const DeploymentOptions options_;

  std::mutex                             lifecycle_mutex_;
  mutable std::mutex                     mutex_;
  model::DeploymentState                 state_{model::DeploymentState::kEmpty};
  bool                                   deploy_requested_{false};
  std::optional<util::CancellationToken> active_token_;
  std::optional<DeploymentEvent>         startup_failure_;

  std::vector<std::string>                               host_order_;
  std::map<std::string, std::unique_ptr<model::Host>>    hosts_;
  std::vector<std::string>                               service_order_;
  std::map<std::string, std::unique_ptr<model::Service>> services_;
  graph::ConnectionGraph                                 graph_;
  network::NetworkResolver                               resolver_;

  std::map<std::string, model::ServiceWiring>                           wiring_;
  std::map<std::string, capability::Artifact>                           artifacts_;
  std::map<std::string, std::shared_ptr<supervisor::ProcessSupervisor>> supervisors_;
  std::shared_ptr<ExitRelay>                                            relay_;

  std::vector<DeploymentEvent> events_;
  std::size_t                  drained_{0};
  EventListener                listener_;
};

} // namespace meshdeploy::core
