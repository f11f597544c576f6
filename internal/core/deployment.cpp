#include "internal/core/deployment.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <utility>

#include "internal/concurrency/task_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::core {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kMaxStopWorkers = 64;

/*
  Runs `fn` for every item on a pool of at most `limit` workers. The first
  failure cancels `token` so the remaining items stop early, and is rethrown
  once every task has finished.
*/
template <typename Item, typename Fn>
void FanOut(const std::string& phase, std::size_t limit, const std::vector<Item>& items, util::CancellationToken& token, Fn&& fn) {
  if (items.empty()) {
    return;
  }

  concurrency::TaskPool pool(phase, std::min(std::max<std::size_t>(limit, 1), items.size()));

  std::mutex                     failure_mutex;
  std::exception_ptr             failure;
  std::vector<std::future<void>> futures;
  futures.reserve(items.size());

  for (const auto& item : items) {
    futures.push_back(pool.Submit([&, item] {
      try {
        token.ThrowIfCancelled(phase);
        fn(item);
      } catch (...) {
        {
          std::lock_guard lock(failure_mutex);
          if (!failure) failure = std::current_exception();
        }
        token.Cancel(phase + " failed");
      }
    }));
  }

  for (auto& future : futures) {
    future.wait();
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
}

} // namespace

Deployment::Deployment(std::string id, Capabilities capabilities, DeploymentOptions options)
    : id_(std::move(id)),
      capabilities_(std::move(capabilities)),
      options_(std::move(options)),
      graph_(id_),
      resolver_(id_, capabilities_.network, options_.network),
      relay_(std::make_shared<ExitRelay>()) {
  relay_->owner = this;
}

Deployment::~Deployment() {
  bool needs_teardown = false;
  {
    std::lock_guard lock(mutex_);
    needs_teardown = state_ != model::DeploymentState::kEmpty && state_ != model::DeploymentState::kTornDown;
  }
  if (needs_teardown) {
    try {
      Teardown();
    } catch (const std::exception& e) {
      MESHDEPLOY_LOG_ERROR("Teardown on destruction failed", {StringField("deployment", id_), StringField("error", e.what())});
    }
  }

  {
    std::lock_guard lock(relay_->mutex);
    relay_->owner = nullptr;
  }
  std::lock_guard lock(mutex_);
  for (auto& [service_id, supervisor] : supervisors_) {
    supervisor->DetachExitListener();
  }
}

// ------------------------------------------------------------
// Declaration
// ------------------------------------------------------------

// mutex_ must be held
void Deployment::CheckDeclarable(const std::string& what) const {
  if (deploy_requested_) {
    throw util::DeclarationError(what + ": deployment " + id_ + " has already been deployed");
  }
  if (state_ != model::DeploymentState::kEmpty && state_ != model::DeploymentState::kDeclared) {
    throw util::DeclarationError(what + ": deployment " + id_ + " is " + std::string(model::ToString(state_)));
  }
}

// mutex_ must be held
void Deployment::MarkDeclared() {
  if (state_ == model::DeploymentState::kEmpty) {
    state_ = model::DeploymentState::kDeclared;
  }
}

model::Host& Deployment::AddHost(model::HostDecl decl) {
  std::lock_guard lock(mutex_);
  CheckDeclarable("add host " + decl.id);

  if (decl.id.empty()) {
    throw util::DeclarationError("host id must not be empty");
  }
  if (hosts_.contains(decl.id)) {
    throw util::DeclarationError("host " + decl.id + " declared twice");
  }
  auto provisioner = capabilities_.provisioners.find(decl.provider);
  if (provisioner == capabilities_.provisioners.end()) {
    throw util::DeclarationError("host " + decl.id + ": unknown provider '" + decl.provider + "'");
  }

  const auto host_id = decl.id;
  auto       host    = std::make_unique<model::Host>(id_, std::move(decl), provisioner->second);
  auto&      ref     = *host;
  hosts_.emplace(host_id, std::move(host));
  host_order_.push_back(host_id);
  MarkDeclared();
  return ref;
}

model::Service& Deployment::AddService(model::ServiceDecl decl) {
  std::lock_guard lock(mutex_);
  CheckDeclarable("add service " + decl.id);

  if (decl.id.empty()) {
    throw util::DeclarationError("service id must not be empty");
  }
  if (services_.contains(decl.id)) {
    throw util::DeclarationError("service " + decl.id + " declared twice");
  }
  auto host = hosts_.find(decl.host_id);
  if (host == hosts_.end()) {
    throw util::DeclarationError("service " + decl.id + ": unknown host '" + decl.host_id + "'");
  }

  const auto service_id = decl.id;
  auto       service    = std::make_unique<model::Service>(id_, std::move(decl), host->second.get());
  graph_.RegisterService(service.get());
  auto& ref = *service;
  services_.emplace(service_id, std::move(service));
  service_order_.push_back(service_id);
  MarkDeclared();
  return ref;
}

model::PortRef Deployment::AddPort(const std::string& service_id, const model::PortDecl& decl) {
  std::lock_guard lock(mutex_);
  CheckDeclarable("add port " + service_id + "." + decl.name);

  auto it = services_.find(service_id);
  if (it == services_.end()) {
    throw util::DeclarationError("add port: unknown service '" + service_id + "'");
  }
  it->second->AddPort(decl);
  return it->second->GetPort(decl.name);
}

model::PortRef Deployment::Port(const std::string& service_id, const std::string& port) const {
  std::lock_guard lock(mutex_);
  auto            it = services_.find(service_id);
  if (it == services_.end()) {
    throw util::DeclarationError("unknown service '" + service_id + "'");
  }
  return it->second->GetPort(port);
}

model::Connection Deployment::Connect(const model::PortRef& source, const model::PortRef& destination) {
  std::lock_guard lock(mutex_);
  CheckDeclarable("connect " + source.ToString() + " -> " + destination.ToString());
  return graph_.Connect(source, destination);
}

model::Connection Deployment::ConnectDemux(const model::PortRef& source, const model::DemuxMap& destinations) {
  std::lock_guard lock(mutex_);
  CheckDeclarable("connect " + source.ToString() + " -> demux");
  return graph_.ConnectDemux(source, destinations);
}

// ------------------------------------------------------------
// State and events
// ------------------------------------------------------------

void Deployment::SetState(model::DeploymentState next) {
  model::DeploymentState previous;
  {
    std::lock_guard lock(mutex_);
    if (!model::CanTransition(state_, next)) {
      throw util::InvalidState("deployment " + id_ + ": cannot go from " + std::string(model::ToString(state_)) + " to " +
                               std::string(model::ToString(next)));
    }
    previous = state_;
    state_   = next;
  }

  DeploymentEvent event;
  event.kind    = EventKind::kStateChanged;
  event.message = std::string(model::ToString(previous)) + " -> " + std::string(model::ToString(next));
  event.time    = util::Now();
  Publish(std::move(event));
}

void Deployment::Publish(DeploymentEvent event) {
  EventListener listener;
  {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
    listener = listener_;
  }
  if (listener) {
    listener(event);
  }
}

util::CancellationToken Deployment::BeginOperation(std::chrono::milliseconds timeout) {
  auto            token = util::CancellationToken::WithTimeout(timeout);
  std::lock_guard lock(mutex_);
  active_token_ = token;
  return token;
}

void Deployment::EndOperation() {
  std::lock_guard lock(mutex_);
  active_token_.reset();
}

void Deployment::Cancel(const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (active_token_) {
    MESHDEPLOY_LOG_WARN("Cancelling deployment operation", {StringField("deployment", id_), StringField("reason", reason)});
    active_token_->Cancel(reason);
  }
}

model::Service& Deployment::ServiceOrThrow(const std::string& service_id) const {
  std::lock_guard lock(mutex_);
  auto            it = services_.find(service_id);
  if (it == services_.end()) {
    throw util::NotFound("service " + service_id + " not found in deployment " + id_);
  }
  return *it->second;
}

std::shared_ptr<supervisor::ProcessSupervisor> Deployment::SupervisorOrThrow(const std::string& service_id) const {
  std::lock_guard lock(mutex_);
  if (!services_.contains(service_id)) {
    throw util::NotFound("service " + service_id + " not found in deployment " + id_);
  }
  auto it = supervisors_.find(service_id);
  if (it == supervisors_.end()) {
    if (services_.at(service_id)->IsExternal()) {
      throw util::InvalidState("service " + service_id + " is external and never launched");
    }
    throw util::InvalidState("service " + service_id + " has not been launched");
  }
  return it->second;
}

void Deployment::UpdateRunningGauge() const {
  std::uint64_t running = 0;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [service_id, service] : services_) {
      if (service->State() == model::ServiceState::kRunning) ++running;
    }
  }
  observability::Metrics::Instance().SetRunningServices(running);
}

// ------------------------------------------------------------
// Deploy
// ------------------------------------------------------------

void Deployment::ProvisionHosts(util::CancellationToken& token) {
  std::vector<model::Host*> hosts;
  {
    std::lock_guard lock(mutex_);
    for (const auto& host_id : host_order_) {
      hosts.push_back(hosts_.at(host_id).get());
    }
  }

  FanOut("provision", options_.provision_concurrency, hosts, token,
         [&](model::Host* host) { host->Provision(options_.provision_retry, token); });
}

void Deployment::ResolveNetwork(const util::CancellationToken& token) {
  std::map<std::string, const model::Service*> services;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [service_id, service] : services_) {
      services.emplace(service_id, service.get());
    }
  }

  auto wiring = resolver_.Resolve(graph_.Connections(), services, token);

  std::lock_guard lock(mutex_);
  wiring_ = std::move(wiring);
}

void Deployment::BuildArtifacts(util::CancellationToken& token) {
  using BuildKey = std::pair<std::string, model::HostTargetKind>;

  std::vector<std::string>            order;
  std::vector<BuildKey>               keys;
  std::map<std::string, BuildKey>     key_of;
  {
    std::lock_guard lock(mutex_);
    order = service_order_;
    for (const auto& service_id : order) {
      const auto& service = *services_.at(service_id);
      if (service.IsExternal()) continue;
      BuildKey key{service.SourceRef(), service.GetHost().TargetKind()};
      if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(key);
      }
      key_of.emplace(service_id, key);
    }
  }

  if (!keys.empty() && !capabilities_.builder) {
    throw util::BuildError("deployment " + id_ + " has no build capability");
  }

  std::mutex                               built_mutex;
  std::map<BuildKey, capability::Artifact> built;
  FanOut("build", options_.provision_concurrency, keys, token, [&](const BuildKey& key) {
    auto artifact = capabilities_.builder->Build(key.first, key.second);
    MESHDEPLOY_LOG_DEBUG("Artifact built", {StringField("source", key.first), StringField("target", model::ToString(key.second)),
                                            StringField("path", artifact.path)});
    std::lock_guard lock(built_mutex);
    built.emplace(key, std::move(artifact));
  });

  for (const auto& [service_id, key] : key_of) {
    {
      std::lock_guard lock(mutex_);
      artifacts_[service_id] = built.at(key);
    }
    ServiceOrThrow(service_id).TransitionTo(model::ServiceState::kArtifactReady);
  }
}

void Deployment::PlaceArtifacts(util::CancellationToken& token) {
  std::vector<std::string> order;
  {
    std::lock_guard lock(mutex_);
    for (const auto& service_id : service_order_) {
      auto& service = *services_.at(service_id);
      if (!service.IsExternal()) {
        order.push_back(service_id);
        continue;
      }
      // nothing to build or place: the caller reads the wiring back
      service.TransitionTo(model::ServiceState::kArtifactReady);
      service.TransitionTo(model::ServiceState::kDeployed);
    }
  }

  if (!order.empty() && !capabilities_.executor) {
    throw util::PlacementError("deployment " + id_ + " has no execution capability");
  }

  FanOut("place", options_.provision_concurrency, order, token, [&](const std::string& service_id) {
    auto& service = ServiceOrThrow(service_id);
    auto  handle  = service.GetHost().Handle();

    capability::Artifact artifact;
    model::ServiceWiring wiring;
    {
      std::lock_guard lock(mutex_);
      artifact = artifacts_.at(service_id);
      wiring   = wiring_.at(service_id);
    }

    capabilities_.executor->PlaceArtifact(*handle, artifact, wiring);
    service.TransitionTo(model::ServiceState::kDeployed);
  });
}

void Deployment::Deploy() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (state_ == model::DeploymentState::kEmpty) {
      throw util::InvalidState("deploy: deployment " + id_ + " has nothing declared");
    }
    if (state_ != model::DeploymentState::kDeclared) {
      throw util::InvalidState("deploy: deployment " + id_ + " is " + std::string(model::ToString(state_)));
    }
    deploy_requested_ = true;
  }

  observability::OperationScope op("deploy", id_);
  auto                          token = BeginOperation(options_.deploy_timeout);

  try {
    ProvisionHosts(token);
    SetState(model::DeploymentState::kProvisioned);
    ResolveNetwork(token);
    BuildArtifacts(token);
    PlaceArtifacts(token);
    SetState(model::DeploymentState::kDeployed);
  } catch (const std::exception& e) {
    op.Fail(e.what());
    MESHDEPLOY_LOG_ERROR("Deploy failed, rolling back", {StringField("deployment", id_), StringField("error", e.what())});
    token.Cancel("deploy failed");
    EndOperation();
    TeardownLocked(false);
    throw;
  }

  EndOperation();
  MESHDEPLOY_LOG_INFO("Deployment deployed", {StringField("deployment", id_), IntField("hosts", static_cast<std::int64_t>(host_order_.size())),
                                              IntField("services", static_cast<std::int64_t>(service_order_.size())),
                                              IntField("connections", static_cast<std::int64_t>(graph_.Size()))});
}

// ------------------------------------------------------------
// Start
// ------------------------------------------------------------

void Deployment::LaunchService(const std::string& service_id, const util::CancellationToken& token) {
  auto& service = ServiceOrThrow(service_id);
  auto  handle  = service.GetHost().Handle();

  capability::Artifact artifact;
  {
    std::lock_guard lock(mutex_);
    artifact = artifacts_.at(service_id);
  }

  supervisor::SupervisorOptions supervisor_options;
  supervisor_options.output_buffer_lines     = options_.output_buffer_lines;
  supervisor_options.unobserved_output_level = options_.unobserved_output_level;

  auto                     supervisor = supervisor::ProcessSupervisor::Create(service_id, capabilities_.executor, supervisor_options);
  std::weak_ptr<ExitRelay> relay      = relay_;
  supervisor->SetExitListener([relay](const std::string& id, int exit_code, bool stop_requested) {
    if (auto target = relay.lock()) {
      std::lock_guard lock(target->mutex);
      if (target->owner) {
        target->owner->OnServiceExit(id, exit_code, stop_requested);
      }
    }
  });
  {
    std::lock_guard lock(mutex_);
    supervisors_[service_id] = supervisor;
  }

  supervisor->Launch(*handle, artifact, capability::LaunchRequest{id_, service_id, service.Args()});
  supervisor->AwaitListening(options_.listen_timeout, token);

  if (!service.TryTransitionTo(model::ServiceState::kRunning)) {
    const auto code = supervisor->WaitExit(std::chrono::milliseconds(0)).value_or(-1);
    throw util::ProcessCrash(service_id, code, "service " + service_id + " failed right after it started listening");
  }
  UpdateRunningGauge();
  MESHDEPLOY_LOG_INFO("Service listening", {StringField("deployment", id_), StringField("service", service_id),
                                            StringField("host", service.GetHost().Id())});
}

void Deployment::OnServiceExit(const std::string& service_id, int exit_code, bool stop_requested) {
  model::Service* service = nullptr;
  {
    std::lock_guard lock(mutex_);
    auto            it = services_.find(service_id);
    if (it == services_.end()) {
      return;
    }
    service = it->second.get();
  }

  if (stop_requested) {
    // a process stopped before it was listening never ran as a service
    const auto next = service->State() == model::ServiceState::kRunning ? model::ServiceState::kStopped : model::ServiceState::kFailed;
    if (!service->TryTransitionTo(next)) {
      MESHDEPLOY_LOG_WARN("Stopped service kept its state", {StringField("deployment", id_), StringField("service", service_id),
                                                             StringField("state", model::ToString(service->State()))});
    }
    observability::Metrics::Instance().RecordServiceExit("stopped");
    UpdateRunningGauge();
    return;
  }

  DeploymentEvent event;
  event.service_id = service_id;
  event.exit_code  = exit_code;
  event.time       = util::Now();

  if (exit_code == 0 && service->State() == model::ServiceState::kRunning) {
    service->TryTransitionTo(model::ServiceState::kStopped);
    event.kind    = EventKind::kServiceCompleted;
    event.message = "service " + service_id + " completed";
  } else {
    service->TryTransitionTo(model::ServiceState::kFailed);
    event.kind    = EventKind::kServiceCrashed;
    event.message = "service " + service_id + " exited unexpectedly with status " + std::to_string(exit_code);
  }

  bool partially_failed = false;
  if (event.kind == EventKind::kServiceCrashed) {
    std::lock_guard lock(mutex_);
    if (state_ == model::DeploymentState::kStarted) {
      state_           = model::DeploymentState::kPartiallyFailed;
      partially_failed = true;
    } else if (state_ == model::DeploymentState::kDeployed) {
      if (!startup_failure_) startup_failure_ = event;
      if (active_token_) active_token_->Cancel(event.message);
    }
  }

  observability::Metrics::Instance().RecordServiceExit(event.kind == EventKind::kServiceCrashed ? "crashed" : "completed");
  Publish(event);
  if (partially_failed) {
    MESHDEPLOY_LOG_ERROR("Deployment partially failed", {StringField("deployment", id_), StringField("service", service_id),
                                                         IntField("exit_code", exit_code)});
    DeploymentEvent state_event;
    state_event.kind       = EventKind::kStateChanged;
    state_event.service_id = service_id;
    state_event.message    = "started -> partially-failed";
    state_event.time       = util::Now();
    Publish(std::move(state_event));
  }
  UpdateRunningGauge();
}

void Deployment::Start() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (state_ != model::DeploymentState::kDeployed) {
      throw util::InvalidState("start: deployment " + id_ + " is " + std::string(model::ToString(state_)));
    }
    startup_failure_.reset();
  }

  observability::OperationScope op("start", id_);
  auto                          token = BeginOperation(options_.start_timeout);

  try {
    std::vector<std::vector<std::string>> waves;
    for (auto& wave : graph_.StartWaves()) {
      std::erase_if(wave, [&](const std::string& service_id) { return ServiceOrThrow(service_id).IsExternal(); });
      if (!wave.empty()) waves.push_back(std::move(wave));
    }

    // bind: every wave is listening before the next one launches
    for (const auto& wave : waves) {
      FanOut("launch", options_.provision_concurrency, wave, token,
             [&](const std::string& service_id) { LaunchService(service_id, token); });
    }

    // connect
    for (const auto& wave : waves) {
      for (const auto& service_id : wave) {
        token.ThrowIfCancelled("start " + service_id);
        SupervisorOrThrow(service_id)->Start();
      }
    }

    {
      std::lock_guard lock(mutex_);
      if (startup_failure_) {
        throw util::ProcessCrash(startup_failure_->service_id, startup_failure_->exit_code, startup_failure_->message);
      }
      state_ = model::DeploymentState::kStarted;
    }
    DeploymentEvent event;
    event.kind    = EventKind::kStateChanged;
    event.message = "deployed -> started";
    event.time    = util::Now();
    Publish(std::move(event));
  } catch (const std::exception& e) {
    op.Fail(e.what());
    MESHDEPLOY_LOG_ERROR("Start failed, tearing down", {StringField("deployment", id_), StringField("error", e.what())});
    token.Cancel("start failed");
    EndOperation();
    TeardownLocked(false);

    std::optional<DeploymentEvent> crash;
    {
      std::lock_guard lock(mutex_);
      crash = startup_failure_;
    }
    if (crash && dynamic_cast<const util::ProcessCrash*>(&e) == nullptr) {
      throw util::ProcessCrash(crash->service_id, crash->exit_code, crash->message);
    }
    throw;
  }

  EndOperation();
  MESHDEPLOY_LOG_INFO("Deployment started", {StringField("deployment", id_)});
}

// ------------------------------------------------------------
// Stop and teardown
// ------------------------------------------------------------

std::vector<std::string> Deployment::StopServices() {
  std::vector<std::shared_ptr<supervisor::ProcessSupervisor>> live;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [service_id, supervisor] : supervisors_) {
      if (!supervisor->Exited()) live.push_back(supervisor);
    }
  }
  if (live.empty()) {
    return {};
  }

  concurrency::TaskPool                                 pool("stop", std::min(live.size(), kMaxStopWorkers));
  std::vector<std::future<std::optional<std::string>>> futures;
  for (const auto& supervisor : live) {
    futures.push_back(pool.Submit([this, supervisor]() -> std::optional<std::string> {
      try {
        if (!supervisor->Stop(options_.stop_grace, options_.kill_timeout)) {
          return "service " + supervisor->ServiceId() + " did not exit after kill";
        }
        return std::nullopt;
      } catch (const std::exception& e) {
        return "stop service " + supervisor->ServiceId() + ": " + e.what();
      }
    }));
  }

  std::vector<std::string> failures;
  for (auto& future : futures) {
    if (auto failure = future.get()) failures.push_back(std::move(*failure));
  }
  return failures;
}

TeardownReport Deployment::TeardownLocked(bool services_stopped) {
  TeardownReport report;
  {
    std::lock_guard lock(mutex_);
    if (state_ == model::DeploymentState::kTornDown) {
      return report;
    }
  }

  observability::SpanScope span("deployment.teardown");
  span.SetAttribute("deployment", id_);

  if (!services_stopped) {
    report.failures = StopServices();
  }

  for (auto& failure : resolver_.ReleaseAll()) {
    report.failures.push_back(std::move(failure));
  }

  std::vector<model::Host*> hosts;
  {
    std::lock_guard lock(mutex_);
    for (const auto& host_id : host_order_) {
      hosts.push_back(hosts_.at(host_id).get());
    }
  }
  if (!hosts.empty()) {
    concurrency::TaskPool                                 pool("deprovision", std::min(hosts.size(), std::max<std::size_t>(options_.provision_concurrency, 1)));
    std::vector<std::future<std::optional<std::string>>> futures;
    for (auto* host : hosts) {
      futures.push_back(pool.Submit([host]() -> std::optional<std::string> {
        try {
          host->Deprovision();
          return std::nullopt;
        } catch (const std::exception& e) {
          return "deprovision host " + host->Id() + ": " + e.what();
        }
      }));
    }
    for (auto& future : futures) {
      if (auto failure = future.get()) report.failures.push_back(std::move(*failure));
    }
  }

  SetState(model::DeploymentState::kTornDown);

  for (const auto& failure : report.failures) {
    MESHDEPLOY_LOG_WARN("Teardown failure", {StringField("deployment", id_), StringField("error", failure)});
    DeploymentEvent event;
    event.kind    = EventKind::kTeardownFailure;
    event.message = failure;
    event.time    = util::Now();
    Publish(std::move(event));
  }
  observability::Metrics::Instance().RecordTeardownFailures(report.failures.size());
  UpdateRunningGauge();
  MESHDEPLOY_LOG_INFO("Deployment torn down", {StringField("deployment", id_), IntField("failures", static_cast<std::int64_t>(report.failures.size()))});
  return report;
}

TeardownReport Deployment::Stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (state_ != model::DeploymentState::kStarted && state_ != model::DeploymentState::kPartiallyFailed) {
      throw util::InvalidState("stop: deployment " + id_ + " is " + std::string(model::ToString(state_)));
    }
  }

  observability::OperationScope op("stop", id_);
  auto                          failures = StopServices();

  bool stopped = false;
  {
    std::lock_guard lock(mutex_);
    if (state_ == model::DeploymentState::kStarted) {
      state_  = model::DeploymentState::kStopped;
      stopped = true;
    }
  }
  if (stopped) {
    DeploymentEvent event;
    event.kind    = EventKind::kStateChanged;
    event.message = "started -> stopped";
    event.time    = util::Now();
    Publish(std::move(event));
  }

  auto report = TeardownLocked(true);
  report.failures.insert(report.failures.begin(), failures.begin(), failures.end());

  if (!report.Clean()) {
    op.Fail(std::to_string(report.failures.size()) + " teardown failures");
  }
  return report;
}

TeardownReport Deployment::Teardown() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (state_ == model::DeploymentState::kEmpty) {
      throw util::InvalidState("teardown: deployment " + id_ + " has nothing declared");
    }
    if (state_ == model::DeploymentState::kTornDown) {
      return {};
    }
  }
  return TeardownLocked(false);
}

// ------------------------------------------------------------
// Observation
// ------------------------------------------------------------

model::DeploymentState Deployment::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

model::HostState Deployment::HostStateOf(const std::string& host_id) const {
  std::lock_guard lock(mutex_);
  auto            it = hosts_.find(host_id);
  if (it == hosts_.end()) {
    throw util::NotFound("host " + host_id + " not found in deployment " + id_);
  }
  return it->second->State();
}

model::ServiceState Deployment::ServiceStateOf(const std::string& service_id) const {
  return ServiceOrThrow(service_id).State();
}

model::ServiceKind Deployment::ServiceKindOf(const std::string& service_id) const {
  return ServiceOrThrow(service_id).Kind();
}

model::ServiceWiring Deployment::Wiring(const std::string& service_id) const {
  std::lock_guard lock(mutex_);
  if (!services_.contains(service_id)) {
    throw util::NotFound("service " + service_id + " not found in deployment " + id_);
  }
  auto it = wiring_.find(service_id);
  if (it == wiring_.end()) {
    throw util::InvalidState("wiring for " + service_id + " has not been resolved");
  }
  return it->second;
}

DeploymentStatus Deployment::Status() const {
  std::lock_guard  lock(mutex_);
  DeploymentStatus status;
  status.id    = id_;
  status.state = state_;

  for (const auto& host_id : host_order_) {
    const auto&  host = *hosts_.at(host_id);
    HostSnapshot snapshot{host.Id(), host.Provider(), host.State(), host.GetLocality(), {}};
    if (auto handle = host.Handle()) {
      snapshot.address = handle->public_address.empty() ? handle->private_address : handle->public_address;
    }
    status.hosts.push_back(std::move(snapshot));
  }

  for (const auto& service_id : service_order_) {
    const auto&     service = *services_.at(service_id);
    ServiceSnapshot snapshot{service.Id(), service.GetHost().Id(), service.Kind(), service.State(), std::nullopt};
    auto            supervisor = supervisors_.find(service_id);
    if (supervisor != supervisors_.end() && supervisor->second->Exited()) {
      snapshot.exit_code = supervisor->second->ExitCode(false);
    }
    status.services.push_back(std::move(snapshot));
  }
  return status;
}

std::vector<model::Connection> Deployment::Connections() const {
  std::lock_guard lock(mutex_);
  return graph_.Connections();
}

std::vector<capability::NetworkResource> Deployment::NetworkResources() const {
  return resolver_.Resources();
}

std::unique_ptr<supervisor::OutputSubscription> Deployment::Subscribe(const std::string& service_id, supervisor::OutputFilter filter) {
  return SupervisorOrThrow(service_id)->Subscribe(std::move(filter));
}

int Deployment::ExitCode(const std::string& service_id, bool wait) {
  return SupervisorOrThrow(service_id)->ExitCode(wait);
}

std::vector<DeploymentEvent> Deployment::DrainEvents() {
  std::lock_guard lock(mutex_);
  std::vector<DeploymentEvent> out(events_.begin() + static_cast<std::ptrdiff_t>(drained_), events_.end());
  drained_ = events_.size();
  return out;
}

std::vector<DeploymentEvent> Deployment::Events() const {
  std::lock_guard lock(mutex_);
  return events_;
}

void Deployment::SetEventListener(EventListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

} // namespace meshdeploy::core
