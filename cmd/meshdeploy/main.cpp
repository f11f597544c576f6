#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/topology/topology_loader.hpp"
#include "internal/util/errors.hpp"

using meshdeploy::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: meshdeploy [--config <config.yaml>] <topology.yaml>" << std::endl;
}

static void ShutdownObservability() {
  meshdeploy::observability::ShutdownLogging();
  meshdeploy::observability::ShutdownMetrics();
  meshdeploy::observability::ShutdownTracing();
}

static bool Finished(meshdeploy::model::DeploymentState state) {
  return state == meshdeploy::model::DeploymentState::kStopped || state == meshdeploy::model::DeploymentState::kTornDown;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string topology_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (topology_path.empty() && !arg.starts_with("--")) {
      topology_path = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (topology_path.empty()) {
    Usage();
    return 1;
  }

  using namespace meshdeploy;

  std::shared_ptr<core::Deployment> deployment;
  std::unique_ptr<Server>           server;
  std::atomic<bool>                 remote_stop{false};

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? meshdeploy::config::ConfigLoader::LoadFromString("{}")
                                      : meshdeploy::config::ConfigLoader::LoadFromYaml(config_path);

    observability::InitializeTracing(config);
    observability::InitializeMetrics(config);
    observability::InitializeLogging(config);

    const auto spec = topology::LoadTopology(topology_path);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app   = factory::Build(config, spec, [&remote_stop] { remote_stop = true; });
    deployment = app.deployment;

    deployment->SetEventListener([](const core::DeploymentEvent& event) {
      MESHDEPLOY_LOG_INFO("Deployment event", {observability::StringField("kind", core::ToString(event.kind)),
                                               observability::StringField("service", event.service_id),
                                               observability::IntField("exit_code", event.exit_code),
                                               observability::StringField("message", event.message)});
    });

    // Register signal handlers before deploying so Ctrl-C always reaches teardown.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (!config.server().bind_address().empty()) {
      server = std::make_unique<Server>(config.server().bind_address(), std::move(app.grpc_services));
      server->Start();
    }

    // ------------------------------------------------------------
    // Bring the topology up
    // ------------------------------------------------------------
    // Deploy and Start block; they run aside so a signal can cancel them.
    auto bring_up = std::async(std::launch::async, [deployment] {
      deployment->Deploy();
      deployment->Start();
    });
    bool cancelled = false;
    while (bring_up.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
      if (!g_running && !cancelled) {
        MESHDEPLOY_LOG_WARN("Interrupted while bringing the deployment up", {observability::StringField("deployment", deployment->Id())});
        deployment->Cancel("interrupted by signal");
        cancelled = true;
      }
    }
    bring_up.get();
    MESHDEPLOY_LOG_INFO("Deployment running", {observability::StringField("deployment", deployment->Id())});

    while (g_running && !remote_stop && !Finished(deployment->State())) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    MESHDEPLOY_LOG_INFO("Shutting down deployment", {observability::StringField("deployment", deployment->Id())});
    const auto report = deployment->Teardown();
    if (server) server->Stop();

    for (const auto& failure : report.failures) {
      MESHDEPLOY_LOG_WARN("Teardown failure", {observability::StringField("failure", failure)});
    }
    ShutdownObservability();
    return report.Clean() ? 0 : 3;
  } catch (const util::ConfigError& e) {
    MESHDEPLOY_LOG_ERROR("Invalid configuration", {observability::StringField("error", e.what())});
    ShutdownObservability();
    return 1;
  } catch (const std::exception& e) {
    MESHDEPLOY_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    // an empty deployment has nothing to release
    if (deployment && deployment->State() != model::DeploymentState::kEmpty) {
      try {
        const auto report = deployment->Teardown();
        for (const auto& failure : report.failures) {
          MESHDEPLOY_LOG_WARN("Teardown failure", {observability::StringField("failure", failure)});
        }
      } catch (const std::exception& teardown_error) {
        MESHDEPLOY_LOG_ERROR("Teardown failed", {observability::StringField("error", teardown_error.what())});
      }
    }
    if (server) server->Stop();
    ShutdownObservability();
    return 2;
  }
}
