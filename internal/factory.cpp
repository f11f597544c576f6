#include "factory.hpp"

#include <memory>
#include <string>
#include <vector>

#include "internal/build/prebuilt_builder.hpp"
#include "internal/exec/executor_router.hpp"
#include "internal/exec/local_executor.hpp"
#include "internal/exec/process_runner.hpp"
#include "internal/exec/ssh_executor.hpp"
#include "internal/grpc/control_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/providers/local_provisioner.hpp"
#include "internal/providers/ssh_network.hpp"
#include "internal/providers/static_provisioner.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace meshdeploy::factory {

namespace cfg = meshdeploy::runtime::config;

namespace {

exec::SshOptions ToSshOptions(const cfg::ExecutionConfig& execution, const std::string& ssh_binary) {
  exec::SshOptions options;
  options.ssh_binary = ssh_binary;
  options.scp_binary = execution.scp_binary();
  options.extra_options.assign(execution.ssh_options().begin(), execution.ssh_options().end());
  return options;
}

} // namespace

core::DeploymentOptions ToDeploymentOptions(const cfg::RuntimeConfig& config) {
  const auto& orchestrator = config.orchestrator();
  const auto& retry        = orchestrator.provision_retry();

  core::DeploymentOptions options;
  options.provision_concurrency           = orchestrator.provision_concurrency();
  options.provision_retry.max_attempts    = retry.max_attempts();
  options.provision_retry.initial_backoff = util::ToMillis(retry.initial_backoff());
  options.provision_retry.max_backoff     = util::ToMillis(retry.max_backoff());
  options.provision_retry.multiplier      = retry.multiplier();
  options.listen_timeout                  = util::ToMillis(orchestrator.listen_timeout());
  options.stop_grace                      = util::ToMillis(orchestrator.stop_grace());
  options.kill_timeout                    = util::ToMillis(orchestrator.kill_timeout());
  options.deploy_timeout                  = util::ToMillis(orchestrator.deploy_timeout());
  options.start_timeout                   = util::ToMillis(orchestrator.start_timeout());
  options.output_buffer_lines             = orchestrator.output_buffer_lines();
  options.unobserved_output_level         = observability::ParseLevel(config.logging().service_output_level()).value_or(spdlog::level::info);

  const auto& network                  = config.network();
  options.network.base_port            = static_cast<std::uint16_t>(network.base_port());
  options.network.default_ingress_cidr = network.default_ingress_cidr();
  options.network.unix_sockets_same_host = network.unix_sockets_same_host();
  options.network.socket_dir           = network.socket_dir();
  return options;
}

core::Capabilities BuildCapabilities(const cfg::RuntimeConfig& config) {
  const auto& execution = config.execution();

  // one reactor thread serves every child process of the daemon
  auto runner = std::make_shared<exec::ProcessRunner>();

  core::Capabilities caps;

  // ------------------------------------------------------------------
  // Providers
  // ------------------------------------------------------------------
  caps.provisioners["local"] = std::make_shared<providers::LocalProvisioner>();

  providers::StaticProvisionerOptions static_options;
  static_options.ssh = ToSshOptions(execution, execution.ssh_binary());
  caps.provisioners["static"] = std::make_shared<providers::StaticProvisioner>(static_options, runner);

  // ------------------------------------------------------------------
  // Build, execution, network
  // ------------------------------------------------------------------
  std::vector<std::filesystem::path> search_paths(config.build().search_paths().begin(), config.build().search_paths().end());
  caps.builder = std::make_shared<build::PrebuiltBuilder>(std::move(search_paths));

  exec::LocalExecutorOptions local_options;
  local_options.work_root = execution.work_root();

  exec::SshExecutorOptions ssh_options;
  ssh_options.ssh          = ToSshOptions(execution, execution.ssh_binary());
  ssh_options.remote_root  = execution.remote_root();
  ssh_options.staging_root = std::filesystem::path(execution.work_root()) / ".staging";

  caps.executor = std::make_shared<exec::ExecutorRouter>(std::make_shared<exec::LocalExecutor>(local_options, runner),
                                                         std::make_shared<exec::SshExecutor>(ssh_options, runner));

  providers::SshNetworkOptions network_options;
  network_options.ssh = ToSshOptions(execution, config.network().ssh_binary());
  caps.network        = std::make_shared<providers::SshNetwork>(network_options, runner);

  return caps;
}

/*
    Build full application dependency graph
*/
Application Build(const cfg::RuntimeConfig& config, const topology::TopologySpec& topology, std::function<void()> on_stopped) {
  Application app;

  const auto deployment_id = topology.deployment_id().empty() ? "deploy-" + util::RandomHexId() : topology.deployment_id();

  app.deployment = std::make_shared<core::Deployment>(deployment_id, BuildCapabilities(config), ToDeploymentOptions(config));
  topology::ApplyTopology(topology, *app.deployment);

  service::ServiceContext ctx;
  ctx.deployment = app.deployment;
  ctx.on_stopped = std::move(on_stopped);

  app.control_service = std::make_shared<service::ControlService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::ControlServer>(app.control_service));

  return app;
}

} // namespace meshdeploy::factory
