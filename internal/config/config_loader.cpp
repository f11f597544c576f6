#include "internal/config/config_loader.hpp"

#include "internal/config/yaml_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace meshdeploy::config {

namespace cfg = meshdeploy::runtime::config;

namespace {

bool IsZero(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

void DefaultDuration(google::protobuf::Duration* d, std::int64_t ms) {
  if (IsZero(*d)) *d = util::ToDuration(std::chrono::milliseconds(ms));
}

void DefaultString(std::string* value, const char* fallback) {
  if (value->empty()) *value = fallback;
}

void CheckLevel(const std::string& level, const char* field) {
  if (level.empty()) return;
  if (!observability::ParseLevel(level)) {
    throw util::ConfigError(std::string(field) + ": unknown log level '" + level + "'");
  }
}

void CheckNonNegative(const google::protobuf::Duration& d, const char* field) {
  if (d.seconds() < 0 || d.nanos() < 0) {
    throw util::ConfigError(std::string(field) + " must not be negative");
  }
}

} // namespace

cfg::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  cfg::RuntimeConfig config;
  LoadYamlFileInto(path, &config);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

cfg::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw util::ConfigError("Failed to parse YAML config: " + std::string(e.what()));
  }

  cfg::RuntimeConfig config;
  ParseYamlInto(node, &config, "configuration");
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ApplyDefaults(cfg::RuntimeConfig* config) {
  auto* logging = config->mutable_logging();
  DefaultString(logging->mutable_level(), "info");
  DefaultString(logging->mutable_service_output_level(), "info");

  auto* orchestrator = config->mutable_orchestrator();
  if (orchestrator->provision_concurrency() == 0) orchestrator->set_provision_concurrency(8);
  auto* retry = orchestrator->mutable_provision_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(5);
  DefaultDuration(retry->mutable_initial_backoff(), 500);
  DefaultDuration(retry->mutable_max_backoff(), 30000);
  if (retry->multiplier() == 0) retry->set_multiplier(2.0);
  DefaultDuration(orchestrator->mutable_listen_timeout(), 60000);
  DefaultDuration(orchestrator->mutable_stop_grace(), 10000);
  DefaultDuration(orchestrator->mutable_kill_timeout(), 5000);
  if (orchestrator->output_buffer_lines() == 0) orchestrator->set_output_buffer_lines(4096);

  auto* network = config->mutable_network();
  if (network->base_port() == 0) network->set_base_port(21000);
  DefaultString(network->mutable_ssh_binary(), "ssh");
  DefaultString(network->mutable_default_ingress_cidr(), "0.0.0.0/0");
  DefaultString(network->mutable_socket_dir(), "/tmp");

  auto* execution = config->mutable_execution();
  DefaultString(execution->mutable_work_root(), "/tmp/meshdeploy");
  DefaultString(execution->mutable_remote_root(), "/tmp/meshdeploy");
  DefaultString(execution->mutable_ssh_binary(), "ssh");
  DefaultString(execution->mutable_scp_binary(), "scp");

  if (config->build().search_paths_size() == 0) {
    config->mutable_build()->add_search_paths(".");
  }
}

void Validate(const cfg::RuntimeConfig& config) {
  CheckLevel(config.logging().level(), "logging.level");
  CheckLevel(config.logging().service_output_level(), "logging.service_output_level");

  const auto& orchestrator = config.orchestrator();
  if (orchestrator.provision_retry().multiplier() < 1.0) {
    throw util::ConfigError("orchestrator.provision_retry.multiplier must be >= 1");
  }
  CheckNonNegative(orchestrator.listen_timeout(), "orchestrator.listen_timeout");
  CheckNonNegative(orchestrator.stop_grace(), "orchestrator.stop_grace");
  CheckNonNegative(orchestrator.kill_timeout(), "orchestrator.kill_timeout");
  CheckNonNegative(orchestrator.deploy_timeout(), "orchestrator.deploy_timeout");
  CheckNonNegative(orchestrator.start_timeout(), "orchestrator.start_timeout");

  const auto ratio = config.observability().tracing().sample_ratio();
  if (ratio < 0.0 || ratio > 1.0) {
    throw util::ConfigError("observability.tracing.sample_ratio must be within [0, 1]");
  }

  if (config.network().base_port() > 65535) {
    throw util::ConfigError("network.base_port out of range: " + std::to_string(config.network().base_port()));
  }
}

} // namespace meshdeploy::config
