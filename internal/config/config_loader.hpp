#pragma once

#include <string>

#include "config/config.pb.h"

namespace meshdeploy::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; defaults are applied
  afterwards. Throws util::ConfigError.
*/
class ConfigLoader {
 public:
  static meshdeploy::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static meshdeploy::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

/*
  Fills zero or empty fields:

    logging.level / service_output_level   info
    orchestrator.provision_concurrency     8
    orchestrator.provision_retry           5 attempts, 500ms .. 30s, x2
    orchestrator.listen_timeout            60s
    orchestrator.stop_grace                10s
    orchestrator.kill_timeout              5s
    orchestrator.output_buffer_lines       4096
    network.base_port                      21000
    network.default_ingress_cidr           0.0.0.0/0
    network.socket_dir                     /tmp
    execution.work_root / remote_root      /tmp/meshdeploy
    ssh / scp binaries                     ssh / scp
    build.search_paths                     ["."]

  deploy_timeout and start_timeout stay unset (no deadline); an empty
  server.bind_address disables the control plane.
*/
void ApplyDefaults(meshdeploy::runtime::config::RuntimeConfig* config);

// Rejects values no default can fix (bad level names, ports out of range).
void Validate(const meshdeploy::runtime::config::RuntimeConfig& config);

} // namespace meshdeploy::config
