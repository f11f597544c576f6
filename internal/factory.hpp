#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/core/deployment.hpp"
#include "internal/service/control_service.hpp"
#include "internal/topology/topology_loader.hpp"

namespace meshdeploy::factory {

/*
  Application

  Owns everything the daemon keeps alive for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<core::Deployment>             deployment;
  std::shared_ptr<service::ControlService>      control_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

core::DeploymentOptions ToDeploymentOptions(const meshdeploy::runtime::config::RuntimeConfig& config);

/*
  Concrete collaborators: "local" and "static" providers, local and ssh
  executors behind a router, the prebuilt builder and ssh networking.
*/
core::Capabilities BuildCapabilities(const meshdeploy::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: creates the deployment, declares the topology on it and
  wires the control plane. Nothing is provisioned yet.
*/
Application Build(const meshdeploy::runtime::config::RuntimeConfig& config, const topology::TopologySpec& topology,
                  std::function<void()> on_stopped = {});

} // namespace meshdeploy::factory
