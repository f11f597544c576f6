#pragma once

#include <functional>
#include <memory>

namespace meshdeploy::core { class Deployment; }

namespace meshdeploy::service {

/*
  Dependency container shared by the control services.
*/
struct ServiceContext {
  std::shared_ptr<meshdeploy::core::Deployment> deployment;
  // Invoked after a remote Stop completed, e.g. to let the daemon exit.
  std::function<void()> on_stopped;
};

}
