#include "internal/exec/local_executor.hpp"

#include <signal.h>

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/build/prebuilt_builder.hpp"
#include "internal/core/deployment.hpp"
#include "internal/exec/wiring_codec.hpp"
#include "internal/providers/local_provisioner.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/scripts.hpp"

namespace {

using meshdeploy::capability::ProcessSignal;
using meshdeploy::model::HostTargetKind;
using meshdeploy::testing::ScratchDir;
using namespace std::chrono_literals;

struct Lines {
  std::mutex               mutex;
  std::condition_variable  cv;
  std::vector<std::string> lines;
  std::optional<int>       exit_code;

  meshdeploy::capability::ProcessObserver Observer() {
    meshdeploy::capability::ProcessObserver observer;
    observer.on_line = [this](meshdeploy::capability::OutputChannel, const std::string& line) {
      std::lock_guard lock(mutex);
      lines.push_back(line);
      cv.notify_all();
    };
    observer.on_exit = [this](int code) {
      std::lock_guard lock(mutex);
      exit_code = code;
      cv.notify_all();
    };
    return observer;
  }

  bool WaitFor(const std::string& line, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, timeout, [&] {
      for (const auto& seen : lines) {
        if (seen == line) return true;
      }
      return false;
    });
  }

  std::optional<int> WaitForExit(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    cv.wait_for(lock, timeout, [&] { return exit_code.has_value(); });
    return exit_code;
  }
};

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

meshdeploy::capability::ProvisionedHandle LocalHost() {
  meshdeploy::providers::LocalProvisioner provisioner;
  return provisioner.Provision({"d1", "laptop", meshdeploy::model::Locality::Local(), {}});
}

void TestPlaceAndLaunch() {
  ScratchDir bin("meshdeploy-bin");
  ScratchDir work("meshdeploy-work");
  const auto echo = bin.Script("echoer", R"(echo "args=$*"
echo "service=$MESHDEPLOY_SERVICE deployment=$MESHDEPLOY_DEPLOYMENT"
test -f "$MESHDEPLOY_CONFIG" && echo ready
read go
echo "signal=$go"
while :; do sleep 1; done)");

  meshdeploy::exec::LocalExecutor executor({work.Path()});
  const auto                      host = LocalHost();
  const meshdeploy::capability::Artifact artifact{"echoer", HostTargetKind::kLocal, echo.string()};

  meshdeploy::model::ServiceWiring wiring;
  wiring.deployment_id = "d1";
  wiring.service_id    = "echo";
  wiring.connects["out"] = {meshdeploy::model::TransportKind::kTcp, "127.0.0.1", 21007};
  executor.PlaceArtifact(host, artifact, wiring);

  const auto dir = executor.ServiceDirectory("d1", "echo");
  assert(dir == work.Path() / "d1" / "echo");
  assert(std::filesystem::exists(dir / "echoer"));
  const auto placed = meshdeploy::exec::DecodeWiringJson(ReadFile(dir / "wiring.json"));
  assert(placed.connects.at("out").port == 21007);

  Lines lines;
  auto  process = executor.Launch(host, artifact, {"d1", "echo", {"--fast", "x"}}, lines.Observer());
  assert(process->Describe().find("echo") != std::string::npos);
  assert(lines.WaitFor("ready", 5s));
  assert(lines.WaitFor("args=--fast x", 1s));
  assert(lines.WaitFor("service=echo deployment=d1", 1s));

  executor.Signal(*process, ProcessSignal::kStart);
  assert(lines.WaitFor("signal=start", 5s));

  executor.Signal(*process, ProcessSignal::kStop);
  assert(lines.WaitForExit(5s) == 128 + SIGTERM);
}

void TestKillEndsProcessThatIgnoresStop() {
  ScratchDir bin("meshdeploy-bin");
  ScratchDir work("meshdeploy-work");
  const auto stubborn = bin.Script("stubborn", R"(trap '' TERM
echo ready
while :; do sleep 1; done)");

  meshdeploy::exec::LocalExecutor executor({work.Path()});
  const auto                      host = LocalHost();
  const meshdeploy::capability::Artifact artifact{"stubborn", HostTargetKind::kLocal, stubborn.string()};
  executor.PlaceArtifact(host, artifact, {"d1", "s", {}, {}, {}, {}, {}});

  Lines lines;
  auto  process = executor.Launch(host, artifact, {"d1", "s", {}}, lines.Observer());
  assert(lines.WaitFor("ready", 5s));
  executor.Signal(*process, ProcessSignal::kStop);
  assert(!lines.WaitForExit(300ms).has_value());
  executor.Signal(*process, ProcessSignal::kKill);
  assert(lines.WaitForExit(5s) == 128 + SIGKILL);
}

void TestPlacementErrors() {
  ScratchDir                      work("meshdeploy-work");
  meshdeploy::exec::LocalExecutor executor({work.Path()});
  bool                            threw = false;
  try {
    executor.PlaceArtifact(LocalHost(), {"ghost", HostTargetKind::kLocal, "/nonexistent/ghost"}, {"d1", "ghost", {}, {}, {}, {}, {}});
  } catch (const meshdeploy::util::PlacementError&) {
    threw = true;
  }
  assert(threw);
}

void TestLocalProvisionerRejectsRemoteLocality() {
  meshdeploy::providers::LocalProvisioner provisioner;
  const auto                              handle = LocalHost();
  assert(handle.local);
  assert(handle.private_address == "127.0.0.1");
  assert(provisioner.TargetKind() == HostTargetKind::kLocal);

  try {
    provisioner.Provision({"d1", "remote", meshdeploy::model::Locality::Public(), {}});
    assert(false);
  } catch (const meshdeploy::util::ProvisionError& e) {
    assert(!e.retryable());
  }
}

/*
  web -> store on the operator machine with real processes: store must see
  its bind, web its endpoint, web completes on its own and store is stopped.
*/
void TestLocalDeploymentEndToEnd() {
  ScratchDir bin("meshdeploy-bin");
  ScratchDir work("meshdeploy-work");
  bin.Script("store", R"(grep -q '"peer_service": "web"' "$MESHDEPLOY_CONFIG" || exit 9
echo ready
read go
echo "store $go"
while :; do sleep 1; done)");
  bin.Script("web", R"(grep -q '"address": "127.0.0.1"' "$MESHDEPLOY_CONFIG" || exit 8
echo ready
read go
echo "web done")");

  auto runner = std::make_shared<meshdeploy::exec::ProcessRunner>();

  meshdeploy::core::Capabilities caps;
  caps.provisioners["local"] = std::make_shared<meshdeploy::providers::LocalProvisioner>();
  caps.builder               = std::make_shared<meshdeploy::build::PrebuiltBuilder>(std::vector<std::filesystem::path>{bin.Path()});
  caps.executor              = std::make_shared<meshdeploy::exec::LocalExecutor>(meshdeploy::exec::LocalExecutorOptions{work.Path()}, runner);

  meshdeploy::core::DeploymentOptions options;
  options.listen_timeout = 10s;
  options.stop_grace     = 3s;

  meshdeploy::core::Deployment deployment("e2e", caps, options);
  deployment.AddHost({"laptop", "local", meshdeploy::model::Locality::Local(), {}});
  deployment.AddService({"store", "laptop", "store", {{"in", meshdeploy::model::PortDirection::kSink, false}}, {}});
  deployment.AddService({"web", "laptop", "web", {{"out", meshdeploy::model::PortDirection::kSource, false}}, {}});
  deployment.Connect(deployment.Port("web", "out"), deployment.Port("store", "in"));

  deployment.Deploy();
  assert(std::filesystem::exists(work.Path() / "e2e" / "store" / "wiring.json"));

  deployment.Start();
  assert(deployment.ExitCode("web", true) == 0);
  assert(deployment.ServiceStateOf("web") == meshdeploy::model::ServiceState::kStopped);
  assert(deployment.ServiceStateOf("store") == meshdeploy::model::ServiceState::kRunning);
  assert(deployment.State() == meshdeploy::model::DeploymentState::kStarted);

  const auto report = deployment.Stop();
  assert(report.Clean());
  assert(deployment.ExitCode("store") == 128 + SIGTERM);
  assert(deployment.State() == meshdeploy::model::DeploymentState::kTornDown);
}

void TestLocalDeploymentReportsStartupCrash() {
  ScratchDir bin("meshdeploy-bin");
  ScratchDir work("meshdeploy-work");
  bin.Script("broken", "echo 'cannot bind' >&2\nexit 4");

  meshdeploy::core::Capabilities caps;
  caps.provisioners["local"] = std::make_shared<meshdeploy::providers::LocalProvisioner>();
  caps.builder               = std::make_shared<meshdeploy::build::PrebuiltBuilder>(std::vector<std::filesystem::path>{bin.Path()});
  caps.executor              = std::make_shared<meshdeploy::exec::LocalExecutor>(meshdeploy::exec::LocalExecutorOptions{work.Path()});

  meshdeploy::core::Deployment deployment("crash", caps);
  deployment.AddHost({"laptop", "local", meshdeploy::model::Locality::Local(), {}});
  deployment.AddService({"broken", "laptop", "broken", {}, {}});
  deployment.Deploy();

  try {
    deployment.Start();
    assert(false);
  } catch (const meshdeploy::util::ProcessCrash& e) {
    assert(e.service_id() == "broken");
    assert(e.exit_code() == 4);
  }
  assert(deployment.State() == meshdeploy::model::DeploymentState::kTornDown);
}

} // namespace

int main() {
  TestPlaceAndLaunch();
  TestKillEndsProcessThatIgnoresStop();
  TestPlacementErrors();
  TestLocalProvisionerRejectsRemoteLocality();
  TestLocalDeploymentEndToEnd();
  TestLocalDeploymentReportsStartupCrash();

  std::cout << "meshdeploy_unit_local_executor: pass\n";
  return 0;
}
