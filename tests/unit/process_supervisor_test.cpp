#include "internal/supervisor/process_supervisor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"
#include "tests/support/fake_capabilities.hpp"

namespace {

using meshdeploy::capability::OutputChannel;
using meshdeploy::supervisor::ProcessSupervisor;
using meshdeploy::testing::CallLog;
using meshdeploy::testing::FakeBehavior;
using meshdeploy::testing::FakeExecutor;
using namespace std::chrono_literals;

struct Fixture {
  std::shared_ptr<CallLog>      log      = std::make_shared<CallLog>();
  std::shared_ptr<FakeExecutor> executor = std::make_shared<FakeExecutor>(log);

  std::shared_ptr<ProcessSupervisor> Launch(const std::string& service_id) {
    auto supervisor = ProcessSupervisor::Create(service_id, executor);
    meshdeploy::capability::ProvisionedHandle host;
    host.host_id = "h";
    host.local   = true;
    supervisor->Launch(host, {service_id, meshdeploy::model::HostTargetKind::kLocal, "/bin/" + service_id},
                       meshdeploy::capability::LaunchRequest{"d1", service_id, {}});
    return supervisor;
  }
};

void TestReadyLineIsConsumed() {
  Fixture f;
  auto    supervisor = f.Launch("api");
  supervisor->AwaitListening(1s, {});
  assert(supervisor->Listening());

  auto reader = supervisor->Subscribe();
  f.executor->Process("api")->Emit(OutputChannel::kStdout, "ready again");
  f.executor->Process("api")->Emit(OutputChannel::kStdout, "hello");

  // only the first ready line is swallowed
  auto line = reader->Next(100ms);
  assert(line && line->text == "ready again");
  line = reader->Next(100ms);
  assert(line && line->text == "hello");
}

void TestExitBeforeListeningIsACrash() {
  Fixture f;
  FakeBehavior behavior;
  behavior.ready          = false;
  behavior.exit_on_launch = 3;
  f.executor->SetBehavior("db", behavior);

  auto supervisor = f.Launch("db");
  try {
    supervisor->AwaitListening(1s, {});
    assert(false);
  } catch (const meshdeploy::util::ProcessCrash& e) {
    assert(e.service_id() == "db");
    assert(e.exit_code() == 3);
  }
  assert(supervisor->ExitCode(false) == 3);
}

void TestListenTimeoutAndCancellation() {
  Fixture      f;
  FakeBehavior silent;
  silent.ready = false;
  f.executor->SetBehavior("slow", silent);
  f.executor->SetBehavior("slower", silent);

  auto slow = f.Launch("slow");
  try {
    slow->AwaitListening(30ms, {});
    assert(false);
  } catch (const meshdeploy::util::Cancelled&) {
  }

  auto                                  slower = f.Launch("slower");
  meshdeploy::util::CancellationToken token;
  token.Cancel("deploy aborted");
  try {
    slower->AwaitListening(10s, token);
    assert(false);
  } catch (const meshdeploy::util::Cancelled& e) {
    assert(std::string(e.what()).find("deploy aborted") != std::string::npos);
  }
}

void TestExitCodeNonBlockingAndBlocking() {
  Fixture f;
  auto    supervisor = f.Launch("worker");
  try {
    supervisor->ExitCode(false);
    assert(false);
  } catch (const meshdeploy::util::StillRunning&) {
  }

  std::thread exiter([&] {
    std::this_thread::sleep_for(20ms);
    f.executor->Process("worker")->Exit(9);
  });
  assert(supervisor->ExitCode(true) == 9);
  exiter.join();
}

void TestStopEscalatesToKill() {
  Fixture      f;
  FakeBehavior stubborn;
  stubborn.ignore_stop = true;
  f.executor->SetBehavior("stubborn", stubborn);

  auto supervisor = f.Launch("stubborn");
  supervisor->AwaitListening(1s, {});

  std::atomic<bool> stop_flag{false};
  supervisor->SetExitListener([&](const std::string&, int, bool stop_requested) { stop_flag = stop_requested; });

  const auto code = supervisor->Stop(20ms, 1s);
  assert(code && *code == 137);
  assert(stop_flag);
  assert(f.log->IndexOf("stop:stubborn") < f.log->IndexOf("kill:stubborn"));
}

void TestUnexpectedExitReportsNoStopRequest() {
  Fixture f;
  auto    supervisor = f.Launch("api");

  std::atomic<int>  seen_code{-1};
  std::atomic<bool> stop_flag{true};
  supervisor->SetExitListener([&](const std::string& id, int code, bool stop_requested) {
    assert(id == "api");
    seen_code = code;
    stop_flag = stop_requested;
  });
  f.executor->Process("api")->Exit(1);

  assert(seen_code == 1);
  assert(!stop_flag);
  // stopping an exited process is a no-op
  assert(supervisor->Stop(10ms, 10ms) == 1);
  assert(!f.log->Contains("stop:api"));
}

void TestStartAfterExitThrows() {
  Fixture f;
  auto    supervisor = f.Launch("api");
  f.executor->Process("api")->Exit(2);
  try {
    supervisor->Start();
    assert(false);
  } catch (const meshdeploy::util::ProcessCrash& e) {
    assert(e.exit_code() == 2);
  }
  assert(!f.log->Contains("start:api"));
}

} // namespace

int main() {
  TestReadyLineIsConsumed();
  TestExitBeforeListeningIsACrash();
  TestListenTimeoutAndCancellation();
  TestExitCodeNonBlockingAndBlocking();
  TestStopEscalatesToKill();
  TestUnexpectedExitReportsNoStopRequest();
  TestStartAfterExitThrows();

  std::cout << "meshdeploy_unit_process_supervisor: pass\n";
  return 0;
}
