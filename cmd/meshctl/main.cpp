#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "meshdeploy/services/v1/deployment_control_service.grpc.pb.h"
#include "meshdeploy/v1.hpp"

using namespace meshdeploy::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  meshctl <addr> status\n"
            << "  meshctl <addr> logs <service> [stdout|stderr] [prefix]\n"
            << "  meshctl <addr> exit-code <service> [--wait]\n"
            << "  meshctl <addr> wiring <service>\n"
            << "  meshctl <addr> events\n"
            << "  meshctl <addr> stop\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DeploymentControlService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetStatusResponse resp;
    auto              status = stub->GetStatus(&ctx, GetStatusRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deployment " << resp.deployment_id() << " " << resp.state() << "\n";
    for (const auto& host : resp.hosts()) {
      std::cout << "  host " << host.id() << " provider=" << host.provider() << " locality=" << host.locality()
                << " state=" << host.state();
      if (!host.address().empty()) std::cout << " address=" << host.address();
      std::cout << "\n";
    }
    for (const auto& service : resp.services()) {
      std::cout << "  service " << service.id() << " host=" << service.host() << " state=" << service.state();
      if (service.kind() == "external") std::cout << " kind=external";
      if (service.has_exit()) std::cout << " exit=" << service.exit_code();
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "logs") {
    if (argc < 4) return 1;

    StreamOutputRequest req;
    req.set_service_id(argv[3]);
    if (argc >= 5) req.set_channel(argv[4]);
    if (argc >= 6) req.set_prefix(argv[5]);

    auto       reader = stub->StreamOutput(&ctx, req);
    OutputLine line;
    while (reader->Read(&line)) {
      auto& out = line.channel() == "stderr" ? std::cerr : std::cout;
      out << line.line() << "\n";
    }
    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "exit-code") {
    if (argc < 4) return 1;

    GetExitCodeRequest req;
    req.set_service_id(argv[3]);
    req.set_wait(argc >= 5 && std::string(argv[4]) == "--wait");

    GetExitCodeResponse resp;
    auto                status = stub->GetExitCode(&ctx, req, &resp);
    if (status.error_code() == grpc::StatusCode::FAILED_PRECONDITION) {
      std::cout << "running\n";
      return 3;
    }
    if (!status.ok()) return Fail(status);

    std::cout << resp.exit_code() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "wiring") {
    if (argc < 4) return 1;

    GetWiringRequest req;
    req.set_service_id(argv[3]);

    GetWiringResponse resp;
    auto              status = stub->GetWiring(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    std::string json;
    if (!google::protobuf::util::MessageToJsonString(resp.wiring(), &json, options).ok()) {
      std::cerr << "cannot print wiring of " << argv[3] << "\n";
      return 2;
    }
    std::cout << json;
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    ListEventsResponse resp;
    auto               status = stub->ListEvents(&ctx, ListEventsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.time().seconds() << " " << event.kind();
      if (!event.service_id().empty()) std::cout << " service=" << event.service_id() << " exit=" << event.exit_code();
      if (!event.message().empty()) std::cout << " " << event.message();
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    StopResponse resp;
    auto         status = stub->Stop(&ctx, StopRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.state() << "\n";
    for (const auto& failure : resp.failures()) {
      std::cerr << "teardown failure: " << failure << "\n";
    }
    return resp.failures_size() == 0 ? 0 : 3;
  }

  Usage();
  return 1;
}
