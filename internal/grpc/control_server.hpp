#pragma once

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/control_service.hpp"
#include "meshdeploy/services/v1/deployment_control_service.grpc.pb.h"
#include "meshdeploy/v1.hpp"

namespace meshdeploy::grpc {

class ControlServer final : public meshdeploy::v1::DeploymentControlService::Service {
public:
  explicit ControlServer(std::shared_ptr<meshdeploy::service::ControlService> svc,
                         std::chrono::milliseconds stream_poll = std::chrono::milliseconds(250));

  ::grpc::Status GetStatus(::grpc::ServerContext*,
                           const meshdeploy::v1::GetStatusRequest*,
                           meshdeploy::v1::GetStatusResponse*) override;

  ::grpc::Status StreamOutput(::grpc::ServerContext*,
                              const meshdeploy::v1::StreamOutputRequest*,
                              ::grpc::ServerWriter<meshdeploy::v1::OutputLine>*) override;

  ::grpc::Status GetExitCode(::grpc::ServerContext*,
                             const meshdeploy::v1::GetExitCodeRequest*,
                             meshdeploy::v1::GetExitCodeResponse*) override;

  ::grpc::Status GetWiring(::grpc::ServerContext*,
                           const meshdeploy::v1::GetWiringRequest*,
                           meshdeploy::v1::GetWiringResponse*) override;

  ::grpc::Status ListEvents(::grpc::ServerContext*,
                            const meshdeploy::v1::ListEventsRequest*,
                            meshdeploy::v1::ListEventsResponse*) override;

  ::grpc::Status Stop(::grpc::ServerContext*,
                      const meshdeploy::v1::StopRequest*,
                      meshdeploy::v1::StopResponse*) override;

private:
  std::shared_ptr<meshdeploy::service::ControlService> service_;
  const std::chrono::milliseconds                      stream_poll_;
};

} // namespace meshdeploy::grpc
