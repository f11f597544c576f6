#pragma once

#include <memory>

#include "internal/supervisor/output_broadcast.hpp"
#include "meshdeploy/v1.hpp"
#include "service_context.hpp"

namespace meshdeploy::service {

/*
  Transport neutral control surface of a running deployment.
  Errors are the deployment's own exceptions; the gRPC adapter maps them.
*/
class ControlService {
 public:
  explicit ControlService(ServiceContext ctx);

  meshdeploy::v1::GetStatusResponse GetStatus(const meshdeploy::v1::GetStatusRequest& req) const;

  // Throws util::NotFound / util::InvalidState like Deployment::Subscribe.
  std::unique_ptr<supervisor::OutputSubscription> OpenOutput(const meshdeploy::v1::StreamOutputRequest& req);

  meshdeploy::v1::GetExitCodeResponse GetExitCode(const meshdeploy::v1::GetExitCodeRequest& req);

  // Throws util::NotFound for unknown services, util::InvalidState before Deploy.
  meshdeploy::v1::GetWiringResponse GetWiring(const meshdeploy::v1::GetWiringRequest& req) const;

  meshdeploy::v1::ListEventsResponse ListEvents(const meshdeploy::v1::ListEventsRequest& req) const;

  meshdeploy::v1::StopResponse Stop(const meshdeploy::v1::StopRequest& req);

  static meshdeploy::v1::OutputLine ToProto(const std::string& service_id, const supervisor::OutputLine& line);

 private:
  ServiceContext ctx_;
};

} // namespace meshdeploy::service
