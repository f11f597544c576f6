#include "control_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace meshdeploy::grpc {

ControlServer::ControlServer(std::shared_ptr<meshdeploy::service::ControlService> svc, std::chrono::milliseconds stream_poll)
    : service_(std::move(svc)), stream_poll_(stream_poll) {}

::grpc::Status ControlServer::GetStatus(::grpc::ServerContext*,
                                        const meshdeploy::v1::GetStatusRequest* req,
                                        meshdeploy::v1::GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::StreamOutput(::grpc::ServerContext* context,
                                           const meshdeploy::v1::StreamOutputRequest* req,
                                           ::grpc::ServerWriter<meshdeploy::v1::OutputLine>* writer) {
  std::unique_ptr<meshdeploy::supervisor::OutputSubscription> subscription;
  try {
    subscription = service_->OpenOutput(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  // the subscription unsubscribes itself when this handler returns
  while (!context->IsCancelled()) {
    auto line = subscription->Next(stream_poll_);
    if (line) {
      if (!writer->Write(meshdeploy::service::ControlService::ToProto(req->service_id(), *line))) {
        break;
      }
      continue;
    }
    if (subscription->Ended()) {
      return ::grpc::Status::OK;
    }
  }

  if (subscription->Dropped() > 0) {
    MESHDEPLOY_LOG_DEBUG("Output stream lagged", {observability::StringField("service", req->service_id()),
                                                  observability::IntField("dropped", static_cast<std::int64_t>(subscription->Dropped()))});
  }
  return ::grpc::Status(::grpc::StatusCode::CANCELLED, "output stream closed by client");
}

::grpc::Status ControlServer::GetExitCode(::grpc::ServerContext*,
                                          const meshdeploy::v1::GetExitCodeRequest* req,
                                          meshdeploy::v1::GetExitCodeResponse* resp) {
  try {
    *resp = service_->GetExitCode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::GetWiring(::grpc::ServerContext*,
                                        const meshdeploy::v1::GetWiringRequest* req,
                                        meshdeploy::v1::GetWiringResponse* resp) {
  try {
    *resp = service_->GetWiring(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::ListEvents(::grpc::ServerContext*,
                                         const meshdeploy::v1::ListEventsRequest* req,
                                         meshdeploy::v1::ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::Stop(::grpc::ServerContext*,
                                   const meshdeploy::v1::StopRequest* req,
                                   meshdeploy::v1::StopResponse* resp) {
  try {
    *resp = service_->Stop(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace meshdeploy::grpc
