#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace meshdeploy::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace meshdeploy::util;

  if (dynamic_cast<const DeclarationError*>(&e) || dynamic_cast<const ConfigError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const StillRunning*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (const auto* provision = dynamic_cast<const ProvisionError*>(&e); provision && provision->retryable()) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return {::grpc::StatusCode::CANCELLED, e.what()};
  }
  if (dynamic_cast<const ProcessCrash*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace meshdeploy::grpc
