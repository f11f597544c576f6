#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace meshdeploy::grpc {

/*
  Status code for an exception raised by the control service:

    DeclarationError, ConfigError   INVALID_ARGUMENT
    NotFound                        NOT_FOUND
    InvalidState, StillRunning      FAILED_PRECONDITION
    ProvisionError (retryable)      UNAVAILABLE
    Cancelled                       CANCELLED
    ProcessCrash                    ABORTED
    anything else                   INTERNAL

  The status message is the exception text.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace meshdeploy::grpc
