#pragma once

#include <stdexcept>
#include <string>

namespace meshdeploy::util {

/*
  Central error types.

  These get translated later to gRPC status codes (see internal/grpc/grpc_error.cpp).
  Teardown never throws; its failures are collected in a TeardownReport instead.
*/

// Malformed topology: dangling port reference, duplicate connection target,
// connect-after-deploy. Always raised synchronously by the declaring call.
class DeclarationError : public std::runtime_error {
 public:
  explicit DeclarationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lifecycle operation called out of order.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProvisionError : public std::runtime_error {
 public:
  ProvisionError(const std::string& msg, bool retryable) : std::runtime_error(msg), retryable_(retryable) {
  }

  bool retryable() const {
    return retryable_;
  }

 private:
  bool retryable_;
};

class BuildError : public std::runtime_error {
 public:
  explicit BuildError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PlacementError : public std::runtime_error {
 public:
  explicit PlacementError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NetworkError : public std::runtime_error {
 public:
  explicit NetworkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProcessCrash : public std::runtime_error {
 public:
  ProcessCrash(const std::string& service_id, int exit_code, const std::string& msg)
      : std::runtime_error(msg), service_id_(service_id), exit_code_(exit_code) {
  }

  const std::string& service_id() const {
    return service_id_;
  }

  int exit_code() const {
    return exit_code_;
  }

 private:
  std::string service_id_;
  int         exit_code_;
};

class StillRunning : public std::runtime_error {
 public:
  explicit StillRunning(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace meshdeploy::util
