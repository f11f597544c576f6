#pragma once

#include <string>

#include "internal/model/endpoint.hpp"
#include "meshdeploy/wiring/v1/wiring.pb.h"

namespace meshdeploy::exec {

/*
  ServiceWiring <-> meshdeploy.wiring.v1.ServiceWiring.

  The JSON form is the file a launched service reads through MESHDEPLOY_CONFIG.
*/
meshdeploy::wiring::v1::ServiceWiring ToProto(const model::ServiceWiring& wiring);
model::ServiceWiring                  FromProto(const meshdeploy::wiring::v1::ServiceWiring& proto);

std::string          EncodeWiringJson(const model::ServiceWiring& wiring);
model::ServiceWiring DecodeWiringJson(const std::string& json);  // throws util::ConfigError

} // namespace meshdeploy::exec
