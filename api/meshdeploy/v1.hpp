#pragma once

#include "meshdeploy/topology/v1/topology.pb.h"
#include "meshdeploy/wiring/v1/wiring.pb.h"

#include "meshdeploy/services/v1/deployment_control_service.pb.h"
#include "meshdeploy/services/v1/deployment_control_service.grpc.pb.h"

namespace meshdeploy::v1 {
using namespace ::meshdeploy::topology::v1;
using namespace ::meshdeploy::services::v1;
}
