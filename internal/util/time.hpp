#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace meshdeploy::util {

/*
  Clock and duration helpers shared by the event log, output timestamps and
  the protobuf configuration.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

// Sub-millisecond parts are truncated.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

google::protobuf::Duration ToDuration(std::chrono::milliseconds ms);

// "250ms", "1.5s", "2m30s".
std::string FormatMillis(std::chrono::milliseconds ms);

} // namespace meshdeploy::util
