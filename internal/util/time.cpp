#include "time.hpp"

#include <cstdio>

namespace meshdeploy::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1000000);
}

google::protobuf::Duration ToDuration(std::chrono::milliseconds ms) {
  google::protobuf::Duration d;
  d.set_seconds(ms.count() / 1000);
  d.set_nanos(static_cast<int32_t>((ms.count() % 1000) * 1000000));
  return d;
}

std::string FormatMillis(std::chrono::milliseconds ms) {
  const auto total = ms.count();
  if (total < 0) {
    return "-" + FormatMillis(std::chrono::milliseconds(-total));
  }
  if (total < 1000) {
    return std::to_string(total) + "ms";
  }
  if (total < 60000) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3g", static_cast<double>(total) / 1000.0);
    return std::string(buf) + "s";
  }
  const auto minutes = total / 60000;
  const auto seconds = (total % 60000) / 1000;
  return std::to_string(minutes) + "m" + std::to_string(seconds) + "s";
}

} // namespace meshdeploy::util
