#include "internal/observability/logging.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

std::shared_ptr<std::ostringstream> CaptureLog() {
  auto out    = std::make_shared<std::ostringstream>();
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(*out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);
  return out;
}

void TestParseLevel() {
  using meshdeploy::observability::ParseLevel;
  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("warning") == spdlog::level::warn);
  assert(ParseLevel("warn") == spdlog::level::warn);
  assert(ParseLevel("error") == spdlog::level::err);
  assert(ParseLevel("off") == spdlog::level::off);
  assert(!ParseLevel("loud"));
  assert(!ParseLevel(""));
}

void TestFieldsAreQuotedWhenNeeded() {
  auto out = CaptureLog();
  MESHDEPLOY_LOG_INFO("Host provisioned", {meshdeploy::observability::StringField("host", "edge"),
                                           meshdeploy::observability::StringField("error", "exit 255: \"no route\""),
                                           meshdeploy::observability::DurationField("backoff", 1500ms),
                                           meshdeploy::observability::BoolField("public", true)});
  const auto line = out->str();
  assert(line.find("Host provisioned host=edge") == 0);
  assert(line.find("error=\"exit 255: \\\"no route\\\"\"") != std::string::npos);
  assert(line.find("backoff=1.5s") != std::string::npos);
  assert(line.find("public=true") != std::string::npos);

  out->str("");
  meshdeploy::observability::LogServiceOutput(spdlog::level::info, "api", "stderr", "listening on 22000");
  assert(out->str().find("listening on 22000 service=api stream=stderr") == 0);

  out->str("");
  MESHDEPLOY_LOG_DEBUG("empty", {meshdeploy::observability::StringField("value", "")});
  assert(out->str().find("empty value=\"\"") == 0);
}

void TestFormatMillis() {
  using meshdeploy::util::FormatMillis;
  assert(FormatMillis(0ms) == "0ms");
  assert(FormatMillis(250ms) == "250ms");
  assert(FormatMillis(1500ms) == "1.5s");
  assert(FormatMillis(30s) == "30s");
  assert(FormatMillis(150s) == "2m30s");
  assert(FormatMillis(-20ms) == "-20ms");
}

void TestDurationConversion() {
  google::protobuf::Duration d;
  d.set_seconds(2);
  d.set_nanos(750'400'000);
  assert(meshdeploy::util::ToMillis(d) == 2750ms);

  const auto back = meshdeploy::util::ToDuration(1250ms);
  assert(back.seconds() == 1);
  assert(back.nanos() == 250'000'000);
}

void TestOperationScopeOutlivesExceptions() {
  // no exporter is installed, so only the scope bookkeeping runs
  try {
    meshdeploy::observability::OperationScope op("deploy", "d1");
    op.Span().AddEvent("provisioned");
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }

  meshdeploy::observability::OperationScope op("stop", "d1");
  op.Fail("1 teardown failures");
}

} // namespace

int main() {
  TestParseLevel();
  TestFieldsAreQuotedWhenNeeded();
  TestFormatMillis();
  TestDurationConversion();
  TestOperationScopeOutlivesExceptions();

  std::cout << "meshdeploy_unit_observability: pass\n";
  return 0;
}
