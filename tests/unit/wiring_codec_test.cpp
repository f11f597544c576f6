#include "internal/exec/wiring_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using meshdeploy::model::BindSpec;
using meshdeploy::model::Endpoint;
using meshdeploy::model::TransportKind;

meshdeploy::model::ServiceWiring RouterWiring() {
  meshdeploy::model::ServiceWiring wiring;
  wiring.deployment_id = "d1";
  wiring.service_id    = "router";
  wiring.binds["control"].push_back(BindSpec{TransportKind::kTcp, "0.0.0.0", 21000, "admin"});
  wiring.merged_sinks["control"] = false;
  wiring.connects["audit"]       = Endpoint{TransportKind::kUnix, "/tmp/d1-audit-21001.sock", 0};
  wiring.demux["out"][0]         = Endpoint{TransportKind::kTcp, "10.0.0.4", 21000};
  wiring.demux["out"][3]         = Endpoint{TransportKind::kTcp, "10.0.0.5", 21000};
  wiring.args                    = {"--mode", "fast"};
  return wiring;
}

void TestJsonUsesProtoFieldNames() {
  const auto json = meshdeploy::exec::EncodeWiringJson(RouterWiring());
  assert(json.find("\"service_id\": \"router\"") != std::string::npos);
  assert(json.find("\"bind_address\"") != std::string::npos);
  assert(json.find("\"peer_service\": \"admin\"") != std::string::npos);
  assert(json.find("\"transport\": \"unix\"") != std::string::npos);
}

void TestDecodeRestoresEverySection() {
  const auto original = RouterWiring();
  const auto decoded  = meshdeploy::exec::DecodeWiringJson(meshdeploy::exec::EncodeWiringJson(original));

  assert(decoded.deployment_id == "d1");
  assert(decoded.binds.at("control").size() == 1);
  assert(decoded.binds.at("control")[0].peer_service == "admin");
  assert(decoded.binds.at("control")[0].port == 21000);
  assert(!decoded.merged_sinks.at("control"));
  assert(decoded.connects.at("audit") == original.connects.at("audit"));
  assert(decoded.demux.at("out").at(3) == original.demux.at("out").at(3));
  assert(decoded.args == original.args);
}

void TestDecodeRejectsMalformedDocuments() {
  bool threw = false;
  try {
    meshdeploy::exec::DecodeWiringJson(R"({"service_id": "x", "surprise": 1})");
  } catch (const meshdeploy::util::ConfigError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    meshdeploy::exec::DecodeWiringJson(R"({"connects": {"out": {"transport": "carrier-pigeon", "address": "roof"}}})");
  } catch (const meshdeploy::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestJsonUsesProtoFieldNames();
  TestDecodeRestoresEverySection();
  TestDecodeRejectsMalformedDocuments();

  std::cout << "meshdeploy_unit_wiring_codec: pass\n";
  return 0;
}
