#include "internal/topology/topology_loader.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/fake_capabilities.hpp"

namespace {

using meshdeploy::model::LocalityKind;
using meshdeploy::topology::ApplyTopology;
using meshdeploy::topology::LoadTopologyFromString;
using meshdeploy::topology::ParseLocality;
using meshdeploy::topology::ParsePortPath;

constexpr const char* kPipeline = R"(deployment_id: pipeline
hosts:
  - id: laptop
    provider: fake
  - id: edge
    provider: fake
    locality: public
    properties:
      address: "203.0.113.9"
      ssh_port: "2222"
services:
  - id: ingest
    host: laptop
    source_ref: ingest
    ports:
      - {name: out, direction: source}
  - id: shard.a
    host: edge
    source_ref: shard
    args: ["--shard", "0"]
    ports:
      - {name: in, direction: sink}
      - {name: out, direction: source}
  - id: shard.b
    host: edge
    source_ref: shard
    args: ["--shard", "1"]
    ports:
      - {name: in, direction: sink}
      - {name: out, direction: source}
  - id: sink
    host: laptop
    source_ref: collector
    ports:
      - {name: all, direction: sink, merged: true}
connections:
  - from: ingest.out
    demux:
      0: shard.a.in
      1: shard.b.in
  - {from: shard.a.out, to: sink.all}
  - {from: shard.b.out, to: sink.all}
)";

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestParseLocality() {
  assert(ParseLocality("").kind == LocalityKind::kLocal);
  assert(ParseLocality("local").kind == LocalityKind::kLocal);
  assert(ParseLocality("public").kind == LocalityKind::kPublic);
  const auto vpc = ParseLocality("private:vpc-7");
  assert(vpc.kind == LocalityKind::kPrivateNetwork);
  assert(vpc.network_id == "vpc-7");
  assert(Throws<meshdeploy::util::DeclarationError>([] { ParseLocality("private:"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([] { ParseLocality("cloud"); }));
}

void TestParsePortPathSplitsAtLastDot() {
  const auto [service, port] = ParsePortPath("shard.a.in");
  assert(service == "shard.a");
  assert(port == "in");
  assert(Throws<meshdeploy::util::DeclarationError>([] { ParsePortPath("noport"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([] { ParsePortPath(".in"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([] { ParsePortPath("svc."); }));
}

void TestPipelineIsDeclared() {
  const auto spec = LoadTopologyFromString(kPipeline);
  assert(spec.deployment_id() == "pipeline");
  assert(spec.hosts_size() == 2);
  assert(spec.hosts(1).properties().at("ssh_port") == "2222");
  assert(spec.connections(0).demux().at(1) == "shard.b.in");

  meshdeploy::testing::FakeWorld world;
  meshdeploy::core::Deployment   deployment(spec.deployment_id(), world.Capabilities());
  ApplyTopology(spec, deployment);

  const auto status = deployment.Status();
  assert(status.hosts.size() == 2);
  assert(status.hosts[1].locality.kind == LocalityKind::kPublic);
  assert(status.services.size() == 4);
  assert(status.services[1].id == "shard.a");

  deployment.Deploy();
  const auto router = deployment.Wiring("ingest");
  assert(router.demux.at("out").size() == 2);
  assert(deployment.Wiring("sink").binds.at("all").size() == 2);
  assert((deployment.Wiring("shard.b").args == std::vector<std::string>{"--shard", "1"}));
  // both shards share one artifact
  assert(world.log->Count("build:shard") == 1);
}

void TestMalformedConnectionsAreRejected() {
  meshdeploy::testing::FakeWorld world;

  auto declare = [&](const std::string& connections) {
    const std::string yaml = R"(hosts:
  - {id: h, provider: fake}
services:
  - id: a
    host: h
    source_ref: a
    ports: [{name: out, direction: source}, {name: in, direction: sink}]
  - id: b
    host: h
    source_ref: b
    ports: [{name: out, direction: source}, {name: in, direction: sink}]
connections:
)" + connections;
    meshdeploy::core::Deployment deployment("d", world.Capabilities());
    ApplyTopology(LoadTopologyFromString(yaml), deployment);
  };

  declare("  - {from: a.out, to: b.in}\n");
  assert(Throws<meshdeploy::util::DeclarationError>([&] { declare("  - {from: a.out}\n"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([&] { declare("  - {from: a.out, to: b.in, demux: {0: b.in}}\n"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([&] { declare("  - {from: a.out, to: b.nope}\n"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([&] { declare("  - {from: a.in, to: b.in}\n"); }));
}

void TestServiceKindsAndExposedPorts() {
  constexpr const char* kYaml = R"(hosts:
  - {id: h, provider: fake}
services:
  - id: api
    host: h
    source_ref: api
    external_ports: [8080]
    ports: [{name: in, direction: sink}]
  - id: browser
    host: h
    kind: external
    ports: [{name: out, direction: source}]
connections:
  - {from: browser.out, to: api.in}
)";
  meshdeploy::testing::FakeWorld world;
  meshdeploy::core::Deployment   deployment("d", world.Capabilities());
  ApplyTopology(LoadTopologyFromString(kYaml), deployment);

  const auto status = deployment.Status();
  assert(status.services[0].kind == meshdeploy::model::ServiceKind::kManaged);
  assert(status.services[1].kind == meshdeploy::model::ServiceKind::kExternal);

  deployment.Deploy();
  assert(deployment.Wiring("browser").connects.at("out").port == 21000);
  assert(world.log->Count("build:") == 1);
  assert(!world.log->Contains("ingress:h:8080:0.0.0.0/0"));

  auto declare = [&](const std::string& service) {
    meshdeploy::core::Deployment other("d", world.Capabilities());
    ApplyTopology(LoadTopologyFromString("hosts: [{id: h, provider: fake}]\nservices:\n" + service), other);
  };
  declare("  - {id: x, host: h, source_ref: x, kind: managed}\n");
  assert(Throws<meshdeploy::util::DeclarationError>([&] { declare("  - {id: x, host: h, source_ref: x, kind: sidecar}\n"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([&] { declare("  - {id: x, host: h, source_ref: x, external_ports: [70000]}\n"); }));
  assert(Throws<meshdeploy::util::DeclarationError>([&] { declare("  - {id: x, host: h}\n"); }));
  assert(Throws<meshdeploy::util::DeclarationError>(
      [&] { declare("  - {id: x, host: h, kind: external, ports: [{name: in, direction: sink}]}\n"); }));
}

void TestBadDocumentsAreConfigErrors() {
  assert(Throws<meshdeploy::util::ConfigError>([] { LoadTopologyFromString("hosts: [{id: h, flavour: large}]\n"); }));
  assert(Throws<meshdeploy::util::ConfigError>([] { LoadTopologyFromString("hosts: {\n"); }));
  assert(Throws<meshdeploy::util::ConfigError>([] { meshdeploy::topology::LoadTopology("/nonexistent/topology.yaml"); }));

  meshdeploy::testing::FakeWorld world;
  meshdeploy::core::Deployment   deployment("d", world.Capabilities());
  const auto                     spec = LoadTopologyFromString(R"(hosts:
  - {id: h, provider: fake}
services:
  - {id: a, host: h, source_ref: a, ports: [{name: p, direction: sideways}]}
)");
  assert(Throws<meshdeploy::util::DeclarationError>([&] { ApplyTopology(spec, deployment); }));
}

} // namespace

int main() {
  TestParseLocality();
  TestParsePortPathSplitsAtLastDot();
  TestPipelineIsDeclared();
  TestMalformedConnectionsAreRejected();
  TestServiceKindsAndExposedPorts();
  TestBadDocumentsAreConfigErrors();

  std::cout << "meshdeploy_unit_topology_loader: pass\n";
  return 0;
}
