#include "internal/network/network_resolver.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/graph/connection_graph.hpp"
#include "internal/network/port_allocator.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_capabilities.hpp"

namespace {

using meshdeploy::model::Locality;
using meshdeploy::model::PortDecl;
using meshdeploy::model::PortDirection;
using meshdeploy::model::PortRef;
using meshdeploy::model::TransportKind;

constexpr const char* kDeployment = "d1";

struct Fixture {
  meshdeploy::testing::FakeWorld world;
  std::map<std::string, std::unique_ptr<meshdeploy::model::Host>>    hosts;
  std::map<std::string, std::unique_ptr<meshdeploy::model::Service>> services;
  meshdeploy::graph::ConnectionGraph                                 graph{kDeployment};

  void AddHost(const std::string& id, Locality locality, std::map<std::string, std::string> properties = {}) {
    auto host = std::make_unique<meshdeploy::model::Host>(kDeployment, meshdeploy::model::HostDecl{id, "fake", locality, std::move(properties)},
                                                          world.provisioner);
    host->Provision(meshdeploy::util::RetryPolicy{}, {});
    hosts.emplace(id, std::move(host));
  }

  void AddService(const std::string& id, const std::string& host_id) {
    meshdeploy::model::ServiceDecl decl{id, host_id, id, {}, {"--verbose"}};
    decl.ports = {PortDecl{"in", PortDirection::kSink, false}, PortDecl{"out", PortDirection::kSource, false},
                  PortDecl{"all", PortDirection::kSink, true}};
    auto service = std::make_unique<meshdeploy::model::Service>(kDeployment, decl, hosts.at(host_id).get());
    graph.RegisterService(service.get());
    services.emplace(id, std::move(service));
  }

  void AddExposed(const std::string& id, const std::string& host_id, std::vector<std::uint16_t> ports) {
    meshdeploy::model::ServiceDecl decl{id, host_id, id, {PortDecl{"out", PortDirection::kSource, false}}, {}};
    decl.external_ports = std::move(ports);
    auto service        = std::make_unique<meshdeploy::model::Service>(kDeployment, decl, hosts.at(host_id).get());
    graph.RegisterService(service.get());
    services.emplace(id, std::move(service));
  }

  std::map<std::string, const meshdeploy::model::Service*> ServiceMap() const {
    std::map<std::string, const meshdeploy::model::Service*> out;
    for (const auto& [id, service] : services) {
      out.emplace(id, service.get());
    }
    return out;
  }

  std::map<std::string, meshdeploy::model::ServiceWiring> Resolve(meshdeploy::network::NetworkResolver& resolver) {
    return resolver.Resolve(graph.Connections(), ServiceMap(), {});
  }

  static PortRef Ref(const std::string& service, const std::string& port) {
    return PortRef{kDeployment, service, port};
  }
};

void TestSameHostUsesLoopback() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddService("a", "laptop");
  f.AddService("b", "laptop");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  const auto& bind = wiring.at("b").binds.at("in");
  assert(bind.size() == 1);
  assert(bind[0].bind_address == "127.0.0.1");
  assert(bind[0].port == 21000);
  assert(bind[0].peer_service == "a");
  assert(!wiring.at("b").merged_sinks.at("in"));

  const auto& endpoint = wiring.at("a").connects.at("out");
  assert(endpoint.address == "127.0.0.1");
  assert(endpoint.port == 21000);
  assert(wiring.at("a").args == std::vector<std::string>{"--verbose"});
  assert(resolver.Resources().empty());
}

void TestUnixSocketsForSameHost() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddService("a", "laptop");
  f.AddService("b", "laptop");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::ResolverOptions options;
  options.unix_sockets_same_host = true;
  options.socket_dir             = "/run/mesh";
  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network, options);
  auto                                 wiring = f.Resolve(resolver);

  const auto& endpoint = wiring.at("a").connects.at("out");
  assert(endpoint.transport == TransportKind::kUnix);
  assert(endpoint.address == "/run/mesh/d1-b-21000.sock");
  assert(wiring.at("b").binds.at("in")[0].bind_address == endpoint.address);
}

void TestSamePrivateNetworkUsesPrivateAddress() {
  Fixture f;
  f.AddHost("p1", Locality::PrivateNetwork("vpc"));
  f.AddHost("p2", Locality::PrivateNetwork("vpc"));
  f.AddService("a", "p1");
  f.AddService("b", "p2");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  const auto p2_address = f.hosts.at("p2")->Handle()->private_address;
  assert(wiring.at("a").connects.at("out").address == p2_address);
  assert(wiring.at("b").binds.at("in")[0].bind_address == p2_address);
  assert(resolver.Resources().empty());
}

void TestCrossNetworkOpensIngress() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddHost("edge", Locality::Public());
  f.AddService("a", "laptop");
  f.AddService("b", "edge");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  const auto public_address = f.hosts.at("edge")->Handle()->public_address;
  assert(wiring.at("a").connects.at("out").address == public_address);
  assert(wiring.at("b").binds.at("in")[0].bind_address == "0.0.0.0");
  assert(f.world.log->Contains("ingress:edge:21000:0.0.0.0/0"));
  assert(resolver.Resources().size() == 1);
  assert(resolver.Resources()[0].kind == "ingress");
}

void TestPublicSourceNarrowsIngress() {
  Fixture f;
  f.AddHost("src", Locality::Public());
  f.AddHost("dst", Locality::Public());
  f.AddService("a", "src");
  f.AddService("b", "dst");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  f.Resolve(resolver);

  const auto source_address = f.hosts.at("src")->Handle()->public_address;
  assert(f.world.log->Contains("ingress:dst:21000:" + source_address + "/32"));
}

void TestPrivateDestinationFromLocalUsesTunnel() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddHost("inside", Locality::PrivateNetwork("vpc"));
  f.AddService("a", "laptop");
  f.AddService("b", "inside");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  assert(f.world.log->Contains("tunnel:laptop->inside:21000"));
  assert(wiring.at("a").connects.at("out").address == "127.0.0.1");
  assert(wiring.at("b").binds.at("in")[0].bind_address == "127.0.0.1");
  assert(resolver.Resources().size() == 1);
}

void TestUnreachableDestinationFails() {
  Fixture f;
  f.AddHost("x", Locality::PrivateNetwork("vpc-a"));
  f.AddHost("y", Locality::PrivateNetwork("vpc-b"));
  f.AddService("a", "x");
  f.AddService("b", "y");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  try {
    f.Resolve(resolver);
    assert(false);
  } catch (const meshdeploy::util::NetworkError&) {
  }
}

void TestDemuxAndMergedSinks() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddService("router", "laptop");
  f.AddService("shard0", "laptop");
  f.AddService("shard1", "laptop");
  f.AddService("collector", "laptop");

  f.graph.ConnectDemux(Fixture::Ref("router", "out"), {{0, Fixture::Ref("shard0", "in")}, {1, Fixture::Ref("shard1", "in")}});
  f.graph.Connect(Fixture::Ref("shard0", "out"), Fixture::Ref("collector", "all"));
  f.graph.Connect(Fixture::Ref("shard1", "out"), Fixture::Ref("collector", "all"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  const auto& demux = wiring.at("router").demux.at("out");
  assert(demux.size() == 2);
  assert(demux.at(0).port == wiring.at("shard0").binds.at("in")[0].port);
  assert(demux.at(1).port == wiring.at("shard1").binds.at("in")[0].port);
  assert(wiring.at("router").connects.empty());

  const auto& merged = wiring.at("collector").binds.at("all");
  assert(merged.size() == 2);
  assert(merged[0].port != merged[1].port);
  assert(wiring.at("collector").merged_sinks.at("all"));
}

void TestReleaseAllCollectsFailures() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddHost("edge", Locality::Public());
  f.AddService("a", "laptop");
  f.AddService("b", "edge");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  f.Resolve(resolver);
  f.world.network->FailClose();

  const auto failures = resolver.ReleaseAll();
  assert(failures.size() == 1);
  assert(failures[0].find("ingress") != std::string::npos);
  assert(resolver.Resources().empty());
  assert(resolver.ReleaseAll().empty());
}

void TestLocalHostsShareOnePortRange() {
  Fixture f;
  f.AddHost("l1", Locality::Local());
  f.AddHost("l2", Locality::Local());
  f.AddService("a", "l1");
  f.AddService("b", "l2");
  f.AddService("c", "l1");
  f.AddService("e", "l1");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));
  f.graph.Connect(Fixture::Ref("c", "out"), Fixture::Ref("e", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  const auto& b = wiring.at("b").binds.at("in")[0];
  const auto& e = wiring.at("e").binds.at("in")[0];
  assert(b.bind_address == "127.0.0.1");
  assert(e.bind_address == "127.0.0.1");
  assert(b.port != e.port);
  assert(wiring.at("a").connects.at("out").port == b.port);
  assert(wiring.at("c").connects.at("out").port == e.port);
}

void TestReverseTunnelPortIsFreeOnSource() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddHost("inside", Locality::PrivateNetwork("vpc"));
  f.AddHost("peer", Locality::PrivateNetwork("vpc"));
  f.AddService("x", "inside");
  f.AddService("y", "peer");
  f.AddService("z", "laptop");
  // x listens on 21000 inside the vpc before the tunnel is planned
  f.graph.Connect(Fixture::Ref("y", "out"), Fixture::Ref("x", "in"));
  f.graph.Connect(Fixture::Ref("x", "out"), Fixture::Ref("z", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  assert(wiring.at("x").binds.at("in")[0].port == 21000);
  assert(wiring.at("z").binds.at("in")[0].port == 21001);
  assert(f.world.log->Contains("tunnel:inside->laptop:21001"));
}

void TestExposedPortsOpenIngressOffLocalHosts() {
  Fixture f;
  f.AddHost("laptop", Locality::Local());
  f.AddHost("edge", Locality::Public());
  f.AddExposed("web", "laptop", {21000});
  f.AddExposed("gw", "edge", {8080, 8443});
  f.AddService("a", "laptop");
  f.AddService("b", "laptop");
  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  auto                                 wiring = f.Resolve(resolver);

  // 21000 belongs to web now
  assert(wiring.at("b").binds.at("in")[0].port == 21001);
  assert(f.world.log->Contains("ingress:edge:8080:0.0.0.0/0"));
  assert(f.world.log->Contains("ingress:edge:8443:0.0.0.0/0"));
  assert(!f.world.log->Contains("ingress:laptop:21000:0.0.0.0/0"));
  assert(resolver.Resources().size() == 2);

  assert(resolver.ReleaseAll().empty());
  assert(f.world.network->OpenCount() == 0);
}

void TestExposedPortTakenTwiceFails() {
  Fixture f;
  f.AddHost("edge", Locality::Public());
  f.AddExposed("gw", "edge", {8080});
  f.AddExposed("gw2", "edge", {8080});

  meshdeploy::network::NetworkResolver resolver(kDeployment, f.world.network);
  try {
    f.Resolve(resolver);
    assert(false);
  } catch (const meshdeploy::util::NetworkError& e) {
    assert(std::string(e.what()).find("already taken") != std::string::npos);
  }
  // the first rule is still tracked for release
  assert(resolver.Resources().size() == 1);
}

void TestMachineKeys() {
  Fixture f;
  f.AddHost("l1", Locality::Local());
  f.AddHost("l2", Locality::Local());
  f.AddHost("edge", Locality::Public());
  f.AddHost("p1", Locality::PrivateNetwork("vpc-a"));

  using meshdeploy::network::NetworkResolver;
  auto key = [&](const std::string& id) {
    return NetworkResolver::MachineKey(*f.hosts.at(id), *f.hosts.at(id)->Handle());
  };
  assert(key("l1") == key("l2"));
  assert(key("edge") != key("l1"));
  assert(key("p1").find("vpc-a") != std::string::npos);
}

void TestPortAllocatorIsPerMachine() {
  meshdeploy::network::PortAllocator ports(65534);
  assert(ports.Allocate("a") == 65534);
  assert(ports.Allocate("a") == 65535);
  assert(ports.Allocate("b") == 65534);
  try {
    ports.Allocate("a");
    assert(false);
  } catch (const meshdeploy::util::NetworkError&) {
  }
  ports.Reset();
  assert(ports.Allocate("a") == 65534);

  meshdeploy::network::PortAllocator shared(21000);
  shared.Reserve("remote", 21000);
  assert(shared.Allocate("local") == 21000);
  assert(shared.AllocateOnAll({"local", "remote"}) == 21001);
  assert(shared.Allocate("remote") == 21002);
  assert(shared.Allocate("local") == 21002);
}

} // namespace

int main() {
  TestSameHostUsesLoopback();
  TestUnixSocketsForSameHost();
  TestSamePrivateNetworkUsesPrivateAddress();
  TestCrossNetworkOpensIngress();
  TestPublicSourceNarrowsIngress();
  TestPrivateDestinationFromLocalUsesTunnel();
  TestUnreachableDestinationFails();
  TestDemuxAndMergedSinks();
  TestReleaseAllCollectsFailures();
  TestLocalHostsShareOnePortRange();
  TestReverseTunnelPortIsFreeOnSource();
  TestExposedPortsOpenIngressOffLocalHosts();
  TestExposedPortTakenTwiceFails();
  TestMachineKeys();
  TestPortAllocatorIsPerMachine();

  std::cout << "meshdeploy_unit_network_resolver: pass\n";
  return 0;
}
