#include "internal/graph/connection_graph.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/model/host.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_capabilities.hpp"

namespace {

using meshdeploy::model::PortDecl;
using meshdeploy::model::PortDirection;
using meshdeploy::model::PortRef;

constexpr const char* kDeployment = "d1";

// Services with an "in" sink, an "out" source, a merged "all" sink and a "split" source.
struct Fixture {
  std::shared_ptr<meshdeploy::testing::CallLog>         log = std::make_shared<meshdeploy::testing::CallLog>();
  std::unique_ptr<meshdeploy::model::Host>              host;
  std::vector<std::unique_ptr<meshdeploy::model::Service>> services;
  meshdeploy::graph::ConnectionGraph                    graph{kDeployment};

  Fixture() {
    host = std::make_unique<meshdeploy::model::Host>(kDeployment, meshdeploy::model::HostDecl{"h", "fake", meshdeploy::model::Locality::Local(), {}},
                                                     std::make_shared<meshdeploy::testing::FakeProvisioner>(log));
  }

  void Add(const std::string& id) {
    meshdeploy::model::ServiceDecl decl{id, "h", id, {}, {}};
    decl.ports = {PortDecl{"in", PortDirection::kSink, false}, PortDecl{"out", PortDirection::kSource, false},
                  PortDecl{"all", PortDirection::kSink, true}, PortDecl{"split", PortDirection::kSource, false}};
    services.push_back(std::make_unique<meshdeploy::model::Service>(kDeployment, decl, host.get()));
    graph.RegisterService(services.back().get());
  }

  static PortRef Ref(const std::string& service, const std::string& port) {
    return PortRef{kDeployment, service, port};
  }
};

template <typename Fn>
bool ThrowsDeclarationError(Fn&& fn) {
  try {
    fn();
  } catch (const meshdeploy::util::DeclarationError&) {
    return true;
  }
  return false;
}

void TestConnectValidatesDirectionAndReferences() {
  Fixture f;
  f.Add("a");
  f.Add("b");

  assert(ThrowsDeclarationError([&] { f.graph.Connect(Fixture::Ref("a", "in"), Fixture::Ref("b", "in")); }));
  assert(ThrowsDeclarationError([&] { f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "out")); }));
  assert(ThrowsDeclarationError([&] { f.graph.Connect(Fixture::Ref("a", "missing"), Fixture::Ref("b", "in")); }));
  assert(ThrowsDeclarationError([&] { f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("ghost", "in")); }));
  assert(ThrowsDeclarationError([&] { f.graph.Connect(Fixture::Ref("a", "out"), PortRef{"other", "b", "in"}); }));
  assert(f.graph.Size() == 0);

  const auto connection = f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));
  assert(connection.id == 1);
  assert(!connection.IsDemux());
  assert(f.graph.Size() == 1);
}

void TestNonMergedSinkAcceptsOneConnection() {
  Fixture f;
  f.Add("a");
  f.Add("b");
  f.Add("c");

  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("c", "in"));
  assert(ThrowsDeclarationError([&] { f.graph.Connect(Fixture::Ref("b", "out"), Fixture::Ref("c", "in")); }));

  f.graph.Connect(Fixture::Ref("a", "split"), Fixture::Ref("c", "all"));
  f.graph.Connect(Fixture::Ref("b", "out"), Fixture::Ref("c", "all"));
  assert(f.graph.Size() == 3);
}

void TestSourceConnectsOnce() {
  Fixture f;
  f.Add("a");
  f.Add("b");
  f.Add("c");

  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));
  assert(ThrowsDeclarationError([&] { f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("c", "in")); }));
}

void TestRejectedDemuxLeavesGraphUnchanged() {
  Fixture f;
  f.Add("a");
  f.Add("b");
  f.Add("c");

  // same non-merged sink twice within one demux
  meshdeploy::model::DemuxMap duplicate{{0, Fixture::Ref("b", "in")}, {1, Fixture::Ref("b", "in")}};
  assert(ThrowsDeclarationError([&] { f.graph.ConnectDemux(Fixture::Ref("a", "split"), duplicate); }));
  assert(ThrowsDeclarationError([&] { f.graph.ConnectDemux(Fixture::Ref("a", "split"), {}); }));
  assert(f.graph.Size() == 0);

  // b.in is still free after the rejection
  meshdeploy::model::DemuxMap ok{{0, Fixture::Ref("b", "in")}, {7, Fixture::Ref("c", "in")}};
  const auto                  connection = f.graph.ConnectDemux(Fixture::Ref("a", "split"), ok);
  assert(connection.IsDemux());
  const auto destinations = connection.Destinations();
  assert(destinations.size() == 2);
  assert(destinations[1].first == 7);
  assert(destinations[1].second.service_id == "c");
}

void TestStartWavesPutReceiversFirst() {
  Fixture f;
  f.Add("frontend");
  f.Add("api");
  f.Add("db");

  f.graph.Connect(Fixture::Ref("frontend", "out"), Fixture::Ref("api", "in"));
  f.graph.Connect(Fixture::Ref("api", "out"), Fixture::Ref("db", "in"));

  const auto waves = f.graph.StartWaves();
  assert(waves.size() == 3);
  assert(waves[0] == std::vector<std::string>{"db"});
  assert(waves[1] == std::vector<std::string>{"api"});
  assert(waves[2] == std::vector<std::string>{"frontend"});

  assert(f.graph.DestinationsOf("frontend") == std::set<std::string>{"api"});
  assert(f.graph.DestinationsOf("db").empty());
}

void TestStartWavesBreakCycles() {
  Fixture f;
  f.Add("a");
  f.Add("b");
  f.Add("solo");

  f.graph.Connect(Fixture::Ref("a", "out"), Fixture::Ref("b", "in"));
  f.graph.Connect(Fixture::Ref("b", "out"), Fixture::Ref("a", "in"));
  // self-loops are not dependencies
  f.graph.Connect(Fixture::Ref("solo", "out"), Fixture::Ref("solo", "in"));

  const auto waves = f.graph.StartWaves();
  std::vector<std::string> flat;
  for (const auto& wave : waves) {
    flat.insert(flat.end(), wave.begin(), wave.end());
  }
  assert(flat.size() == 3);
  assert(waves[0] == std::vector<std::string>{"solo"});
  // a is released first (registered first), which frees b
  assert(waves[1] == std::vector<std::string>{"a"});
  assert(waves[2] == std::vector<std::string>{"b"});
}

} // namespace

int main() {
  TestConnectValidatesDirectionAndReferences();
  TestNonMergedSinkAcceptsOneConnection();
  TestSourceConnectsOnce();
  TestRejectedDemuxLeavesGraphUnchanged();
  TestStartWavesPutReceiversFirst();
  TestStartWavesBreakCycles();

  std::cout << "meshdeploy_unit_connection_graph: pass\n";
  return 0;
}
