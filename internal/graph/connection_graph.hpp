#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/model/connection.hpp"
#include "internal/model/service.hpp"

namespace meshdeploy::graph {

/*
  Declared data-flow edges of one deployment.

  Every Add* call validates the whole edge before touching any state, so a
  rejected declaration leaves the graph exactly as it was.
*/
class ConnectionGraph {
 public:
  explicit ConnectionGraph(std::string deployment_id);

  // Services must be registered before any edge references them.
  void RegisterService(const model::Service* service);

  // Throws util::DeclarationError.
  model::Connection Connect(const model::PortRef& source, const model::PortRef& destination);
  model::Connection ConnectDemux(const model::PortRef& source, const model::DemuxMap& destinations);

  std::vector<model::Connection> Connections() const;

  std::size_t Size() const;

  // Services that `service_id` sends to (its start dependencies).
  std::set<std::string> DestinationsOf(const std::string& service_id) const;

  /*
    Start order as successive waves: every service appears in exactly one
    wave and, ignoring cycles, after every service it sends to. A cycle is
    broken by releasing the blocked service with the fewest outstanding
    dependencies, earliest registered first.
  */
  std::vector<std::vector<std::string>> StartWaves() const;

 private:
  model::Port ResolvePort(const model::PortRef& ref, model::PortDirection expected) const;
  void        CheckTargetFree(const model::PortRef& destination, const std::set<model::PortRef>& pending) const;

  const std::string deployment_id_;

  mutable std::mutex                           mutex_;
  std::vector<std::string>                     service_order_;
  std::map<std::string, const model::Service*> services_;
  std::vector<model::Connection>               connections_;
  std::set<model::PortRef>                     used_sources_;
  std::set<model::PortRef>                     used_targets_;
  std::uint64_t                                next_id_{1};
};

} // namespace meshdeploy::graph
