#include "internal/graph/connection_graph.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace meshdeploy::graph {

ConnectionGraph::ConnectionGraph(std::string deployment_id) : deployment_id_(std::move(deployment_id)) {
}

void ConnectionGraph::RegisterService(const model::Service* service) {
  std::lock_guard lock(mutex_);
  if (services_.contains(service->Id())) {
    throw util::DeclarationError("service " + service->Id() + " registered twice");
  }
  services_.emplace(service->Id(), service);
  service_order_.push_back(service->Id());
}

model::Port ConnectionGraph::ResolvePort(const model::PortRef& ref, model::PortDirection expected) const {
  if (ref.deployment_id != deployment_id_) {
    throw util::DeclarationError("port " + ref.ToString() + " belongs to deployment '" + ref.deployment_id + "'");
  }
  auto it = services_.find(ref.service_id);
  if (it == services_.end()) {
    throw util::DeclarationError("port " + ref.ToString() + " references unknown service");
  }
  auto port = it->second->FindPort(ref.port);
  if (!port) {
    throw util::DeclarationError("dangling port reference " + ref.ToString());
  }
  if (port->direction != expected) {
    throw util::DeclarationError("port " + ref.ToString() + " is a " + std::string(model::ToString(port->direction)) + ", expected a " +
                                 std::string(model::ToString(expected)));
  }
  return *port;
}

void ConnectionGraph::CheckTargetFree(const model::PortRef& destination, const std::set<model::PortRef>& pending) const {
  const auto port = ResolvePort(destination, model::PortDirection::kSink);
  if (port.merged) {
    return;
  }
  if (used_targets_.contains(destination) || pending.contains(destination)) {
    throw util::DeclarationError("duplicate connection target " + destination.ToString());
  }
}

model::Connection ConnectionGraph::Connect(const model::PortRef& source, const model::PortRef& destination) {
  std::lock_guard lock(mutex_);

  ResolvePort(source, model::PortDirection::kSource);
  if (used_sources_.contains(source)) {
    throw util::DeclarationError("source port " + source.ToString() + " is already connected");
  }
  CheckTargetFree(destination, {});

  used_sources_.insert(source);
  used_targets_.insert(destination);
  connections_.push_back(model::Connection{next_id_++, source, destination});
  return connections_.back();
}

model::Connection ConnectionGraph::ConnectDemux(const model::PortRef& source, const model::DemuxMap& destinations) {
  std::lock_guard lock(mutex_);

  ResolvePort(source, model::PortDirection::kSource);
  if (destinations.empty()) {
    throw util::DeclarationError("demux connection from " + source.ToString() + " has no destinations");
  }
  if (used_sources_.contains(source)) {
    throw util::DeclarationError("source port " + source.ToString() + " is already connected");
  }

  std::set<model::PortRef> pending;
  for (const auto& [key, destination] : destinations) {
    CheckTargetFree(destination, pending);
    pending.insert(destination);
  }

  used_sources_.insert(source);
  used_targets_.insert(pending.begin(), pending.end());
  connections_.push_back(model::Connection{next_id_++, source, destinations});
  return connections_.back();
}

std::vector<model::Connection> ConnectionGraph::Connections() const {
  std::lock_guard lock(mutex_);
  return connections_;
}

std::size_t ConnectionGraph::Size() const {
  std::lock_guard lock(mutex_);
  return connections_.size();
}

std::set<std::string> ConnectionGraph::DestinationsOf(const std::string& service_id) const {
  std::lock_guard lock(mutex_);
  std::set<std::string> out;
  for (const auto& connection : connections_) {
    if (connection.source.service_id != service_id) {
      continue;
    }
    for (const auto& [key, destination] : connection.Destinations()) {
      if (destination.service_id != service_id) {
        out.insert(destination.service_id);
      }
    }
  }
  return out;
}

std::vector<std::vector<std::string>> ConnectionGraph::StartWaves() const {
  std::lock_guard lock(mutex_);

  // pending[s] = services s still waits for; dependents[d] = services waiting on d
  std::map<std::string, std::set<std::string>> pending;
  std::map<std::string, std::set<std::string>> dependents;
  for (const auto& id : service_order_) {
    pending[id];
  }
  for (const auto& connection : connections_) {
    const auto& from = connection.source.service_id;
    for (const auto& [key, destination] : connection.Destinations()) {
      if (destination.service_id == from) {
        continue;
      }
      pending[from].insert(destination.service_id);
      dependents[destination.service_id].insert(from);
    }
  }

  std::vector<std::vector<std::string>> waves;
  std::set<std::string>                 released;

  while (released.size() < service_order_.size()) {
    std::vector<std::string> wave;
    for (const auto& id : service_order_) {
      if (!released.contains(id) && pending[id].empty()) {
        wave.push_back(id);
      }
    }

    if (wave.empty()) {
      const std::string* pick = nullptr;
      for (const auto& id : service_order_) {
        if (released.contains(id)) {
          continue;
        }
        if (pick == nullptr || pending[id].size() < pending[*pick].size()) {
          pick = &id;
        }
      }
      wave.push_back(*pick);
    }

    for (const auto& id : wave) {
      released.insert(id);
      for (const auto& dependent : dependents[id]) {
        pending[dependent].erase(id);
      }
    }
    waves.push_back(std::move(wave));
  }

  return waves;
}

} // namespace meshdeploy::graph
