#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <variant>
#include <vector>

#include "internal/model/port.hpp"

namespace meshdeploy::model {

using DemuxMap = std::map<std::uint32_t, PortRef>;

/*
  Directed edge from a source port to either a single sink port or a demux
  map (partition key -> sink port). A demux connection is wired as one
  physical sub-connection per key, all sharing the same source port.
*/
struct Connection {
  std::uint64_t                    id = 0;
  PortRef                          source;
  std::variant<PortRef, DemuxMap> target;

  bool IsDemux() const {
    return std::holds_alternative<DemuxMap>(target);
  }

  // (key, sink) pairs; key is 0 for a plain connection
  std::vector<std::pair<std::uint32_t, PortRef>> Destinations() const {
    std::vector<std::pair<std::uint32_t, PortRef>> out;
    if (const auto* single = std::get_if<PortRef>(&target)) {
      out.emplace_back(0, *single);
    } else {
      for (const auto& [key, port] : std::get<DemuxMap>(target)) {
        out.emplace_back(key, port);
      }
    }
    return out;
  }
};

} // namespace meshdeploy::model
