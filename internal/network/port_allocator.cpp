#include "internal/network/port_allocator.hpp"

#include "internal/util/errors.hpp"

namespace meshdeploy::network {

PortAllocator::PortAllocator(std::uint16_t base_port) : base_port_(base_port) {
}

std::uint16_t PortAllocator::Allocate(const std::string& machine) {
  return AllocateOnAll({machine});
}

std::uint16_t PortAllocator::AllocateOnAll(std::initializer_list<std::string> machines) {
  std::lock_guard lock(mutex_);
  for (std::uint32_t port = base_port_; port <= 65535; ++port) {
    const auto candidate = static_cast<std::uint16_t>(port);
    bool       free      = true;
    for (const auto& machine : machines) {
      auto it = taken_.find(machine);
      if (it != taken_.end() && it->second.contains(candidate)) {
        free = false;
        break;
      }
    }
    if (free) {
      for (const auto& machine : machines) {
        taken_[machine].insert(candidate);
      }
      return candidate;
    }
  }

  std::string names;
  for (const auto& machine : machines) {
    names += names.empty() ? machine : ", " + machine;
  }
  throw util::NetworkError("no free ports left on " + names);
}

bool PortAllocator::Reserve(const std::string& machine, std::uint16_t port) {
  std::lock_guard lock(mutex_);
  return taken_[machine].insert(port).second;
}

void PortAllocator::Reset() {
  std::lock_guard lock(mutex_);
  taken_.clear();
}

} // namespace meshdeploy::network
