#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace meshdeploy::network {

/*
  Hands out listening ports per machine, counting up from a base port.

  A machine is named by the caller; every host on the operator machine must
  share one name so their loop-back binds never collide. Ports handed out
  or reserved on a machine are never handed out there again until Reset.
*/
class PortAllocator {
 public:
  explicit PortAllocator(std::uint16_t base_port);

  // Throws util::NetworkError once the 16-bit range is exhausted.
  std::uint16_t Allocate(const std::string& machine);

  // Lowest port free on every listed machine, taken on all of them. Used
  // when a tunnel opens the same port number on both ends.
  std::uint16_t AllocateOnAll(std::initializer_list<std::string> machines);

  // Marks a port chosen elsewhere (a tunnel's local end, an exposed port)
  // as taken. Returns false if it already was.
  bool Reserve(const std::string& machine, std::uint16_t port);

  void Reset();

 private:
  const std::uint16_t                                 base_port_;
  std::mutex                                          mutex_;
  std::map<std::string, std::set<std::uint16_t>>      taken_;
};

} // namespace meshdeploy::network
