#include "internal/providers/ssh_network.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::providers {
namespace {

// Asks the kernel for a currently unused loopback port.
std::uint16_t FreeLocalPort() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw util::NetworkError("socket: " + std::generic_category().message(errno));
  }

  sockaddr_in addr{};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port        = 0;

  socklen_t len = sizeof(addr);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    const int saved = errno;
    ::close(fd);
    throw util::NetworkError("cannot reserve a local port: " + std::generic_category().message(saved));
  }
  ::close(fd);
  return ntohs(addr.sin_port);
}

} // namespace

SshNetwork::SshNetwork(SshNetworkOptions options, std::shared_ptr<exec::ProcessRunner> runner)
    : options_(std::move(options)), runner_(runner ? std::move(runner) : std::make_shared<exec::ProcessRunner>()) {
}

SshNetwork::~SshNetwork() {
  std::map<std::string, std::shared_ptr<exec::ChildProcess>> tunnels;
  {
    std::lock_guard lock(mutex_);
    tunnels.swap(tunnels_);
  }
  for (auto& [id, child] : tunnels) {
    child->Signal(SIGKILL);
  }
}

std::string SshNetwork::NextId(const std::string& kind) {
  std::lock_guard lock(mutex_);
  return kind + "-" + std::to_string(next_id_++);
}

capability::NetworkResource SshNetwork::OpenIngress(const capability::IngressRule& rule) {
  capability::NetworkResource resource;
  resource.id          = NextId("ingress");
  resource.kind        = "ingress";
  resource.description = rule.source_cidr + " -> " + rule.destination.host_id + ":" + std::to_string(rule.port);

  MESHDEPLOY_LOG_INFO("Ingress rule recorded", {observability::StringField("deployment", rule.deployment_id),
                                                observability::StringField("rule", resource.description)});
  return resource;
}

capability::TunnelResult SshNetwork::OpenTunnel(const capability::TunnelRequest& request) {
  const auto destination_port = std::to_string(request.destination_port);

  capability::TunnelResult     result;
  std::vector<std::string>     argv;
  result.endpoint.transport = model::TransportKind::kTcp;
  result.endpoint.address   = "127.0.0.1";

  if (request.source.local) {
    // operator -> remote: forward a local port to the destination's loopback
    const auto local_port = FreeLocalPort();
    result.endpoint.port  = local_port;
    argv = exec::SshForwardArgv(options_.ssh, request.destination,
                                {"-L", "127.0.0.1:" + std::to_string(local_port) + ":127.0.0.1:" + destination_port});
  } else if (request.destination.local) {
    // remote -> operator: the same port number opens on the source's loopback
    result.endpoint.port = request.destination_port;
    argv = exec::SshForwardArgv(options_.ssh, request.source,
                                {"-R", "127.0.0.1:" + destination_port + ":127.0.0.1:" + destination_port});
  } else {
    throw util::NetworkError("no tunnel route between " + request.source.host_id + " and " + request.destination.host_id +
                             ": neither side is the operator machine");
  }

  const auto id = NextId("tunnel");

  capability::ProcessObserver observer;
  observer.on_line = [id](capability::OutputChannel, const std::string& line) {
    MESHDEPLOY_LOG_DEBUG("Tunnel output", {observability::StringField("tunnel", id), observability::StringField("line", line)});
  };
  observer.on_exit = [id](int code) {
    MESHDEPLOY_LOG_DEBUG("Tunnel session ended", {observability::StringField("tunnel", id), observability::IntField("exit_code", code)});
  };

  std::shared_ptr<exec::ChildProcess> child;
  try {
    child = runner_->Spawn({argv, {}, {}}, std::move(observer));
  } catch (const std::system_error& e) {
    throw util::NetworkError("failed to start tunnel " + id + ": " + e.what());
  }

  if (auto code = child->WaitExit(options_.tunnel_settle)) {
    throw util::NetworkError("tunnel " + request.source.host_id + " -> " + request.destination.host_id + ":" + destination_port +
                             " failed with exit " + std::to_string(*code));
  }

  result.resource.id          = id;
  result.resource.kind        = "tunnel";
  result.resource.description = request.source.host_id + " -> " + request.destination.host_id + ":" + destination_port + " via " +
                                result.endpoint.ToString();
  {
    std::lock_guard lock(mutex_);
    tunnels_[id] = child;
  }

  MESHDEPLOY_LOG_INFO("Tunnel opened", {observability::StringField("deployment", request.deployment_id),
                                        observability::StringField("tunnel", result.resource.description)});
  return result;
}

void SshNetwork::Close(const capability::NetworkResource& resource) {
  if (resource.kind == "ingress") {
    MESHDEPLOY_LOG_INFO("Ingress rule dropped", {observability::StringField("rule", resource.description)});
    return;
  }

  std::shared_ptr<exec::ChildProcess> child;
  {
    std::lock_guard lock(mutex_);
    auto it = tunnels_.find(resource.id);
    if (it == tunnels_.end()) {
      throw util::NetworkError("unknown network resource " + resource.id);
    }
    child = it->second;
    tunnels_.erase(it);
  }

  child->Signal(SIGTERM);
  if (!child->WaitExit(options_.close_timeout)) {
    child->Signal(SIGKILL);
    if (!child->WaitExit(options_.close_timeout)) {
      throw util::NetworkError("tunnel " + resource.id + " did not exit");
    }
  }
}

std::size_t SshNetwork::OpenTunnels() const {
  std::lock_guard lock(mutex_);
  return tunnels_.size();
}

} // namespace meshdeploy::providers
