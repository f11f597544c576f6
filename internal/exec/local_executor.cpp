#include "internal/exec/local_executor.hpp"

#include <signal.h>

#include <fstream>
#include <system_error>

#include "internal/exec/spawned_process.hpp"
#include "internal/exec/wiring_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::exec {

namespace fs = std::filesystem;

LocalExecutor::LocalExecutor(LocalExecutorOptions options, std::shared_ptr<ProcessRunner> runner)
    : options_(std::move(options)), runner_(runner ? std::move(runner) : std::make_shared<ProcessRunner>()) {
}

fs::path LocalExecutor::ServiceDirectory(const std::string& deployment_id, const std::string& service_id) const {
  return options_.work_root / deployment_id / service_id;
}

void LocalExecutor::PlaceArtifact(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                  const model::ServiceWiring& wiring) {
  const auto dir    = ServiceDirectory(wiring.deployment_id, wiring.service_id);
  const auto source = fs::path(artifact.path);

  try {
    fs::create_directories(dir);
    const auto target = dir / source.filename();
    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
    fs::permissions(target, fs::perms::owner_exec | fs::perms::group_exec, fs::perm_options::add);

    std::ofstream out(dir / "wiring.json", std::ios::trunc);
    out << EncodeWiringJson(wiring);
    if (!out) {
      throw util::PlacementError("failed to write wiring for " + wiring.service_id + " in " + dir.string());
    }
  } catch (const fs::filesystem_error& e) {
    throw util::PlacementError("failed to place " + artifact.source_ref + " for " + wiring.service_id + " on " + host.host_id + ": " + e.what());
  }

  MESHDEPLOY_LOG_DEBUG("Artifact placed locally", {observability::StringField("service", wiring.service_id),
                                                   observability::StringField("directory", dir.string())});
}

std::shared_ptr<capability::ProcessHandle> LocalExecutor::Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                                                 const capability::LaunchRequest& request, capability::ProcessObserver observer) {
  const auto dir = ServiceDirectory(request.deployment_id, request.service_id);

  SpawnSpec spec;
  spec.argv.push_back((dir / fs::path(artifact.path).filename()).string());
  spec.argv.insert(spec.argv.end(), request.args.begin(), request.args.end());
  spec.working_dir                   = dir.string();
  spec.env["MESHDEPLOY_CONFIG"]      = (dir / "wiring.json").string();
  spec.env["MESHDEPLOY_SERVICE"]     = request.service_id;
  spec.env["MESHDEPLOY_DEPLOYMENT"]  = request.deployment_id;

  try {
    auto child = runner_->Spawn(spec, std::move(observer));
    return std::make_shared<SpawnedProcess>(request.service_id, host.host_id, false, dir.string(), std::move(child));
  } catch (const std::system_error& e) {
    throw util::PlacementError("failed to launch " + request.service_id + ": " + e.what());
  }
}

void LocalExecutor::Signal(capability::ProcessHandle& process, capability::ProcessSignal signal) {
  auto& spawned = AsSpawned(process);
  switch (signal) {
    case capability::ProcessSignal::kStart:
      spawned.SendStartLine();
      break;
    case capability::ProcessSignal::kStop:
      spawned.Child().Signal(SIGTERM);
      break;
    case capability::ProcessSignal::kKill:
      spawned.Child().Signal(SIGKILL);
      break;
  }
}

} // namespace meshdeploy::exec
