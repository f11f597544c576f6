#include "internal/exec/ssh_executor.hpp"

#include <signal.h>

#include <fstream>
#include <system_error>

#include "internal/exec/spawned_process.hpp"
#include "internal/exec/wiring_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace meshdeploy::exec {

namespace fs = std::filesystem;

// Remote placement of a spawned ssh session, needed again at stop time.
struct SshExecutor::Remote : SpawnedProcess {
  Remote(std::string service_id, capability::ProvisionedHandle host_handle, std::string dir, std::shared_ptr<ChildProcess> child)
      : SpawnedProcess(std::move(service_id), host_handle.host_id, true, std::move(dir), std::move(child)), host(std::move(host_handle)) {
  }

  capability::ProvisionedHandle host;
};

SshExecutor::SshExecutor(SshExecutorOptions options, std::shared_ptr<ProcessRunner> runner)
    : options_(std::move(options)), runner_(runner ? std::move(runner) : std::make_shared<ProcessRunner>()) {
}

std::string SshExecutor::RemoteDirectory(const std::string& deployment_id, const std::string& service_id) const {
  return options_.remote_root + "/" + deployment_id + "/" + service_id;
}

void SshExecutor::RunChecked(const std::vector<std::string>& argv, const std::string& what) const {
  ProcessRunner::RunResult result;
  try {
    result = runner_->Run({argv, {}, {}}, options_.command_timeout);
  } catch (const std::system_error& e) {
    throw util::PlacementError(what + ": " + e.what());
  }
  if (result.timed_out) {
    throw util::PlacementError(what + ": timed out");
  }
  if (result.exit_code != 0) {
    throw util::PlacementError(what + ": exit " + std::to_string(result.exit_code) + ": " + result.output);
  }
}

void SshExecutor::PlaceArtifact(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                const model::ServiceWiring& wiring) {
  const auto dir      = RemoteDirectory(wiring.deployment_id, wiring.service_id);
  const auto filename = fs::path(artifact.path).filename().string();

  // wiring.json is staged locally, then copied alongside the artifact
  const auto staging = options_.staging_root / wiring.deployment_id / wiring.service_id;
  try {
    fs::create_directories(staging);
  } catch (const fs::filesystem_error& e) {
    throw util::PlacementError("failed to stage wiring for " + wiring.service_id + ": " + e.what());
  }
  const auto wiring_file = staging / "wiring.json";
  {
    std::ofstream out(wiring_file, std::ios::trunc);
    out << EncodeWiringJson(wiring);
    if (!out) {
      throw util::PlacementError("failed to write " + wiring_file.string());
    }
  }

  RunChecked(SshArgv(options_.ssh, host, "mkdir -p " + util::ShellQuote(dir)), "create " + dir + " on " + host.host_id);
  RunChecked(ScpArgv(options_.ssh, host, artifact.path, dir + "/" + filename), "copy " + artifact.source_ref + " to " + host.host_id);
  RunChecked(ScpArgv(options_.ssh, host, wiring_file.string(), dir + "/wiring.json"), "copy wiring to " + host.host_id);
  RunChecked(SshArgv(options_.ssh, host, "chmod +x " + util::ShellQuote(dir + "/" + filename)), "mark " + filename + " executable");

  MESHDEPLOY_LOG_DEBUG("Artifact placed over ssh", {observability::StringField("service", wiring.service_id),
                                                    observability::StringField("host", host.host_id),
                                                    observability::StringField("directory", dir)});
}

std::shared_ptr<capability::ProcessHandle> SshExecutor::Launch(const capability::ProvisionedHandle& host, const capability::Artifact& artifact,
                                                               const capability::LaunchRequest& request, capability::ProcessObserver observer) {
  const auto dir      = RemoteDirectory(request.deployment_id, request.service_id);
  const auto filename = fs::path(artifact.path).filename().string();

  std::string command = "cd " + util::ShellQuote(dir) + " && echo $$ > .pid && MESHDEPLOY_CONFIG=" + util::ShellQuote(dir + "/wiring.json") +
                        " MESHDEPLOY_SERVICE=" + util::ShellQuote(request.service_id) +
                        " MESHDEPLOY_DEPLOYMENT=" + util::ShellQuote(request.deployment_id) + " exec ./" + util::ShellQuote(filename);
  for (const auto& arg : request.args) {
    command += " " + util::ShellQuote(arg);
  }

  try {
    auto child = runner_->Spawn({SshArgv(options_.ssh, host, command), {}, {}}, std::move(observer));
    return std::make_shared<Remote>(request.service_id, host, dir, std::move(child));
  } catch (const std::system_error& e) {
    throw util::PlacementError("failed to launch " + request.service_id + " on " + host.host_id + ": " + e.what());
  }
}

bool SshExecutor::KillRemote(const capability::ProvisionedHandle& host, const std::string& dir, const char* signal) const {
  const auto command = "kill -" + std::string(signal) + " \"$(cat " + util::ShellQuote(dir + "/.pid") + ")\"";
  try {
    const auto result = runner_->Run({SshArgv(options_.ssh, host, command), {}, {}}, options_.command_timeout);
    return !result.timed_out && result.exit_code == 0;
  } catch (const std::exception& e) {
    MESHDEPLOY_LOG_WARN("Remote kill failed", {observability::StringField("host", host.host_id), observability::StringField("error", e.what())});
    return false;
  }
}

void SshExecutor::Signal(capability::ProcessHandle& process, capability::ProcessSignal signal) {
  auto* remote = dynamic_cast<Remote*>(&process);
  if (!remote) {
    throw util::InvalidState("process " + process.Describe() + " was not started over ssh");
  }

  switch (signal) {
    case capability::ProcessSignal::kStart:
      remote->SendStartLine();
      break;
    case capability::ProcessSignal::kStop:
      if (!KillRemote(remote->host, remote->Location(), "TERM")) {
        remote->Child().Signal(SIGTERM);
      }
      break;
    case capability::ProcessSignal::kKill:
      KillRemote(remote->host, remote->Location(), "KILL");
      remote->Child().Signal(SIGKILL);
      break;
  }
}

} // namespace meshdeploy::exec
