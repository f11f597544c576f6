#include "internal/exec/process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"

extern char** environ;

namespace meshdeploy::exec {
namespace {

constexpr int kPollIntervalMs = 50;

[[noreturn]] void ThrowErrno(const std::string& what) {
  throw std::system_error(errno, std::generic_category(), what);
}

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

std::string ResolveExecutable(const std::string& name) {
  if (name.find('/') != std::string::npos) {
    return name;
  }
  const char* path = std::getenv("PATH");
  std::string_view dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
  while (!dirs.empty()) {
    const auto sep       = dirs.find(':');
    const auto directory = dirs.substr(0, sep);
    const auto candidate = std::filesystem::path(directory.empty() ? "." : std::string(directory)) / name;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    if (sep == std::string_view::npos) break;
    dirs.remove_prefix(sep + 1);
  }
  errno = ENOENT;
  ThrowErrno("resolve executable '" + name + "'");
}

using LineCallback = std::function<void()>;

// Splits buffered bytes into complete lines, keeping the trailing fragment.
void TakeLines(std::string& partial, std::vector<std::string>& out) {
  std::size_t start = 0;
  while (true) {
    const auto newline = partial.find('\n', start);
    if (newline == std::string::npos) break;
    auto line = partial.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out.push_back(std::move(line));
    start = newline + 1;
  }
  partial.erase(0, start);
}

} // namespace

// ------------------------------------------------------------
// ChildProcess
// ------------------------------------------------------------

ChildProcess::ChildProcess(pid_t pid, int stdin_fd) : pid_(pid), stdin_fd_(stdin_fd) {
}

ChildProcess::~ChildProcess() {
  CloseFd(stdin_fd_);
}

bool ChildProcess::WriteStdin(std::string_view data) {
  std::lock_guard lock(mutex_);
  if (stdin_fd_ < 0 || exit_code_) {
    return false;
  }
  while (!data.empty()) {
    const auto written = ::send(stdin_fd_, data.data(), data.size(), MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(written));
  }
  return true;
}

void ChildProcess::CloseStdin() {
  std::lock_guard lock(mutex_);
  CloseFd(stdin_fd_);
}

bool ChildProcess::Signal(int signal_number) {
  std::lock_guard lock(mutex_);
  if (exit_code_) {
    return false;
  }
  if (::kill(-pid_, signal_number) != 0) {
    return ::kill(pid_, signal_number) == 0;
  }
  return true;
}

std::optional<int> ChildProcess::ExitCode() const {
  std::lock_guard lock(mutex_);
  return exit_code_;
}

std::optional<int> ChildProcess::WaitExit(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return exit_code_.has_value(); });
  return exit_code_;
}

void ChildProcess::MarkExited(int exit_code) {
  {
    std::lock_guard lock(mutex_);
    exit_code_ = exit_code;
    CloseFd(stdin_fd_);
  }
  cv_.notify_all();
}

// ------------------------------------------------------------
// ProcessRunner
// ------------------------------------------------------------

ProcessRunner::ProcessRunner() {
  if (::pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
    ThrowErrno("create reactor wake pipe");
  }
  reactor_ = std::thread(&ProcessRunner::Loop, this);
}

ProcessRunner::~ProcessRunner() {
  stopping_ = true;
  Wake();
  if (reactor_.joinable()) reactor_.join();
  CloseFd(wake_fds_[0]);
  CloseFd(wake_fds_[1]);
}

void ProcessRunner::Wake() {
  const char byte = 1;
  while (::write(wake_fds_[1], &byte, 1) < 0 && errno == EINTR) {
  }
}

std::shared_ptr<ChildProcess> ProcessRunner::Spawn(const SpawnSpec& spec, capability::ProcessObserver observer) {
  if (spec.argv.empty()) {
    throw std::invalid_argument("spawn: empty argv");
  }

  // everything the child needs is prepared before fork
  const auto executable = ResolveExecutable(spec.argv.front());

  std::vector<std::string> env_list;
  for (char** env = environ; *env; ++env) {
    const std::string_view entry(*env);
    const auto             key = entry.substr(0, entry.find('='));
    if (!spec.env.contains(std::string(key))) {
      env_list.emplace_back(entry);
    }
  }
  for (const auto& [key, value] : spec.env) {
    env_list.push_back(key + "=" + value);
  }

  std::vector<char*> envp;
  envp.reserve(env_list.size() + 1);
  for (auto& entry : env_list) envp.push_back(entry.data());
  envp.push_back(nullptr);

  std::vector<std::string> args = spec.argv;
  std::vector<char*>       argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  int stdin_pair[2]  = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  auto close_all     = [&] {
    for (int* fds : {stdin_pair, stdout_pipe, stderr_pipe}) {
      CloseFd(fds[0]);
      CloseFd(fds[1]);
    }
  };

  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, stdin_pair) != 0 || ::pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
    const int saved = errno;
    close_all();
    errno = saved;
    ThrowErrno("create stdio pipes");
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    close_all();
    errno = saved;
    ThrowErrno("fork");
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(stdin_pair[1], STDIN_FILENO);
    ::dup2(stdout_pipe[1], STDOUT_FILENO);
    ::dup2(stderr_pipe[1], STDERR_FILENO);
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
      ::_exit(126);
    }
    ::execve(executable.c_str(), argv.data(), envp.data());
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  CloseFd(stdin_pair[1]);
  CloseFd(stdout_pipe[1]);
  CloseFd(stderr_pipe[1]);
  ::fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

  auto child = std::shared_ptr<ChildProcess>(new ChildProcess(pid, stdin_pair[0]));

  Entry entry;
  entry.child    = child;
  entry.observer = std::move(observer);
  entry.fds      = {stdout_pipe[0], stderr_pipe[0]};
  {
    std::lock_guard lock(mutex_);
    pending_.push_back(std::move(entry));
  }
  Wake();

  MESHDEPLOY_LOG_DEBUG("Spawned process", {observability::StringField("executable", executable), observability::IntField("pid", pid)});
  return child;
}

ProcessRunner::RunResult ProcessRunner::Run(const SpawnSpec& spec, std::chrono::milliseconds timeout) {
  auto output    = std::make_shared<std::string>();
  auto out_mutex = std::make_shared<std::mutex>();
  auto exited    = std::make_shared<std::promise<int>>();
  auto done      = exited->get_future();

  capability::ProcessObserver observer;
  observer.on_line = [output, out_mutex](capability::OutputChannel, const std::string& line) {
    std::lock_guard lock(*out_mutex);
    output->append(line).push_back('\n');
  };
  observer.on_exit = [exited](int code) { exited->set_value(code); };

  auto child = Spawn(spec, std::move(observer));
  child->CloseStdin();

  RunResult result;
  if (done.wait_for(timeout) != std::future_status::ready) {
    child->Signal(SIGKILL);
    result.timed_out = true;
  }
  result.exit_code = done.get();

  std::lock_guard lock(*out_mutex);
  result.output = *output;
  return result;
}

void ProcessRunner::Loop() {
  std::vector<Entry> entries;

  struct Delivery {
    capability::ProcessObserver* observer;
    capability::OutputChannel    channel;
    std::string                  line;
  };

  while (true) {
    {
      std::lock_guard lock(mutex_);
      for (auto& entry : pending_) entries.push_back(std::move(entry));
      pending_.clear();
    }
    if (stopping_) break;

    std::vector<pollfd> fds;
    fds.push_back({wake_fds_[0], POLLIN, 0});
    for (const auto& entry : entries) {
      for (int fd : entry.fds) {
        if (fd >= 0) fds.push_back({fd, POLLIN, 0});
      }
    }

    const int ready = ::poll(fds.data(), fds.size(), kPollIntervalMs);
    if (ready < 0 && errno != EINTR) {
      MESHDEPLOY_LOG_ERROR("Process reactor poll failed", {observability::StringField("error", std::generic_category().message(errno))});
    }

    char drain[64];
    while (::read(wake_fds_[0], drain, sizeof(drain)) > 0) {
    }

    // reap first so that a dead child's pipes are read to the end below
    for (auto& entry : entries) {
      if (entry.status) continue;
      int status = 0;
      if (::waitpid(entry.child->Pid(), &status, WNOHANG) == entry.child->Pid()) {
        entry.status = DecodeStatus(status);
      }
    }

    char buffer[4096];
    for (auto& entry : entries) {
      std::vector<Delivery> deliveries;
      for (std::size_t channel = 0; channel < entry.fds.size(); ++channel) {
        auto& fd = entry.fds[channel];
        while (fd >= 0) {
          const auto n = ::read(fd, buffer, sizeof(buffer));
          if (n > 0) {
            entry.partial[channel].append(buffer, static_cast<std::size_t>(n));
            continue;
          }
          if (n < 0 && errno == EINTR) continue;
          if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && !entry.status) break;
          // EOF, error, or nothing left from a reaped child
          CloseFd(fd);
          if (!entry.partial[channel].empty()) entry.partial[channel].push_back('\n');
        }

        std::vector<std::string> lines;
        TakeLines(entry.partial[channel], lines);
        const auto kind = channel == 0 ? capability::OutputChannel::kStdout : capability::OutputChannel::kStderr;
        for (auto& line : lines) deliveries.push_back({&entry.observer, kind, std::move(line)});
      }

      for (auto& delivery : deliveries) {
        if (delivery.observer->on_line) delivery.observer->on_line(delivery.channel, delivery.line);
      }
    }

    for (auto it = entries.begin(); it != entries.end();) {
      if (it->status && it->fds[0] < 0 && it->fds[1] < 0) {
        it->child->MarkExited(*it->status);
        if (it->observer.on_exit) it->observer.on_exit(*it->status);
        it = entries.erase(it);
      } else {
        ++it;
      }
    }
  }

  // shutting down: nobody will observe the children any more
  for (auto& entry : entries) {
    if (!entry.status) {
      entry.child->Signal(SIGKILL);
      int status = 0;
      ::waitpid(entry.child->Pid(), &status, 0);
      entry.child->MarkExited(DecodeStatus(status));
    }
    CloseFd(entry.fds[0]);
    CloseFd(entry.fds[1]);
  }
}

} // namespace meshdeploy::exec
