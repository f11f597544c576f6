#pragma once

#include <sys/types.h>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/capability/execution.hpp"

namespace meshdeploy::exec {

struct SpawnSpec {
  std::vector<std::string>           argv;
  std::string                        working_dir;
  std::map<std::string, std::string> env;  // added to the inherited environment
};

/*
  A child started by ProcessRunner. The child runs in its own process group
  and signals go to the whole group.
*/
class ChildProcess {
 public:
  pid_t Pid() const {
    return pid_;
  }

  // Returns false once stdin is closed or the child is gone.
  bool WriteStdin(std::string_view data);
  void CloseStdin();

  // Returns false if the child was already reaped.
  bool Signal(int signal_number);

  std::optional<int> ExitCode() const;
  std::optional<int> WaitExit(std::chrono::milliseconds timeout);

  ~ChildProcess();

 private:
  friend class ProcessRunner;

  ChildProcess(pid_t pid, int stdin_fd);
  void MarkExited(int exit_code);

  const pid_t             pid_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  int                     stdin_fd_;
  std::optional<int>      exit_code_;
};

/*
  fork/exec with piped stdio and a single reactor thread.

  The reactor polls every child's stdout and stderr, splits them into lines
  for the observer, reaps exits with waitpid(WNOHANG) and reports the status
  (128 + signal for signal deaths) after the remaining output was delivered.
*/
class ProcessRunner {
 public:
  struct RunResult {
    int         exit_code = -1;
    std::string output;  // stdout and stderr interleaved by line
    bool        timed_out = false;
  };

  ProcessRunner();
  ~ProcessRunner();

  ProcessRunner(const ProcessRunner&)            = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;

  // Throws std::system_error when the child cannot be created.
  std::shared_ptr<ChildProcess> Spawn(const SpawnSpec& spec, capability::ProcessObserver observer);

  // Runs to completion; the child is killed once `timeout` passes.
  RunResult Run(const SpawnSpec& spec, std::chrono::milliseconds timeout);

 private:
  struct Entry {
    std::shared_ptr<ChildProcess> child;
    capability::ProcessObserver   observer;
    std::array<int, 2>            fds{-1, -1};  // stdout, stderr
    std::array<std::string, 2>    partial;
    std::optional<int>            status;
  };

  void Loop();
  void Wake();

  int                 wake_fds_[2]{-1, -1};
  std::mutex          mutex_;
  std::vector<Entry>  pending_;
  std::atomic<bool>   stopping_{false};
  std::thread         reactor_;
};

} // namespace meshdeploy::exec
