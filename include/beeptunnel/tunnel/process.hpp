#pragma once

#include "beeptunnel/common/result.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace beeptunnel::tunnel {

/// A spawned child in its own process group with stdout and stderr piped back.
/// The destructor closes the pipes but neither signals nor reaps the child.
class ChildProcess {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<ChildProcess>>
  spawn(const std::filesystem::path &program, const std::vector<std::string> &args);

  ~ChildProcess();
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  [[nodiscard]] int pid() const { return pid_; }
  [[nodiscard]] int stdout_fd() const { return stdout_fd_; }
  [[nodiscard]] int stderr_fd() const { return stderr_fd_; }

  /// Liveness probe; an unreaped zombie still counts as alive.
  [[nodiscard]] bool is_alive() const;

  /// Sends `signal` to the whole process group.
  [[nodiscard]] bool signal_group(int signal) const;

  /// Blocks until the child exits. Signal deaths report 128 + signal.
  [[nodiscard]] std::optional<int> wait_for_exit();

private:
  ChildProcess(int pid, int stdout_fd, int stderr_fd)
      : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

  int pid_ = 0;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::atomic<bool> reaped_{false};
};

} // namespace beeptunnel::tunnel
