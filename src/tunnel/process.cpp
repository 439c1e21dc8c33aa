#include "beeptunnel/tunnel/process.hpp"

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace beeptunnel::tunnel {

#ifdef _WIN32

common::Result<std::unique_ptr<ChildProcess>>
ChildProcess::spawn(const std::filesystem::path &, const std::vector<std::string> &) {
  return common::Result<std::unique_ptr<ChildProcess>>::failure(
      "process supervision is not implemented on Windows", common::ErrorCode::ProcessStart);
}

ChildProcess::~ChildProcess() = default;

bool ChildProcess::is_alive() const { return false; }

bool ChildProcess::signal_group(int) const { return false; }

std::optional<int> ChildProcess::wait_for_exit() { return std::nullopt; }

#else

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

bool set_cloexec(const int fd) {
  const int flags = fcntl(fd, F_GETFD);
  return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool make_pipe(int fds[2]) {
  if (pipe(fds) != 0) {
    return false;
  }
  if (!set_cloexec(fds[0]) || !set_cloexec(fds[1])) {
    close_fd(fds[0]);
    close_fd(fds[1]);
    return false;
  }
  return true;
}

} // namespace

common::Result<std::unique_ptr<ChildProcess>>
ChildProcess::spawn(const std::filesystem::path &program, const std::vector<std::string> &args) {
  using SpawnResult = common::Result<std::unique_ptr<ChildProcess>>;

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  const auto cleanup = [&]() {
    for (int *fds : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
  };

  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
    cleanup();
    return SpawnResult::failure(std::string("failed to create pipes: ") + std::strerror(errno),
                                common::ErrorCode::ProcessStart);
  }

  const std::string program_str = program.string();
  std::vector<char *> cargs;
  cargs.reserve(args.size() + 2);
  cargs.push_back(const_cast<char *>(program_str.c_str()));
  for (const auto &arg : args) {
    cargs.push_back(const_cast<char *>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    cleanup();
    return SpawnResult::failure(std::string("fork failed: ") + std::strerror(err),
                                common::ErrorCode::ProcessStart);
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execv(program_str.c_str(), cargs.data());
    const int err = errno;
    (void)!write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  // The exec pipe is close-on-exec: EOF means execv succeeded.
  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n > 0) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    return SpawnResult::failure("failed to execute " + program_str + ": " +
                                    std::strerror(exec_errno),
                                common::ErrorCode::ProcessStart);
  }

  return SpawnResult::success(
      std::unique_ptr<ChildProcess>(new ChildProcess(pid, out_pipe[0], err_pipe[0])));
}

ChildProcess::~ChildProcess() {
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

bool ChildProcess::is_alive() const {
  if (pid_ <= 0 || reaped_) {
    return false;
  }
  if (kill(pid_, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

bool ChildProcess::signal_group(const int signal) const {
  if (pid_ <= 0 || reaped_) {
    return false;
  }
  if (kill(-pid_, signal) == 0) {
    return true;
  }
  // The group may not exist yet if setpgid raced with the signal.
  return kill(pid_, signal) == 0;
}

std::optional<int> ChildProcess::wait_for_exit() {
  if (pid_ <= 0 || reaped_) {
    return std::nullopt;
  }
  int status = 0;
  pid_t done = 0;
  do {
    done = waitpid(pid_, &status, 0);
  } while (done < 0 && errno == EINTR);
  reaped_ = true;
  if (done != pid_) {
    return std::nullopt;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return std::nullopt;
}

#endif

} // namespace beeptunnel::tunnel
