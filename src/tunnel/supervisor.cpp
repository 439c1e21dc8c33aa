#include "beeptunnel/tunnel/supervisor.hpp"

#include "beeptunnel/binary/platform.hpp"
#include "beeptunnel/observability/global.hpp"
#include "beeptunnel/tunnel/config_builder.hpp"
#include "beeptunnel/tunnel/process.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <system_error>
#include <thread>

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <poll.h>
#include <unistd.h>
#endif

namespace beeptunnel::tunnel {

namespace {

constexpr const char *COMPONENT = "supervisor";

#ifdef _WIN32
constexpr int TERM_SIGNAL = 15;
constexpr int KILL_SIGNAL = 9;
#else
constexpr int TERM_SIGNAL = SIGTERM;
constexpr int KILL_SIGNAL = SIGKILL;
#endif

constexpr int POLL_INTERVAL_MS = 200;
constexpr int MAX_DRAIN_READS = 64;

std::string exit_code_text(const std::optional<int> &code) {
  return code.has_value() ? std::to_string(*code) : std::string("unknown");
}

} // namespace

struct ProcessSupervisor::Run {
  std::unique_ptr<ChildProcess> process;
  std::thread stdout_reader;
  std::thread stderr_reader;
  std::thread exit_watcher;
  std::atomic<bool> closing{false};
  std::atomic<bool> stop_requested{false};

  std::mutex exit_mutex;
  std::condition_variable exit_cv;
  bool exited = false;
  std::optional<int> exit_code;

  [[nodiscard]] bool has_exited() {
    std::lock_guard<std::mutex> lock(exit_mutex);
    return exited;
  }
};

SupervisorOptions SupervisorOptions::from_config(const config::SupervisorConfig &config) {
  SupervisorOptions options;
  options.graceful_timeout = std::chrono::milliseconds(config.graceful_timeout_ms);
  options.kill_timeout = std::chrono::milliseconds(config.kill_timeout_ms);
  options.restart_delay = std::chrono::milliseconds(config.restart_delay_ms);
  options.max_output_lines = config.max_output_lines;
  options.max_output_bytes = config.max_output_bytes;
  return options;
}

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<binary::IBinaryAcquirer> acquirer,
                                     std::shared_ptr<ITunnelClient> client,
                                     SupervisorOptions options)
    : acquirer_(std::move(acquirer)), client_(std::move(client)), options_(std::move(options)),
      notifier_([this]() { run_notifier(); }) {}

ProcessSupervisor::~ProcessSupervisor() {
  shutdown_notifier();
  if (const auto stopped = stop(); !stopped.ok()) {
    observability::record_error(COMPONENT, "stop during shutdown failed: " + stopped.error());
  }
  std::shared_ptr<Run> leftover;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    leftover = std::move(run_);
  }
  join_run(leftover);
}

bool ProcessSupervisor::live_locked() const { return run_ && !run_->has_exited(); }

std::shared_ptr<ProcessSupervisor::Run> ProcessSupervisor::retire_dead_run() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (run_ && run_->has_exited()) {
    return std::move(run_);
  }
  return nullptr;
}

common::Result<ProcessStatus> ProcessSupervisor::fail_start(const TunnelConfig &config,
                                                            const std::string &message,
                                                            const common::ErrorCode code) {
  ProcessStatus status;
  status.state = SupervisorState::Stopped;
  status.config = config;
  status.error_message = message;
  status.last_checked = std::chrono::system_clock::now();
  status.output = OutputBuffer(options_.max_output_lines, options_.max_output_bytes);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
  }
  observability::record_error(COMPONENT, "start failed: " + message);
  emit_status_changed(status);
  return common::Result<ProcessStatus>::failure(message, code);
}

common::Result<ProcessStatus> ProcessSupervisor::start(const TunnelConfig &config,
                                                       const common::CancellationToken *cancel) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (live_locked() && status_.has_value()) {
      status_->last_checked = std::chrono::system_clock::now();
      return common::Result<ProcessStatus>::success(*status_);
    }
  }
  join_run(retire_dead_run());

  if (common::canceled(cancel)) {
    return fail_start(config, "start canceled", common::ErrorCode::Canceled);
  }
  if (const auto valid = validate_config(config); !valid.ok()) {
    return fail_start(config, valid.error(), valid.code());
  }

  const std::string platform =
      options_.platform.empty() ? binary::current_platform() : options_.platform;
  const auto binary = acquirer_->ensure_binary(platform, cancel);
  if (!binary.ok()) {
    return fail_start(config, binary.error(), binary.code());
  }

  const auto args = client_->build_arguments(config);
  auto spawned = ChildProcess::spawn(binary.value().file_path, args);
  if (!spawned.ok()) {
    return fail_start(config, spawned.error(), spawned.code());
  }

  auto run = std::make_shared<Run>();
  run->process = std::move(spawned.value());
  const int pid = run->process->pid();

  ProcessStatus status;
  status.state = SupervisorState::Starting;
  status.process_id = pid;
  status.is_running = true;
  status.start_time = std::chrono::system_clock::now();
  status.last_checked = status.start_time;
  status.config = config;
  status.output = OutputBuffer(options_.max_output_lines, options_.max_output_bytes);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    run_ = run;
    status_ = status;
    binary_info_ = binary.value();
  }
  emit_status_changed(status);

  try {
    run->exit_watcher = std::thread([this, run]() { watch_exit(run); });
    run->stdout_reader =
        std::thread([this, run]() { read_stream(run, run->process->stdout_fd(), false); });
    run->stderr_reader =
        std::thread([this, run]() { read_stream(run, run->process->stderr_fd(), true); });
  } catch (const std::system_error &err) {
    run->stop_requested = true;
    if (!run->process->signal_group(KILL_SIGNAL)) {
      observability::record_warning(COMPONENT, "unable to kill pid " + std::to_string(pid));
    }
    if (!run->exit_watcher.joinable()) {
      (void)run->process->wait_for_exit();
    }
    join_run(run);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      run_.reset();
    }
    return fail_start(config, std::string("failed to start monitor threads: ") + err.what(),
                      common::ErrorCode::ProcessStart);
  }

  observability::record_process_started(
      pid, binary.value().file_path.string() + " " + join_command_line(args));

  if (common::canceled(cancel)) {
    return common::Result<ProcessStatus>::failure(
        "start canceled; process " + std::to_string(pid) + " is still tracked",
        common::ErrorCode::Canceled);
  }
  return common::Result<ProcessStatus>::success(std::move(status));
}

common::Status ProcessSupervisor::stop(const common::CancellationToken *cancel) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  std::shared_ptr<Run> run;
  std::shared_ptr<Run> dead;
  ProcessStatus stopping;
  SupervisorState previous = SupervisorState::Running;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!run_) {
      return common::Status::success();
    }
    if (run_->has_exited() || !status_.has_value()) {
      dead = std::move(run_);
    } else {
      run = run_;
      previous = status_->state;
      run->stop_requested = true;
      status_->state = SupervisorState::Stopping;
      status_->last_checked = std::chrono::system_clock::now();
      stopping = *status_;
    }
  }
  if (dead) {
    join_run(dead);
    return common::Status::success();
  }
  emit_status_changed(stopping);

  const int pid = run->process->pid();
  if (!run->process->signal_group(TERM_SIGNAL)) {
    observability::record_warning(COMPONENT, "SIGTERM to pid " + std::to_string(pid) + " failed");
  }
  auto waited = wait_exit(*run, options_.graceful_timeout, cancel);
  if (waited == WaitResult::TimedOut) {
    observability::record_warning(COMPONENT, "pid " + std::to_string(pid) +
                                                 " ignored SIGTERM; sending SIGKILL");
    if (!run->process->signal_group(KILL_SIGNAL)) {
      observability::record_warning(COMPONENT,
                                    "SIGKILL to pid " + std::to_string(pid) + " failed");
    }
    waited = wait_exit(*run, options_.kill_timeout, cancel);
  }

  if (waited == WaitResult::Canceled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_ == run && !run->has_exited() && status_.has_value()) {
      run->stop_requested = false;
      status_->state = previous;
    }
    return common::Status::error("stop canceled; process " + std::to_string(pid) +
                                     " is still tracked",
                                 common::ErrorCode::Canceled);
  }
  if (waited == WaitResult::TimedOut) {
    const std::string message =
        "process " + std::to_string(pid) + " did not exit after SIGKILL";
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (run_ == run && status_.has_value()) {
        status_->error_message = message;
      }
    }
    observability::record_error(COMPONENT, message);
    return common::Status::error(message, common::ErrorCode::TerminationTimeout);
  }

  join_run(run);

  ProcessStatus stopped;
  std::chrono::milliseconds uptime{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::system_clock::now();
    if (status_.has_value()) {
      if (now > status_->start_time) {
        uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now - status_->start_time);
      }
      status_->state = SupervisorState::Stopped;
      status_->is_running = false;
      status_->exit_code = run->exit_code;
      status_->tunnel_url.reset();
      status_->last_checked = now;
      stopped = *status_;
    }
    if (run_ == run) {
      run_.reset();
    }
  }
  observability::record_uptime(uptime);
  emit_status_changed(stopped);
  return common::Status::success();
}

common::Result<ProcessStatus> ProcessSupervisor::restart(const common::CancellationToken *cancel) {
  std::optional<TunnelConfig> config;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_.has_value()) {
      config = status_->config;
    }
  }
  if (!config.has_value()) {
    return common::Result<ProcessStatus>::failure(
        "Cannot restart tunnel: no previous configuration available",
        common::ErrorCode::InvalidOperation);
  }

  if (const auto stopped = stop(cancel); !stopped.ok()) {
    return common::Result<ProcessStatus>::failure_from(stopped);
  }

  if (cancel != nullptr) {
    if (cancel->wait_for(options_.restart_delay)) {
      return common::Result<ProcessStatus>::failure("restart canceled",
                                                    common::ErrorCode::Canceled);
    }
  } else {
    std::this_thread::sleep_for(options_.restart_delay);
  }
  return start(*config, cancel);
}

std::optional<ProcessStatus> ProcessSupervisor::status() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!status_.has_value()) {
    return std::nullopt;
  }
  status_->last_checked = std::chrono::system_clock::now();
  if (run_) {
    status_->is_running = !run_->has_exited() && run_->process->is_alive();
  }
  return status_;
}

std::optional<std::string> ProcessSupervisor::tunnel_url() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!status_.has_value()) {
    return std::nullopt;
  }
  return status_->tunnel_url;
}

bool ProcessSupervisor::is_process_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_locked() && run_->process->is_alive();
}

std::optional<binary::BinaryInfo> ProcessSupervisor::binary_info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return binary_info_;
}

bool ProcessSupervisor::wait_for_exit(const std::chrono::milliseconds timeout) {
  std::shared_ptr<Run> run;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    run = run_;
  }
  if (!run) {
    return false;
  }
  return wait_exit(*run, timeout, nullptr) == WaitResult::Exited;
}

void ProcessSupervisor::on_tunnel_url_changed(UrlChangedCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  url_callbacks_.push_back(std::move(callback));
}

void ProcessSupervisor::on_status_changed(StatusChangedCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  status_callbacks_.push_back(std::move(callback));
}

void ProcessSupervisor::read_stream(const std::shared_ptr<Run> &run, const int fd,
                                    const bool is_stderr) {
#ifdef _WIN32
  (void)run;
  (void)fd;
  (void)is_stderr;
#else
  std::string pending;
  char buffer[4096];
  int drain_reads = 0;

  while (true) {
    const bool closing = run->closing.load();
    if (closing && ++drain_reads > MAX_DRAIN_READS) {
      break;
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, closing ? 0 : POLL_INTERVAL_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      if (closing) {
        break;
      }
      continue;
    }

    const ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }

    pending.append(buffer, static_cast<std::size_t>(n));
    std::size_t newline = 0;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      handle_line(run, is_stderr, line);
    }
    if (options_.max_output_bytes > 0 && pending.size() > options_.max_output_bytes) {
      handle_line(run, is_stderr, pending);
      pending.clear();
    }
  }

  if (!pending.empty()) {
    handle_line(run, is_stderr, pending);
  }
#endif
}

void ProcessSupervisor::handle_line(const std::shared_ptr<Run> &run, const bool is_stderr,
                                    const std::string &line) {
  const OutputMatch match = client_->parse_output_line(line);
  std::optional<std::string> new_url;
  std::optional<ProcessStatus> changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_ != run || !status_.has_value()) {
      return;
    }
    status_->output.push(is_stderr ? "[stderr] " + line : line);
    if (is_stderr) {
      status_->error_message = line;
    }
    if (match.url.has_value() && status_->tunnel_url != match.url) {
      status_->tunnel_url = match.url;
      new_url = match.url;
    }
    if (match.matched() && status_->state == SupervisorState::Starting) {
      status_->state = SupervisorState::Running;
      changed = *status_;
    }
  }

  observability::record_process_output(is_stderr ? "stderr" : "stdout", line, match.matched());
  if (new_url.has_value()) {
    observability::record_tunnel_url(*new_url);
    emit_url_changed(*new_url);
  }
  if (changed.has_value()) {
    emit_status_changed(*changed);
  }
}

void ProcessSupervisor::watch_exit(const std::shared_ptr<Run> &run) {
  const auto code = run->process->wait_for_exit();
  {
    std::lock_guard<std::mutex> lock(run->exit_mutex);
    run->exited = true;
    run->exit_code = code;
  }
  run->exit_cv.notify_all();
  handle_exit(run);
}

void ProcessSupervisor::handle_exit(const std::shared_ptr<Run> &run) {
  const bool requested = run->stop_requested.load();
  std::optional<ProcessStatus> changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_ == run && status_.has_value()) {
      status_->is_running = false;
      status_->exit_code = run->exit_code;
      status_->last_checked = std::chrono::system_clock::now();
      if (!requested) {
        status_->state = SupervisorState::Crashed;
        status_->tunnel_url.reset();
        if (!status_->error_message.has_value()) {
          status_->error_message = "tunnel client exited unexpectedly with code " +
                                   exit_code_text(run->exit_code);
        }
        changed = *status_;
      }
    }
  }

  observability::record_process_exited(run->process->pid(), run->exit_code, requested);
  if (changed.has_value()) {
    emit_status_changed(*changed);
  }
}

ProcessSupervisor::WaitResult ProcessSupervisor::wait_exit(Run &run,
                                                           const std::chrono::milliseconds timeout,
                                                           const common::CancellationToken *cancel) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(run.exit_mutex);
  while (!run.exited) {
    if (common::canceled(cancel)) {
      return WaitResult::Canceled;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return WaitResult::TimedOut;
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(
        deadline - now, std::chrono::milliseconds(50));
    run.exit_cv.wait_for(lock, slice);
  }
  return WaitResult::Exited;
}

void ProcessSupervisor::join_run(const std::shared_ptr<Run> &run) {
  if (!run) {
    return;
  }
  run->closing = true;
  for (std::thread *worker : {&run->stdout_reader, &run->stderr_reader, &run->exit_watcher}) {
    if (!worker->joinable()) {
      continue;
    }
    try {
      worker->join();
    } catch (const std::system_error &err) {
      observability::record_error(COMPONENT, std::string("thread join failed: ") + err.what());
    }
  }
}

void ProcessSupervisor::emit_url_changed(const std::string &url) {
  post_event([this, url]() {
    std::vector<UrlChangedCallback> callbacks;
    {
      std::lock_guard<std::mutex> lock(callbacks_mutex_);
      callbacks = url_callbacks_;
    }
    for (const auto &callback : callbacks) {
      try {
        callback(url);
      } catch (const std::exception &err) {
        observability::record_error(COMPONENT, std::string("url callback threw: ") + err.what());
      }
    }
  });
}

void ProcessSupervisor::emit_status_changed(const ProcessStatus &status) {
  post_event([this, status]() {
    std::vector<StatusChangedCallback> callbacks;
    {
      std::lock_guard<std::mutex> lock(callbacks_mutex_);
      callbacks = status_callbacks_;
    }
    for (const auto &callback : callbacks) {
      try {
        callback(status);
      } catch (const std::exception &err) {
        observability::record_error(COMPONENT,
                                    std::string("status callback threw: ") + err.what());
      }
    }
  });
}

void ProcessSupervisor::post_event(std::function<void()> event) {
  {
    std::lock_guard<std::mutex> lock(events_mutex_);
    if (events_closing_) {
      return;
    }
    events_.push_back(std::move(event));
  }
  events_cv_.notify_one();
}

void ProcessSupervisor::run_notifier() {
  while (true) {
    std::function<void()> event;
    {
      std::unique_lock<std::mutex> lock(events_mutex_);
      events_cv_.wait(lock, [this]() { return events_closing_ || !events_.empty(); });
      if (events_closing_) {
        events_.clear();
        return;
      }
      event = std::move(events_.front());
      events_.pop_front();
    }
    event();
  }
}

void ProcessSupervisor::shutdown_notifier() {
  {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_closing_ = true;
  }
  events_cv_.notify_all();
  if (!notifier_.joinable()) {
    return;
  }
  try {
    notifier_.join();
  } catch (const std::system_error &err) {
    observability::record_error(COMPONENT, std::string("notifier join failed: ") + err.what());
  }
}

} // namespace beeptunnel::tunnel
