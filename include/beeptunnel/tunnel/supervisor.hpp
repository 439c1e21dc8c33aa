#pragma once

#include "beeptunnel/binary/acquirer.hpp"
#include "beeptunnel/common/cancellation.hpp"
#include "beeptunnel/common/result.hpp"
#include "beeptunnel/config/schema.hpp"
#include "beeptunnel/tunnel/client.hpp"
#include "beeptunnel/tunnel/process_status.hpp"
#include "beeptunnel/tunnel/tunnel_config.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace beeptunnel::tunnel {

struct SupervisorOptions {
  std::chrono::milliseconds graceful_timeout{5000};
  std::chrono::milliseconds kill_timeout{2000};
  std::chrono::milliseconds restart_delay{1000};
  std::size_t max_output_lines = 500;
  std::size_t max_output_bytes = 256 * 1024;
  /// Empty resolves the running host's platform.
  std::string platform;

  [[nodiscard]] static SupervisorOptions from_config(const config::SupervisorConfig &config);
};

/// Owns one tunnel client process and tracks it through its lifecycle.
/// Callbacks run in order on a notifier thread owned by the supervisor, so they
/// may call start, stop or restart. They must not destroy the supervisor.
class ProcessSupervisor {
public:
  using UrlChangedCallback = std::function<void(const std::string &)>;
  using StatusChangedCallback = std::function<void(const ProcessStatus &)>;

  ProcessSupervisor(std::shared_ptr<binary::IBinaryAcquirer> acquirer,
                    std::shared_ptr<ITunnelClient> client, SupervisorOptions options = {});
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor &) = delete;
  ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

  /// Returns the current status without spawning when a process is already alive.
  [[nodiscard]] common::Result<ProcessStatus>
  start(const TunnelConfig &config, const common::CancellationToken *cancel = nullptr);

  /// SIGTERM, then SIGKILL after the graceful timeout. Ok when nothing runs.
  [[nodiscard]] common::Status stop(const common::CancellationToken *cancel = nullptr);

  [[nodiscard]] common::Result<ProcessStatus>
  restart(const common::CancellationToken *cancel = nullptr);

  [[nodiscard]] std::optional<ProcessStatus> status();
  [[nodiscard]] std::optional<std::string> tunnel_url() const;
  [[nodiscard]] bool is_process_running() const;
  [[nodiscard]] std::optional<binary::BinaryInfo> binary_info() const;

  /// Blocks until the tracked process exits; false on timeout or when none runs.
  bool wait_for_exit(std::chrono::milliseconds timeout);

  void on_tunnel_url_changed(UrlChangedCallback callback);
  void on_status_changed(StatusChangedCallback callback);

  [[nodiscard]] const SupervisorOptions &options() const { return options_; }

private:
  struct Run;
  enum class WaitResult { Exited, TimedOut, Canceled };

  [[nodiscard]] common::Result<ProcessStatus> fail_start(const TunnelConfig &config,
                                                         const std::string &message,
                                                         common::ErrorCode code);
  [[nodiscard]] bool live_locked() const;
  [[nodiscard]] std::shared_ptr<Run> retire_dead_run();

  void read_stream(const std::shared_ptr<Run> &run, int fd, bool is_stderr);
  void watch_exit(const std::shared_ptr<Run> &run);
  void handle_line(const std::shared_ptr<Run> &run, bool is_stderr, const std::string &line);
  void handle_exit(const std::shared_ptr<Run> &run);

  WaitResult wait_exit(Run &run, std::chrono::milliseconds timeout,
                       const common::CancellationToken *cancel) const;
  static void join_run(const std::shared_ptr<Run> &run);

  void emit_url_changed(const std::string &url);
  void emit_status_changed(const ProcessStatus &status);
  void post_event(std::function<void()> event);
  void run_notifier();
  void shutdown_notifier();

  std::shared_ptr<binary::IBinaryAcquirer> acquirer_;
  std::shared_ptr<ITunnelClient> client_;
  SupervisorOptions options_;

  // Serializes start/stop so only one spawn can be in flight. Worker threads
  // never take it, so joining them while it is held cannot block.
  std::mutex lifecycle_mutex_;

  mutable std::mutex mutex_;
  std::optional<ProcessStatus> status_;
  std::shared_ptr<Run> run_;
  std::optional<binary::BinaryInfo> binary_info_;

  std::mutex callbacks_mutex_;
  std::vector<UrlChangedCallback> url_callbacks_;
  std::vector<StatusChangedCallback> status_callbacks_;

  std::mutex events_mutex_;
  std::condition_variable events_cv_;
  std::deque<std::function<void()>> events_;
  bool events_closing_ = false;
  std::thread notifier_;
};

} // namespace beeptunnel::tunnel
