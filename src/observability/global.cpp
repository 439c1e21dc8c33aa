#include "beeptunnel/observability/global.hpp"

#include <mutex>

namespace beeptunnel::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_process_started(const int pid, const std::string &command_line) {
  record_event(ProcessStartedEvent{.pid = pid, .command_line = command_line});
}

void record_process_exited(const int pid, std::optional<int> exit_code, const bool requested) {
  record_event(ProcessExitedEvent{.pid = pid, .exit_code = exit_code, .requested = requested});
}

void record_tunnel_url(const std::string &url) { record_event(TunnelUrlEvent{.url = url}); }

void record_process_output(const std::string &stream, const std::string &line,
                           const bool matched) {
  record_event(ProcessOutputEvent{.stream = stream, .line = line, .matched = matched});
}

void record_binary_resolved(const std::string &platform, const std::string &path,
                            const std::string &version, const std::string &source) {
  record_event(BinaryResolvedEvent{
      .platform = platform, .path = path, .version = version, .source = source});
}

void record_binary_check(const std::string &path, const std::string &check, const bool passed,
                         const std::string &detail) {
  record_event(BinaryCheckEvent{.path = path, .check = check, .passed = passed, .detail = detail});
}

void record_download(const std::string &url, const std::uint64_t bytes,
                     const std::chrono::milliseconds duration) {
  record_metric(DownloadMetric{.url = url, .bytes = bytes, .duration = duration});
}

void record_uptime(const std::chrono::milliseconds uptime) {
  record_metric(UptimeMetric{.uptime = uptime});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace beeptunnel::observability
