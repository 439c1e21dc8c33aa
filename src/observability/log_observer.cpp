#include "beeptunnel/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace beeptunnel::observability {

namespace {

std::string exit_code_text(const std::optional<int> &code) {
  return code.has_value() ? std::to_string(*code) : std::string("unknown");
}

} // namespace

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ProcessStartedEvent>) {
          log_line("INFO", "process.start pid=" + std::to_string(evt.pid) + " cmd=" +
                               evt.command_line);
        } else if constexpr (std::is_same_v<T, ProcessExitedEvent>) {
          log_line(evt.requested ? "INFO" : "WARN",
                   "process.exit pid=" + std::to_string(evt.pid) +
                       " code=" + exit_code_text(evt.exit_code) +
                       (evt.requested ? " (stopped)" : " (unexpected)"));
        } else if constexpr (std::is_same_v<T, TunnelUrlEvent>) {
          log_line("INFO", "tunnel.url " + evt.url);
        } else if constexpr (std::is_same_v<T, ProcessOutputEvent>) {
          log_line("DEBUG", "process." + evt.stream + (evt.matched ? " [match] " : " ") + evt.line);
        } else if constexpr (std::is_same_v<T, BinaryResolvedEvent>) {
          log_line("INFO", "binary.resolved platform=" + evt.platform + " version=" + evt.version +
                               " source=" + evt.source + " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, BinaryCheckEvent>) {
          log_line(evt.passed ? "DEBUG" : "WARN",
                   "binary.check " + evt.check + (evt.passed ? " ok " : " failed ") + evt.path +
                       (evt.detail.empty() ? std::string() : ": " + evt.detail));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, DownloadMetric>) {
          log_line("DEBUG", "metric.download bytes=" + std::to_string(m.bytes) +
                                " duration_ms=" + std::to_string(m.duration.count()) +
                                " url=" + m.url);
        } else if constexpr (std::is_same_v<T, UptimeMetric>) {
          log_line("DEBUG", "metric.uptime_ms=" + std::to_string(m.uptime.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace beeptunnel::observability
