#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace beeptunnel::observability {

struct ProcessStartedEvent {
  int pid = 0;
  std::string command_line;
};

struct ProcessExitedEvent {
  int pid = 0;
  std::optional<int> exit_code;
  /// True when the exit followed a stop request.
  bool requested = false;
};

struct TunnelUrlEvent {
  std::string url;
};

struct ProcessOutputEvent {
  std::string stream;
  std::string line;
  bool matched = false;
};

struct BinaryResolvedEvent {
  std::string platform;
  std::string path;
  std::string version;
  std::string source;
};

struct BinaryCheckEvent {
  std::string path;
  std::string check;
  bool passed = false;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ProcessStartedEvent, ProcessExitedEvent, TunnelUrlEvent, ProcessOutputEvent,
                 BinaryResolvedEvent, BinaryCheckEvent, WarningEvent, ErrorEvent>;

struct DownloadMetric {
  std::string url;
  std::uint64_t bytes = 0;
  std::chrono::milliseconds duration{0};
};

struct UptimeMetric {
  std::chrono::milliseconds uptime{0};
};

using ObserverMetric = std::variant<DownloadMetric, UptimeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace beeptunnel::observability
