#pragma once

#include "beeptunnel/binary/binary_info.hpp"
#include "beeptunnel/tunnel/process_status.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace beeptunnel::tunnel {

/// Process status, binary and platform flattened for API consumers.
struct TunnelReport {
  bool is_running = false;
  std::string state = "idle";
  std::string platform;
  std::string binary_version = "Unknown";
  std::string binary_path = "Not Available";
  std::optional<std::string> tunnel_url;
  std::chrono::system_clock::time_point last_updated{};
  std::optional<std::string> error_message;
  std::optional<std::string> status_message;
  std::optional<int> process_id;
  std::optional<std::chrono::system_clock::time_point> process_start_time;
  std::optional<double> uptime_seconds;
  std::optional<int> exit_code;
  std::optional<TunnelConfig> configuration;
};

[[nodiscard]] TunnelReport make_report(const std::optional<ProcessStatus> &status,
                                       const std::optional<binary::BinaryInfo> &binary_info,
                                       const std::string &platform);

/// The relay token is masked.
[[nodiscard]] std::string report_to_json(const TunnelReport &report);

} // namespace beeptunnel::tunnel
