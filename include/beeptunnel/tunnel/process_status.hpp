#pragma once

#include "beeptunnel/tunnel/tunnel_config.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace beeptunnel::tunnel {

enum class SupervisorState { Idle, Starting, Running, Stopping, Stopped, Crashed };

[[nodiscard]] std::string_view state_name(SupervisorState state);

/// Most recent output lines, capped by line count and total bytes.
class OutputBuffer {
public:
  OutputBuffer() = default;
  OutputBuffer(std::size_t max_lines, std::size_t max_bytes)
      : max_lines_(max_lines), max_bytes_(max_bytes) {}

  void push(std::string line);
  void clear();

  [[nodiscard]] const std::deque<std::string> &lines() const { return lines_; }
  [[nodiscard]] std::size_t size() const { return lines_.size(); }
  [[nodiscard]] std::size_t bytes() const { return bytes_; }
  [[nodiscard]] std::size_t max_lines() const { return max_lines_; }
  [[nodiscard]] std::size_t max_bytes() const { return max_bytes_; }

private:
  std::deque<std::string> lines_;
  std::size_t bytes_ = 0;
  std::size_t max_lines_ = 500;
  std::size_t max_bytes_ = 256 * 1024;
};

struct ProcessStatus {
  SupervisorState state = SupervisorState::Idle;
  int process_id = 0;
  bool is_running = false;
  std::chrono::system_clock::time_point start_time{};
  std::chrono::system_clock::time_point last_checked{};
  std::optional<std::string> tunnel_url;
  std::optional<TunnelConfig> config;
  std::optional<int> exit_code;
  std::optional<std::string> error_message;
  OutputBuffer output;

  /// Zero unless running.
  [[nodiscard]] std::chrono::milliseconds
  uptime(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
  [[nodiscard]] std::string description() const;
};

} // namespace beeptunnel::tunnel
