#include "beeptunnel/tunnel/process_status.hpp"

namespace beeptunnel::tunnel {

std::string_view state_name(const SupervisorState state) {
  switch (state) {
  case SupervisorState::Idle:
    return "idle";
  case SupervisorState::Starting:
    return "starting";
  case SupervisorState::Running:
    return "running";
  case SupervisorState::Stopping:
    return "stopping";
  case SupervisorState::Stopped:
    return "stopped";
  case SupervisorState::Crashed:
    return "crashed";
  }
  return "unknown";
}

void OutputBuffer::push(std::string line) {
  if (max_lines_ == 0) {
    return;
  }
  if (line.size() > max_bytes_) {
    line.resize(max_bytes_);
  }
  bytes_ += line.size();
  lines_.push_back(std::move(line));
  while (!lines_.empty() && (lines_.size() > max_lines_ || bytes_ > max_bytes_)) {
    bytes_ -= lines_.front().size();
    lines_.pop_front();
  }
}

void OutputBuffer::clear() {
  lines_.clear();
  bytes_ = 0;
}

std::chrono::milliseconds ProcessStatus::uptime(const std::chrono::system_clock::time_point now) const {
  if (!is_running || now < start_time) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time);
}

std::string ProcessStatus::description() const {
  if (!is_running && exit_code.has_value()) {
    return "Exited with code " + std::to_string(*exit_code);
  }
  if (!is_running) {
    return "Stopped";
  }
  if (tunnel_url.has_value()) {
    return "Running - Tunnel active at " + *tunnel_url;
  }
  return "Starting...";
}

} // namespace beeptunnel::tunnel
