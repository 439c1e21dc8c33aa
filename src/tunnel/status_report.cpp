#include "beeptunnel/tunnel/status_report.hpp"

#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/common/json_util.hpp"

#include <iomanip>
#include <sstream>

namespace beeptunnel::tunnel {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

std::string optional_string(const std::optional<std::string> &value) {
  return value.has_value() ? quoted(*value) : "null";
}

std::string optional_int(const std::optional<int> &value) {
  return value.has_value() ? std::to_string(*value) : "null";
}

std::string config_to_json(const TunnelConfig &config) {
  std::ostringstream out;
  out << "{\"local_ip\":" << quoted(config.local_ip) << ",\"local_port\":" << config.local_port
      << ",\"server_addr\":" << quoted(config.server_addr)
      << ",\"server_port\":" << config.server_port
      << ",\"token\":" << (config.token.empty() ? "null" : "\"***\"")
      << ",\"user\":" << (config.user.empty() ? "null" : quoted(config.user))
      << ",\"proxy_name\":" << quoted(config.proxy_name)
      << ",\"subdomain\":" << (config.subdomain.empty() ? "null" : quoted(config.subdomain))
      << ",\"custom_domain\":"
      << (config.custom_domain.empty() ? "null" : quoted(config.custom_domain))
      << ",\"enable_tls\":" << (config.enable_tls ? "true" : "false")
      << ",\"use_compression\":" << (config.use_compression ? "true" : "false")
      << ",\"use_encryption\":" << (config.use_encryption ? "true" : "false")
      << ",\"log_level\":" << quoted(config.log_level)
      << ",\"protocol\":" << quoted(config.protocol) << "}";
  return out.str();
}

} // namespace

TunnelReport make_report(const std::optional<ProcessStatus> &status,
                         const std::optional<binary::BinaryInfo> &binary_info,
                         const std::string &platform) {
  TunnelReport report;
  report.platform = platform;
  report.last_updated = std::chrono::system_clock::now();
  if (binary_info.has_value()) {
    report.binary_version = binary_info->version;
    report.binary_path = binary_info->file_path.string();
  }

  if (!status.has_value()) {
    return report;
  }

  report.is_running = status->is_running;
  report.state = std::string(state_name(status->state));
  report.tunnel_url = status->tunnel_url;
  report.error_message = status->error_message;
  report.exit_code = status->exit_code;
  report.configuration = status->config;
  report.status_message = status->description();
  if (status->is_running) {
    report.process_id = status->process_id;
    report.process_start_time = status->start_time;
    report.uptime_seconds =
        static_cast<double>(status->uptime(report.last_updated).count()) / 1000.0;
  }
  return report;
}

std::string report_to_json(const TunnelReport &report) {
  std::ostringstream out;
  out << "{";
  out << "\"is_running\":" << (report.is_running ? "true" : "false");
  out << ",\"state\":" << quoted(report.state);
  out << ",\"platform\":" << quoted(report.platform);
  out << ",\"binary_version\":" << quoted(report.binary_version);
  out << ",\"binary_path\":" << quoted(report.binary_path);
  out << ",\"tunnel_url\":" << optional_string(report.tunnel_url);
  out << ",\"last_updated\":" << quoted(common::format_rfc3339(report.last_updated));
  out << ",\"error_message\":" << optional_string(report.error_message);
  out << ",\"status_message\":" << optional_string(report.status_message);
  out << ",\"process_id\":" << optional_int(report.process_id);
  out << ",\"process_start_time\":"
      << (report.process_start_time.has_value()
              ? quoted(common::format_rfc3339(*report.process_start_time))
              : std::string("null"));
  out << ",\"uptime_seconds\":";
  if (report.uptime_seconds.has_value()) {
    out << std::fixed << std::setprecision(3) << *report.uptime_seconds;
  } else {
    out << "null";
  }
  out << ",\"exit_code\":" << optional_int(report.exit_code);
  out << ",\"configuration\":"
      << (report.configuration.has_value() ? config_to_json(*report.configuration)
                                           : std::string("null"));
  out << "}";
  return out.str();
}

} // namespace beeptunnel::tunnel
