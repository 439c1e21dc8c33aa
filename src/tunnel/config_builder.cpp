#include "beeptunnel/tunnel/config_builder.hpp"

#include "beeptunnel/common/crypto.hpp"
#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/common/toml.hpp"

#include <sstream>

namespace beeptunnel::tunnel {

namespace {

bool valid_port(const int port) { return port >= 1 && port <= 65535; }

bool needs_quoting(const std::string &arg) {
  if (arg.empty()) {
    return true;
  }
  for (const char ch : arg) {
    if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '"') {
      return true;
    }
  }
  return false;
}

common::Status invalid(const std::string &message) {
  return common::Status::error(message, common::ErrorCode::ConfigValidation);
}

} // namespace

common::Status validate_config(const TunnelConfig &config) {
  if (!valid_port(config.local_port)) {
    return invalid("local_port must be between 1 and 65535 (got " +
                   std::to_string(config.local_port) + ")");
  }
  if (!valid_port(config.server_port)) {
    return invalid("server_port must be between 1 and 65535 (got " +
                   std::to_string(config.server_port) + ")");
  }
  if (common::trim(config.server_addr).empty()) {
    return invalid("server_addr is required");
  }
  if (common::trim(config.proxy_name).empty()) {
    return invalid("proxy_name is required");
  }
  if (common::trim(config.local_ip).empty()) {
    return invalid("local_ip is required");
  }
  return common::Status::success();
}

bool is_valid_config(const TunnelConfig &config) { return validate_config(config).ok(); }

std::vector<std::string> build_arguments(const TunnelConfig &config) {
  std::vector<std::string> args = {"http",
                                   "-s",
                                   config.server_addr,
                                   "-P",
                                   std::to_string(config.server_port),
                                   "-i",
                                   config.local_ip,
                                   "-l",
                                   std::to_string(config.local_port),
                                   "-n",
                                   config.proxy_name,
                                   "--log-level",
                                   config.log_level};

  if (!config.token.empty()) {
    args.insert(args.end(), {"-t", config.token});
  }
  if (!config.user.empty()) {
    args.insert(args.end(), {"-u", config.user});
  }
  if (!config.subdomain.empty()) {
    args.insert(args.end(), {"--sd", config.subdomain});
  }
  if (!config.custom_domain.empty()) {
    args.insert(args.end(), {"-d", config.custom_domain});
  }
  if (config.enable_tls) {
    args.emplace_back("--tls-enable");
  }
  if (config.use_compression) {
    args.emplace_back("--uc");
  }
  if (config.use_encryption) {
    args.emplace_back("--ue");
  }
  if (!config.protocol.empty() && common::to_lower(config.protocol) != "tcp") {
    args.insert(args.end(), {"-p", config.protocol});
  }
  return args;
}

std::string escape_argument(const std::string &arg) {
  if (!needs_quoting(arg)) {
    return arg;
  }

  std::string out = "\"";
  std::size_t backslashes = 0;
  for (const char ch : arg) {
    if (ch == '\\') {
      ++backslashes;
      continue;
    }
    if (ch == '"') {
      out.append(backslashes * 2 + 1, '\\');
      out.push_back('"');
    } else {
      out.append(backslashes, '\\');
      out.push_back(ch);
    }
    backslashes = 0;
  }
  // Backslashes before the closing quote must be doubled.
  out.append(backslashes * 2, '\\');
  out.push_back('"');
  return out;
}

std::string join_command_line(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += escape_argument(arg);
  }
  return out;
}

common::Result<TunnelConfig> create_default(const int local_port, const std::string &server_addr) {
  const auto name_suffix = common::random_hex(4);
  if (!name_suffix.ok()) {
    return common::Result<TunnelConfig>::failure_from(name_suffix);
  }
  const auto subdomain = common::random_hex(6);
  if (!subdomain.ok()) {
    return common::Result<TunnelConfig>::failure_from(subdomain);
  }

  TunnelConfig config;
  config.local_port = local_port;
  config.server_addr = server_addr;
  config.proxy_name = "beepphone-" + name_suffix.value();
  config.subdomain = subdomain.value();
  return common::Result<TunnelConfig>::success(std::move(config));
}

common::Result<TunnelConfig> tunnel_config_from(const config::RelayConfig &relay) {
  auto created = create_default(relay.local_port, relay.server_addr);
  if (!created.ok()) {
    return created;
  }

  TunnelConfig &config = created.value();
  config.local_ip = relay.local_ip;
  config.server_port = relay.server_port;
  config.token = relay.token;
  config.user = relay.user;
  if (!relay.proxy_name.empty()) {
    config.proxy_name = relay.proxy_name;
  }
  if (!relay.subdomain.empty()) {
    config.subdomain = relay.subdomain;
  }
  config.custom_domain = relay.custom_domain;
  config.enable_tls = relay.enable_tls;
  config.use_compression = relay.use_compression;
  config.use_encryption = relay.use_encryption;
  config.log_level = relay.log_level;
  config.protocol = relay.protocol;
  return created;
}

std::string render_config_file(const TunnelConfig &config) {
  const auto bool_text = [](bool value) { return value ? "true" : "false"; };

  std::ostringstream out;
  out << "serverAddr = " << common::quote_toml_string(config.server_addr) << "\n";
  out << "serverPort = " << config.server_port << "\n";
  if (!config.user.empty()) {
    out << "user = " << common::quote_toml_string(config.user) << "\n";
  }
  if (!config.token.empty()) {
    out << "auth.method = \"token\"\n";
    out << "auth.token = " << common::quote_toml_string(config.token) << "\n";
  }
  out << "log.to = \"console\"\n";
  out << "log.level = " << common::quote_toml_string(config.log_level) << "\n";
  out << "transport.tls.enable = " << bool_text(config.enable_tls) << "\n";
  out << "transport.protocol = " << common::quote_toml_string(config.protocol) << "\n";

  out << "\n[[proxies]]\n";
  out << "name = " << common::quote_toml_string(config.proxy_name) << "\n";
  out << "type = \"http\"\n";
  out << "localIP = " << common::quote_toml_string(config.local_ip) << "\n";
  out << "localPort = " << config.local_port << "\n";
  if (!config.subdomain.empty()) {
    out << "subdomain = " << common::quote_toml_string(config.subdomain) << "\n";
  }
  if (!config.custom_domain.empty()) {
    out << "customDomains = [" << common::quote_toml_string(config.custom_domain) << "]\n";
  }
  out << "transport.useEncryption = " << bool_text(config.use_encryption) << "\n";
  out << "transport.useCompression = " << bool_text(config.use_compression) << "\n";
  return out.str();
}

} // namespace beeptunnel::tunnel
