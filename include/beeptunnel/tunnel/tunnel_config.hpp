#pragma once

#include "beeptunnel/config/schema.hpp"

#include <string>

namespace beeptunnel::tunnel {

/// Parameters of one tunnel session. Empty optional strings mean "not set".
struct TunnelConfig {
  std::string local_ip = "127.0.0.1";
  int local_port = 5000;
  std::string server_addr = config::DEFAULT_SERVER_ADDR;
  int server_port = 7000;
  std::string token;
  std::string user;
  std::string proxy_name = "beepphone-http";
  std::string subdomain;
  std::string custom_domain;
  bool enable_tls = true;
  bool use_compression = true;
  bool use_encryption = true;
  std::string log_level = "info";
  std::string protocol = "tcp";

  bool operator==(const TunnelConfig &) const = default;
};

} // namespace beeptunnel::tunnel
