#pragma once

#include <cstdint>
#include <string>

namespace beeptunnel::config {

inline constexpr const char *DEFAULT_SERVER_ADDR = "frp.beepphone.dev";
inline constexpr const char *DEFAULT_REGISTRY_URL =
    "https://api.github.com/repos/fatedier/frp/releases/latest";
inline constexpr const char *DEFAULT_CHECKSUM_URL_TEMPLATE =
    "https://github.com/fatedier/frp/releases/download/{version}/sha256_checksums.txt";

struct RelayConfig {
  std::string server_addr = DEFAULT_SERVER_ADDR;
  int server_port = 7000;
  std::string local_ip = "127.0.0.1";
  int local_port = 5000;
  std::string token;
  std::string user;
  /// Empty means a fresh `beepphone-<hex>` name per run.
  std::string proxy_name;
  std::string subdomain;
  std::string custom_domain;
  bool enable_tls = true;
  bool use_compression = true;
  bool use_encryption = true;
  std::string log_level = "info";
  std::string protocol = "tcp";
};

struct BinariesConfig {
  std::string mode = "bundled";
  /// Empty means `<executable dir>/binaries`.
  std::string bundled_dir;
  std::string bundled_version = "0.64.0";
  /// Empty means `<config dir>/binaries`.
  std::string cache_dir;
  std::string registry_url = DEFAULT_REGISTRY_URL;
  std::string checksum_url_template = DEFAULT_CHECKSUM_URL_TEMPLATE;
  std::uint32_t metadata_ttl_hours = 24;
  bool require_checksum = false;
  std::uint32_t http_timeout_secs = 300;
};

struct SupervisorConfig {
  std::uint32_t graceful_timeout_ms = 5000;
  std::uint32_t kill_timeout_ms = 2000;
  std::uint32_t restart_delay_ms = 1000;
  std::uint32_t max_output_lines = 500;
  std::uint32_t max_output_bytes = 256 * 1024;
};

struct ObservabilityConfig {
  std::string backend = "log";
  bool verbose = false;
};

struct Config {
  RelayConfig relay;
  BinariesConfig binaries;
  SupervisorConfig supervisor;
  ObservabilityConfig observability;
};

} // namespace beeptunnel::config
