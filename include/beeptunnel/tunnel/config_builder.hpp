#pragma once

#include "beeptunnel/common/result.hpp"
#include "beeptunnel/config/schema.hpp"
#include "beeptunnel/tunnel/tunnel_config.hpp"

#include <string>
#include <vector>

namespace beeptunnel::tunnel {

/// Fails with ConfigValidation naming the first invalid field.
[[nodiscard]] common::Status validate_config(const TunnelConfig &config);
[[nodiscard]] bool is_valid_config(const TunnelConfig &config);

/// frpc command-line arguments, in a fixed order.
[[nodiscard]] std::vector<std::string> build_arguments(const TunnelConfig &config);

[[nodiscard]] std::string escape_argument(const std::string &arg);
[[nodiscard]] std::string join_command_line(const std::vector<std::string> &args);

/// Fresh config with a random `beepphone-<8 hex>` proxy name and 12-hex subdomain.
[[nodiscard]] common::Result<TunnelConfig>
create_default(int local_port = 5000, const std::string &server_addr = config::DEFAULT_SERVER_ADDR);

/// Overlays the `[relay]` settings on create_default().
[[nodiscard]] common::Result<TunnelConfig> tunnel_config_from(const config::RelayConfig &relay);

/// Equivalent frpc TOML configuration file.
[[nodiscard]] std::string render_config_file(const TunnelConfig &config);

} // namespace beeptunnel::tunnel
