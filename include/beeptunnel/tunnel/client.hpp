#pragma once

#include "beeptunnel/tunnel/tunnel_config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beeptunnel::tunnel {

/// What one line of tunnel client output revealed.
struct OutputMatch {
  std::optional<std::string> url;
  bool ready = false;

  [[nodiscard]] bool matched() const { return url.has_value() || ready; }
};

/// Adapter between the supervisor and a specific tunnel client binary.
class ITunnelClient {
public:
  virtual ~ITunnelClient() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::vector<std::string> build_arguments(const TunnelConfig &config) const = 0;
  [[nodiscard]] virtual OutputMatch parse_output_line(const std::string &line) const = 0;
};

} // namespace beeptunnel::tunnel
