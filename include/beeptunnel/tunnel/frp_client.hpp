#pragma once

#include "beeptunnel/tunnel/client.hpp"

#include <regex>

namespace beeptunnel::tunnel {

class FrpClient final : public ITunnelClient {
public:
  FrpClient();

  [[nodiscard]] std::string_view name() const override { return "frpc"; }
  [[nodiscard]] std::vector<std::string> build_arguments(const TunnelConfig &config) const override;
  [[nodiscard]] OutputMatch parse_output_line(const std::string &line) const override;

private:
  std::regex proxy_started_;
  std::regex bare_url_;
  std::regex login_success_;
};

} // namespace beeptunnel::tunnel
