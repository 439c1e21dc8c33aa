#include "beeptunnel/tunnel/frp_client.hpp"

#include "beeptunnel/tunnel/config_builder.hpp"

namespace beeptunnel::tunnel {

FrpClient::FrpClient()
    : proxy_started_(R"(start proxy success: (.+?) listen on (\[[^\]]+\]|[^\s:]+):(\d+))", std::regex::icase),
      bare_url_(R"(https?://[A-Za-z0-9.\-]+(:\d+)?)", std::regex::icase),
      login_success_(R"(login to server success)", std::regex::icase) {}

std::vector<std::string> FrpClient::build_arguments(const TunnelConfig &config) const {
  return tunnel::build_arguments(config);
}

OutputMatch FrpClient::parse_output_line(const std::string &line) const {
  OutputMatch match;
  std::smatch groups;

  if (std::regex_search(line, groups, proxy_started_)) {
    match.url = "http://" + groups[2].str() + ":" + groups[3].str();
    match.ready = true;
    return match;
  }

  if (std::regex_search(line, groups, bare_url_)) {
    std::string url = groups[0].str();
    while (!url.empty() && (url.back() == '/' || url.back() == '.')) {
      url.pop_back();
    }
    match.url = url;
  }

  match.ready = std::regex_search(line, login_success_);
  return match;
}

} // namespace beeptunnel::tunnel
