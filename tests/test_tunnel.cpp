#include "test_framework.hpp"

#include "beeptunnel/tunnel/config_builder.hpp"
#include "beeptunnel/tunnel/frp_client.hpp"
#include "beeptunnel/tunnel/process_status.hpp"
#include "beeptunnel/tunnel/status_report.hpp"

#include <algorithm>

namespace {

bool contains_pair(const std::vector<std::string> &args, const std::string &flag,
                   const std::string &value) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value) {
      return true;
    }
  }
  return false;
}

bool contains(const std::vector<std::string> &args, const std::string &flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

} // namespace

void register_config_builder_tests(std::vector<beeptunnel::tests::TestCase> &tests) {
  using beeptunnel::tests::require;
  namespace tn = beeptunnel::tunnel;
  namespace common = beeptunnel::common;

  tests.push_back({"validate_config_names_first_invalid_field", [] {
                     tn::TunnelConfig config;
                     require(tn::is_valid_config(config), "defaults should be valid");

                     config.local_port = 0;
                     config.server_port = 70000;
                     auto status = tn::validate_config(config);
                     require(!status.ok(), "port 0 should fail");
                     require(status.code() == common::ErrorCode::ConfigValidation, "code");
                     require(status.error().find("local_port") != std::string::npos,
                             "local_port is checked first: " + status.error());

                     config.local_port = 65535;
                     status = tn::validate_config(config);
                     require(status.error().find("server_port") != std::string::npos,
                             "server_port next: " + status.error());

                     config = tn::TunnelConfig{};
                     config.server_addr = "   ";
                     require(!tn::is_valid_config(config), "blank server_addr rejected");
                     config = tn::TunnelConfig{};
                     config.proxy_name = "";
                     require(!tn::is_valid_config(config), "empty proxy_name rejected");
                     config = tn::TunnelConfig{};
                     config.local_ip = "";
                     require(!tn::is_valid_config(config), "empty local_ip rejected");
                   }});

  tests.push_back({"build_arguments_minimal_config", [] {
                     tn::TunnelConfig config;
                     config.enable_tls = false;
                     config.use_compression = false;
                     config.use_encryption = false;
                     const auto args = tn::build_arguments(config);
                     const std::vector<std::string> expected = {
                         "http", "-s", "frp.beepphone.dev", "-P",       "7000",
                         "-i",   "127.0.0.1", "-l",        "5000",      "-n",
                         "beepphone-http", "--log-level", "info"};
                     require(args == expected, "minimal argument vector mismatch");
                   }});

  tests.push_back({"build_arguments_includes_optional_flags", [] {
                     tn::TunnelConfig config;
                     config.token = "s3cret";
                     config.user = "alice";
                     config.subdomain = "phone";
                     config.custom_domain = "tunnel.example.com";
                     config.protocol = "kcp";
                     const auto args = tn::build_arguments(config);
                     require(args.front() == "http", "http subcommand first");
                     require(contains_pair(args, "-t", "s3cret"), "token");
                     require(contains_pair(args, "-u", "alice"), "user");
                     require(contains_pair(args, "--sd", "phone"), "subdomain");
                     require(contains_pair(args, "-d", "tunnel.example.com"), "custom domain");
                     require(contains(args, "--tls-enable"), "tls");
                     require(contains(args, "--uc") && contains(args, "--ue"), "compression/encryption");
                     require(contains_pair(args, "-p", "kcp"), "non-tcp protocol");

                     config.protocol = "TCP";
                     require(!contains(tn::build_arguments(config), "-p"), "tcp is implicit");
                   }});

  tests.push_back({"escape_argument_quotes_only_when_needed", [] {
                     require(tn::escape_argument("plain") == "plain", "plain untouched");
                     require(tn::escape_argument("") == "\"\"", "empty quoted");
                     require(tn::escape_argument("has space") == "\"has space\"", "space quoted");
                     require(tn::escape_argument("say \"hi\"") == "\"say \\\"hi\\\"\"",
                             "embedded quotes escaped");
                     require(tn::escape_argument("dir\\ name\\") == "\"dir\\ name\\\\\"",
                             "trailing backslash doubled");
                     require(tn::join_command_line({"frpc", "-n", "my proxy"}) ==
                                 "frpc -n \"my proxy\"",
                             "joined command line");
                   }});

  tests.push_back({"create_default_generates_random_names", [] {
                     const auto first = tn::create_default();
                     const auto second = tn::create_default(8080, "relay.example");
                     require(first.ok() && second.ok(), "create_default should succeed");
                     const auto &a = first.value();
                     require(a.local_port == 5000 && a.server_addr == "frp.beepphone.dev",
                             "defaults");
                     require(a.proxy_name.rfind("beepphone-", 0) == 0 && a.proxy_name.size() == 18,
                             "beepphone-<8 hex>: " + a.proxy_name);
                     require(a.subdomain.size() == 12, "12-hex subdomain: " + a.subdomain);
                     require(second.value().local_port == 8080, "port argument");
                     require(second.value().server_addr == "relay.example", "server argument");
                     require(a.proxy_name != second.value().proxy_name, "names should differ");
                     require(tn::is_valid_config(a), "generated config is valid");
                   }});

  tests.push_back({"tunnel_config_from_relay_overlays_settings", [] {
                     beeptunnel::config::RelayConfig relay;
                     relay.server_addr = "relay.example";
                     relay.local_port = 9000;
                     relay.token = "tok";
                     relay.proxy_name = "fixed";
                     relay.enable_tls = false;
                     const auto config = tn::tunnel_config_from(relay);
                     require(config.ok(), config.error());
                     require(config.value().proxy_name == "fixed", "explicit proxy name kept");
                     require(config.value().subdomain.size() == 12, "subdomain generated");
                     require(config.value().local_port == 9000, "port");
                     require(config.value().token == "tok", "token");
                     require(!config.value().enable_tls, "tls flag");
                   }});

  tests.push_back({"render_config_file_matches_arguments", [] {
                     tn::TunnelConfig config;
                     config.token = "tok";
                     config.subdomain = "phone";
                     config.use_compression = false;
                     const std::string toml = tn::render_config_file(config);
                     require(toml.find("serverAddr = \"frp.beepphone.dev\"") != std::string::npos,
                             "server address");
                     require(toml.find("auth.token = \"tok\"") != std::string::npos, "token");
                     require(toml.find("[[proxies]]") != std::string::npos, "proxy table");
                     require(toml.find("localPort = 5000") != std::string::npos, "local port");
                     require(toml.find("subdomain = \"phone\"") != std::string::npos, "subdomain");
                     require(toml.find("transport.useCompression = false") != std::string::npos,
                             "compression flag");
                   }});

  tests.push_back({"frp_client_detects_urls_and_readiness", [] {
                     const tn::FrpClient client;
                     auto match = client.parse_output_line(
                         "2024/01/01 12:00:00 [I] [proxy.go:204] [beepphone-http] "
                         "start proxy success: http listen on phone.frp.beepphone.dev:8080");
                     require(match.url == "http://phone.frp.beepphone.dev:8080",
                             "structured line: " + match.url.value_or("<none>"));
                     require(match.ready, "proxy start means ready");

                     match = client.parse_output_line("visit https://abc.example.com/ now.");
                     require(match.url == "https://abc.example.com", "bare URL trimmed");

                     match = client.parse_output_line("[I] login to server success, get run id");
                     require(!match.url.has_value() && match.ready, "login means ready");

                     match = client.parse_output_line(
                         "[I] [beepphone-http] start proxy success: tcp listen on [::1]:8080");
                     require(match.url == "http://[::1]:8080",
                             "bracketed IPv6 host: " + match.url.value_or("<none>"));

                     match = client.parse_output_line("[W] connection reset by peer");
                     require(!match.matched(), "noise does not match");
                   }});

  tests.push_back({"output_buffer_caps_lines_and_bytes", [] {
                     tn::OutputBuffer lines(3, 1024);
                     for (int i = 0; i < 5; ++i) {
                       lines.push("line " + std::to_string(i));
                     }
                     require(lines.size() == 3, "line cap");
                     require(lines.lines().front() == "line 2", "oldest lines dropped");

                     tn::OutputBuffer bytes(100, 10);
                     bytes.push("12345");
                     bytes.push("67890");
                     bytes.push("abc");
                     require(bytes.bytes() <= 10, "byte cap");
                     require(bytes.lines().back() == "abc", "newest kept");

                     tn::OutputBuffer disabled(0, 10);
                     disabled.push("ignored");
                     require(disabled.size() == 0, "zero lines keeps nothing");
                   }});

  tests.push_back({"process_status_description_and_report", [] {
                     tn::ProcessStatus status;
                     status.is_running = true;
                     require(status.description() == "Starting...", "starting");
                     status.tunnel_url = "http://a.test:80";
                     require(status.description() == "Running - Tunnel active at http://a.test:80",
                             "running");
                     status.is_running = false;
                     require(status.description() == "Stopped", "stopped");
                     status.exit_code = 3;
                     require(status.description() == "Exited with code 3", "exited");

                     const auto empty = tn::make_report(std::nullopt, std::nullopt, "linux_amd64");
                     require(!empty.is_running, "no status means not running");
                     require(empty.binary_version == "Unknown", "unknown version");
                     require(empty.binary_path == "Not Available", "no path");

                     status.state = tn::SupervisorState::Crashed;
                     status.config = tn::TunnelConfig{};
                     status.config->token = "hidden";
                     const auto report = tn::make_report(status, std::nullopt, "linux_amd64");
                     require(report.state == "crashed", "state name");
                     require(report.status_message == "Exited with code 3", "message");
                     require(!report.process_id.has_value(), "pid only while running");
                     const std::string json = tn::report_to_json(report);
                     require(json.find("\"exit_code\":3") != std::string::npos, "exit code in json");
                     require(json.find("hidden") == std::string::npos, "token masked");
                   }});
}
