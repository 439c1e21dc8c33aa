#include "beeptunnel/cli/commands.hpp"

#include "beeptunnel/binary/acquirer.hpp"
#include "beeptunnel/binary/platform.hpp"
#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/config/config.hpp"
#include "beeptunnel/observability/factory.hpp"
#include "beeptunnel/observability/global.hpp"
#include "beeptunnel/tunnel/config_builder.hpp"
#include "beeptunnel/tunnel/frp_client.hpp"
#include "beeptunnel/tunnel/status_report.hpp"
#include "beeptunnel/tunnel/supervisor.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace beeptunnel::cli {

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void handle_stop_signal(int signal) { g_stop_signal = signal; }

std::string version_string() {
#ifdef BEEPTUNNEL_VERSION
  std::string version = BEEPTUNNEL_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef BEEPTUNNEL_GIT_COMMIT
  const std::string commit = BEEPTUNNEL_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "beeptunnel " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_port(const std::string &raw, int &out) {
  try {
    std::size_t used = 0;
    const int value = std::stoi(raw, &used);
    if (used != raw.size()) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

/// Loads the config file (defaults when absent), validates it and installs the observer.
common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure_from(warnings);
  }
  observability::set_global_observer(observability::create_observer(cfg.value().observability));
  for (const auto &warning : warnings.value()) {
    observability::record_warning("config", warning);
  }
  return cfg;
}

/// Relay settings from the config file, overridden by `run`-style flags.
common::Result<tunnel::TunnelConfig> tunnel_config_from_args(const config::Config &cfg,
                                                             std::vector<std::string> &args) {
  auto built = tunnel::tunnel_config_from(cfg.relay);
  if (!built.ok()) {
    return built;
  }
  tunnel::TunnelConfig tunnel_config = built.value();

  std::string value;
  if (take_option(args, "--port", "-p", value) && !parse_port(value, tunnel_config.local_port)) {
    return common::Result<tunnel::TunnelConfig>::failure("invalid port: " + value,
                                                         common::ErrorCode::ConfigValidation);
  }
  if (take_option(args, "--server-port", "", value) &&
      !parse_port(value, tunnel_config.server_port)) {
    return common::Result<tunnel::TunnelConfig>::failure("invalid server port: " + value,
                                                         common::ErrorCode::ConfigValidation);
  }
  if (take_option(args, "--server", "-s", value)) {
    tunnel_config.server_addr = value;
  }
  if (take_option(args, "--name", "-n", value)) {
    tunnel_config.proxy_name = value;
  }
  if (take_option(args, "--token", "", value)) {
    tunnel_config.token = value;
  }
  if (take_option(args, "--subdomain", "", value)) {
    tunnel_config.subdomain = value;
  }
  if (!args.empty()) {
    return common::Result<tunnel::TunnelConfig>::failure("unexpected argument: " + args.front(),
                                                         common::ErrorCode::ConfigValidation);
  }

  auto valid = tunnel::validate_config(tunnel_config);
  if (!valid.ok()) {
    return common::Result<tunnel::TunnelConfig>::failure_from(valid);
  }
  return common::Result<tunnel::TunnelConfig>::success(std::move(tunnel_config));
}

int fail(const std::string &message) {
  std::cerr << message << "\n";
  return 1;
}

int run_tunnel(std::vector<std::string> args) {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto tunnel_config = tunnel_config_from_args(cfg.value(), args);
  if (!tunnel_config.ok()) {
    return fail(tunnel_config.error());
  }
  auto acquirer = binary::create_acquirer(cfg.value().binaries);
  if (!acquirer.ok()) {
    return fail(acquirer.error());
  }

  tunnel::ProcessSupervisor supervisor(
      std::shared_ptr<binary::IBinaryAcquirer>(std::move(acquirer.value())),
      std::make_shared<tunnel::FrpClient>(),
      tunnel::SupervisorOptions::from_config(cfg.value().supervisor));
  supervisor.on_tunnel_url_changed(
      [](const std::string &url) { std::cout << "Tunnel active at " << url << std::endl; });

  g_stop_signal = 0;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  common::CancellationToken cancel;
  auto started = supervisor.start(tunnel_config.value(), &cancel);
  if (!started.ok()) {
    return fail(started.error());
  }
  std::cout << "Started " << tunnel::join_command_line(
                                 tunnel::build_arguments(tunnel_config.value()))
            << " (pid " << started.value().process_id << ")\n";
  std::cout << "Press Ctrl+C to stop the tunnel...\n";

  while (g_stop_signal == 0) {
    if (supervisor.wait_for_exit(std::chrono::milliseconds(200))) {
      const auto report = tunnel::make_report(supervisor.status(), supervisor.binary_info(),
                                              binary::current_platform());
      std::cerr << report.status_message.value_or("Stopped") << "\n";
      std::cout << tunnel::report_to_json(report) << "\n";
      return 1;
    }
  }

  std::cout << "Stopping tunnel...\n";
  auto stopped = supervisor.stop();
  if (!stopped.ok()) {
    return fail(stopped.error());
  }
  return 0;
}

int run_args(std::vector<std::string> args) {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto tunnel_config = tunnel_config_from_args(cfg.value(), args);
  if (!tunnel_config.ok()) {
    return fail(tunnel_config.error());
  }

  std::string program = binary::binary_file_name(binary::current_platform());
  auto acquirer = binary::create_acquirer(cfg.value().binaries);
  if (acquirer.ok()) {
    const auto info = acquirer.value()->cached_info(binary::current_platform());
    if (info.has_value()) {
      program = info->file_path.string();
    }
  }

  std::vector<std::string> command_line{program};
  const auto arguments = tunnel::build_arguments(tunnel_config.value());
  command_line.insert(command_line.end(), arguments.begin(), arguments.end());
  std::cout << tunnel::join_command_line(command_line) << "\n";
  return 0;
}

int run_render_config(std::vector<std::string> args) {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto tunnel_config = tunnel_config_from_args(cfg.value(), args);
  if (!tunnel_config.ok()) {
    return fail(tunnel_config.error());
  }
  std::cout << tunnel::render_config_file(tunnel_config.value());
  return 0;
}

int run_binary(std::vector<std::string> args) {
  const bool fetch = take_flag(args, "--fetch");
  if (args.empty()) {
    return fail("usage: beeptunnel binary ensure|info|clear-cache [--fetch]");
  }
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  if (fetch) {
    cfg.value().binaries.mode = "fetch";
  }
  auto acquirer = binary::create_acquirer(cfg.value().binaries);
  if (!acquirer.ok()) {
    return fail(acquirer.error());
  }
  const std::string platform = binary::current_platform();

  if (args[0] == "ensure") {
    auto info = acquirer.value()->ensure_binary(platform);
    if (!info.ok()) {
      return fail(std::string(common::error_code_name(info.code())) + ": " + info.error());
    }
    std::cout << info.value().file_path.string() << " (" << info.value().version << ", "
              << acquirer.value()->mode() << ")\n";
    return 0;
  }
  if (args[0] == "info") {
    const auto info = acquirer.value()->cached_info(platform);
    if (!info.has_value()) {
      return fail("no " + std::string(acquirer.value()->mode()) + " binary for " + platform);
    }
    std::cout << binary::binary_info_to_json(*info) << "\n";
    return 0;
  }
  if (args[0] == "clear-cache") {
    auto cleared = acquirer.value()->clear_cache();
    if (!cleared.ok()) {
      return fail(cleared.error());
    }
    return 0;
  }
  return fail("unknown binary command: " + args[0]);
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return fail(path_result.error());
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (!args.empty() && args[0] != "show") {
    return fail("unknown config command");
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return fail(warnings.error());
  }
  std::cout << config::render_config(cfg.value());
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: beeptunnel [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run             Start a tunnel in the foreground\n";
  std::cout << "  args            Print the client command line\n";
  std::cout << "  render-config   Print the client TOML configuration\n";
  std::cout << "  platform        Print the platform identifier\n";
  std::cout << "  binary          ensure | info | clear-cache [--fetch]\n";
  std::cout << "  config          show | path\n";
  std::cout << "  version         Print the version\n";
  std::cout << "  help            Show this message\n\n";
  std::cout << "Tunnel options (run, args, render-config):\n";
  std::cout << "  --port, -p N        Local port to expose\n";
  std::cout << "  --server, -s HOST   Relay server address\n";
  std::cout << "  --server-port N     Relay server port\n";
  std::cout << "  --name, -n NAME     Proxy name\n";
  std::cout << "  --token T           Relay auth token\n";
  std::cout << "  --subdomain S       Requested subdomain\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return fail(global_error);
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "platform") {
    std::cout << binary::current_platform() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_tunnel(std::move(args));
  }
  if (subcommand == "args") {
    return run_args(std::move(args));
  }
  if (subcommand == "render-config") {
    return run_render_config(std::move(args));
  }
  if (subcommand == "binary") {
    return run_binary(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace beeptunnel::cli
