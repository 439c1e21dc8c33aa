#include "beeptunnel/config/config.hpp"

#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/common/toml.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>
#include <utility>

namespace beeptunnel::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".beeptunnel";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("BEEPTUNNEL_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

void load_relay_config(RelayConfig &relay, const common::TomlDocument &doc) {
  relay.server_addr = doc.get_string("relay.server_addr", relay.server_addr);
  relay.server_port = doc.get_int("relay.server_port", relay.server_port);
  relay.local_ip = doc.get_string("relay.local_ip", relay.local_ip);
  relay.local_port = doc.get_int("relay.local_port", relay.local_port);
  relay.token = expand_config_value(doc.get_string("relay.token", relay.token));
  relay.user = doc.get_string("relay.user", relay.user);
  relay.proxy_name = doc.get_string("relay.proxy_name", relay.proxy_name);
  relay.subdomain = doc.get_string("relay.subdomain", relay.subdomain);
  relay.custom_domain = doc.get_string("relay.custom_domain", relay.custom_domain);
  relay.enable_tls = doc.get_bool("relay.enable_tls", relay.enable_tls);
  relay.use_compression = doc.get_bool("relay.use_compression", relay.use_compression);
  relay.use_encryption = doc.get_bool("relay.use_encryption", relay.use_encryption);
  relay.log_level = doc.get_string("relay.log_level", relay.log_level);
  relay.protocol = doc.get_string("relay.protocol", relay.protocol);
}

common::Status load_u32(const common::TomlDocument &doc, const std::string &key,
                        std::uint32_t &target) {
  const std::uint64_t value = doc.get_u64(key, target);
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return common::Status::error(key + " is out of range: " + std::to_string(value),
                                 common::ErrorCode::ConfigValidation);
  }
  target = static_cast<std::uint32_t>(value);
  return common::Status::success();
}

common::Status load_binaries_config(BinariesConfig &binaries, const common::TomlDocument &doc) {
  binaries.mode = common::to_lower(doc.get_string("binaries.mode", binaries.mode));
  binaries.bundled_dir = expand_config_value(doc.get_string("binaries.bundled_dir", binaries.bundled_dir));
  binaries.bundled_version = doc.get_string("binaries.bundled_version", binaries.bundled_version);
  binaries.cache_dir = expand_config_value(doc.get_string("binaries.cache_dir", binaries.cache_dir));
  binaries.registry_url = doc.get_string("binaries.registry_url", binaries.registry_url);
  binaries.checksum_url_template =
      doc.get_string("binaries.checksum_url_template", binaries.checksum_url_template);
  binaries.require_checksum = doc.get_bool("binaries.require_checksum", binaries.require_checksum);
  if (auto status = load_u32(doc, "binaries.metadata_ttl_hours", binaries.metadata_ttl_hours);
      !status.ok()) {
    return status;
  }
  return load_u32(doc, "binaries.http_timeout_secs", binaries.http_timeout_secs);
}

common::Status load_supervisor_config(SupervisorConfig &supervisor, const common::TomlDocument &doc) {
  const std::pair<const char *, std::uint32_t *> fields[] = {
      {"supervisor.graceful_timeout_ms", &supervisor.graceful_timeout_ms},
      {"supervisor.kill_timeout_ms", &supervisor.kill_timeout_ms},
      {"supervisor.restart_delay_ms", &supervisor.restart_delay_ms},
      {"supervisor.max_output_lines", &supervisor.max_output_lines},
      {"supervisor.max_output_bytes", &supervisor.max_output_bytes},
  };
  for (const auto &[key, target] : fields) {
    if (auto status = load_u32(doc, key, *target); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

bool valid_port(const int port) { return port >= 1 && port <= 65535; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory",
                                                              common::ErrorCode::Io);
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure_from(home);
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::filesystem::path bundled_dir(const BinariesConfig &binaries) {
  if (!common::trim(binaries.bundled_dir).empty()) {
    return std::filesystem::path(common::expand_path(binaries.bundled_dir));
  }
  return common::executable_dir() / "binaries";
}

common::Result<std::filesystem::path> cache_dir(const BinariesConfig &binaries) {
  if (!common::trim(binaries.cache_dir).empty()) {
    return common::ensure_dir(common::expand_path(binaries.cache_dir));
  }
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::ensure_dir(cfg_dir.value() / "binaries");
}

void apply_env_overrides(Config &config) {
  if (const char *server = std::getenv("BEEPTUNNEL_SERVER_ADDR"); server != nullptr && *server) {
    config.relay.server_addr = server;
  }
  if (const char *token = std::getenv("BEEPTUNNEL_TOKEN"); token != nullptr && *token) {
    config.relay.token = token;
  }
  if (const char *mode = std::getenv("BEEPTUNNEL_BINARY_MODE"); mode != nullptr && *mode) {
    config.binaries.mode = common::to_lower(mode);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure_from(parsed);
  }

  const auto &doc = parsed.value();
  Config config;
  load_relay_config(config.relay, doc);
  if (const auto status = load_binaries_config(config.binaries, doc); !status.ok()) {
    return common::Result<Config>::failure_from(status);
  }
  if (const auto status = load_supervisor_config(config.supervisor, doc); !status.ok()) {
    return common::Result<Config>::failure_from(status);
  }
  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.verbose = doc.get_bool("observability.verbose", config.observability.verbose);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure_from(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorCode::Io);
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error(), config.code());
  }
  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  const auto &relay = config.relay;
  file << "[relay]\n";
  file << "server_addr = " << common::quote_toml_string(relay.server_addr) << "\n";
  file << "server_port = " << relay.server_port << "\n";
  file << "local_ip = " << common::quote_toml_string(relay.local_ip) << "\n";
  file << "local_port = " << relay.local_port << "\n";
  if (!relay.token.empty()) {
    file << "token = " << common::quote_toml_string(relay.token) << "\n";
  }
  if (!relay.user.empty()) {
    file << "user = " << common::quote_toml_string(relay.user) << "\n";
  }
  if (!relay.proxy_name.empty()) {
    file << "proxy_name = " << common::quote_toml_string(relay.proxy_name) << "\n";
  }
  if (!relay.subdomain.empty()) {
    file << "subdomain = " << common::quote_toml_string(relay.subdomain) << "\n";
  }
  if (!relay.custom_domain.empty()) {
    file << "custom_domain = " << common::quote_toml_string(relay.custom_domain) << "\n";
  }
  file << "enable_tls = " << bool_to_toml(relay.enable_tls) << "\n";
  file << "use_compression = " << bool_to_toml(relay.use_compression) << "\n";
  file << "use_encryption = " << bool_to_toml(relay.use_encryption) << "\n";
  file << "log_level = " << common::quote_toml_string(relay.log_level) << "\n";
  file << "protocol = " << common::quote_toml_string(relay.protocol) << "\n";

  const auto &binaries = config.binaries;
  file << "\n[binaries]\n";
  file << "mode = " << common::quote_toml_string(binaries.mode) << "\n";
  if (!binaries.bundled_dir.empty()) {
    file << "bundled_dir = " << common::quote_toml_string(binaries.bundled_dir) << "\n";
  }
  file << "bundled_version = " << common::quote_toml_string(binaries.bundled_version) << "\n";
  if (!binaries.cache_dir.empty()) {
    file << "cache_dir = " << common::quote_toml_string(binaries.cache_dir) << "\n";
  }
  file << "registry_url = " << common::quote_toml_string(binaries.registry_url) << "\n";
  file << "checksum_url_template = " << common::quote_toml_string(binaries.checksum_url_template)
       << "\n";
  file << "metadata_ttl_hours = " << binaries.metadata_ttl_hours << "\n";
  file << "require_checksum = " << bool_to_toml(binaries.require_checksum) << "\n";
  file << "http_timeout_secs = " << binaries.http_timeout_secs << "\n";

  const auto &supervisor = config.supervisor;
  file << "\n[supervisor]\n";
  file << "graceful_timeout_ms = " << supervisor.graceful_timeout_ms << "\n";
  file << "kill_timeout_ms = " << supervisor.kill_timeout_ms << "\n";
  file << "restart_delay_ms = " << supervisor.restart_delay_ms << "\n";
  file << "max_output_lines = " << supervisor.max_output_lines << "\n";
  file << "max_output_bytes = " << supervisor.max_output_bytes << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "verbose = " << bool_to_toml(config.observability.verbose) << "\n";
  return file.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error(), cfg_path_result.code());
  }
  return common::write_file_atomic(cfg_path_result.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.relay.server_addr).empty()) {
    return ValidationResult::failure("relay.server_addr is required",
                                     common::ErrorCode::ConfigValidation);
  }
  if (!valid_port(config.relay.server_port)) {
    return ValidationResult::failure("relay.server_port must be 1-65535",
                                     common::ErrorCode::ConfigValidation);
  }
  if (!valid_port(config.relay.local_port)) {
    return ValidationResult::failure("relay.local_port must be 1-65535",
                                     common::ErrorCode::ConfigValidation);
  }
  if (common::trim(config.relay.local_ip).empty()) {
    return ValidationResult::failure("relay.local_ip is required",
                                     common::ErrorCode::ConfigValidation);
  }

  const std::string mode = common::to_lower(config.binaries.mode);
  if (mode != "bundled" && mode != "fetch") {
    return ValidationResult::failure("Invalid binaries.mode: " + config.binaries.mode,
                                     common::ErrorCode::ConfigValidation);
  }
  if (mode == "fetch" && common::trim(config.binaries.registry_url).empty()) {
    return ValidationResult::failure("binaries.registry_url is required in fetch mode",
                                     common::ErrorCode::ConfigValidation);
  }
  if (mode == "fetch" && !config.binaries.require_checksum) {
    warnings.push_back("binaries.require_checksum is off; downloads without a published "
                       "checksum are accepted");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop") {
    return ValidationResult::failure("Invalid observability.backend: " +
                                         config.observability.backend,
                                     common::ErrorCode::ConfigValidation);
  }

  if (config.supervisor.max_output_bytes == 0) {
    return ValidationResult::failure("supervisor.max_output_bytes must be greater than 0",
                                     common::ErrorCode::ConfigValidation);
  }
  if (config.supervisor.max_output_lines == 0) {
    warnings.push_back("supervisor.max_output_lines is 0; process output will not be retained");
  }
  if (config.relay.token.empty()) {
    warnings.push_back("relay.token is empty; the relay must allow anonymous clients");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace beeptunnel::config
