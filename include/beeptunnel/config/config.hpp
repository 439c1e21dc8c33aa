#pragma once

#include "beeptunnel/common/result.hpp"
#include "beeptunnel/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace beeptunnel::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Resolved `[binaries]` directories, with the empty-string defaults filled in.
[[nodiscard]] std::filesystem::path bundled_dir(const BinariesConfig &binaries);
[[nodiscard]] common::Result<std::filesystem::path> cache_dir(const BinariesConfig &binaries);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

/// Fails on the first invalid setting; otherwise returns non-fatal warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace beeptunnel::config
