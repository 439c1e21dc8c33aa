#pragma once

#include "beeptunnel/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace beeptunnel::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool iequals(const std::string &a, const std::string &b);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] std::filesystem::path executable_dir();

/// Writes through a sibling temp file and renames it over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &content);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point time);
[[nodiscard]] std::string now_rfc3339();
/// Parses the UTC form produced by format_rfc3339.
[[nodiscard]] Result<std::chrono::system_clock::time_point> parse_rfc3339(const std::string &text);

} // namespace beeptunnel::common
