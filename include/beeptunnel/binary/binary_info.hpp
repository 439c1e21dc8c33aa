#pragma once

#include "beeptunnel/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace beeptunnel::binary {

struct BinaryInfo {
  std::string version;
  std::filesystem::path file_path;
  std::string file_name;
  std::string download_url;
  /// Lowercase hex SHA-256; empty when unknown.
  std::string checksum;
  std::uint64_t size = 0;
  std::string platform;
  std::chrono::system_clock::time_point last_updated{};
  bool is_validated = false;
  bool is_executable = false;
};

[[nodiscard]] std::string binary_info_to_json(const BinaryInfo &info);
[[nodiscard]] common::Result<BinaryInfo> parse_binary_info(const std::string &json);

[[nodiscard]] common::Result<BinaryInfo> load_binary_info(const std::filesystem::path &path);
[[nodiscard]] common::Status save_binary_info(const std::filesystem::path &path,
                                              const BinaryInfo &info);

} // namespace beeptunnel::binary
