#pragma once

#include "beeptunnel/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace beeptunnel::binary {

inline constexpr std::uintmax_t MIN_BINARY_SIZE = 1024 * 1024;

class BinaryValidator {
public:
  explicit BinaryValidator(std::uintmax_t min_size = MIN_BINARY_SIZE) : min_size_(min_size) {}

  /// False when the file is missing, undersized, mismatches a non-empty
  /// expected checksum (case-insensitive) or lacks execute permission.
  [[nodiscard]] bool validate(const std::filesystem::path &path,
                              const std::string &expected_checksum = "") const;

  /// Lowercase hex SHA-256 of the file contents.
  [[nodiscard]] common::Result<std::string> checksum(const std::filesystem::path &path) const;

  [[nodiscard]] bool is_executable(const std::filesystem::path &path) const;
  [[nodiscard]] common::Status make_executable(const std::filesystem::path &path) const;

  [[nodiscard]] std::uintmax_t min_size() const { return min_size_; }

private:
  std::uintmax_t min_size_;
};

} // namespace beeptunnel::binary
