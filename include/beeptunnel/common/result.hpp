#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace beeptunnel::common {

enum class ErrorCode {
  None,
  Unknown,
  ConfigValidation,
  BinaryNotFound,
  AssetNotFound,
  ChecksumMismatch,
  ProcessStart,
  TerminationTimeout,
  Network,
  InvalidOperation,
  Canceled,
  Io,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Unknown:
    return "unknown";
  case ErrorCode::ConfigValidation:
    return "config_validation";
  case ErrorCode::BinaryNotFound:
    return "binary_not_found";
  case ErrorCode::AssetNotFound:
    return "asset_not_found";
  case ErrorCode::ChecksumMismatch:
    return "checksum_mismatch";
  case ErrorCode::ProcessStart:
    return "process_start";
  case ErrorCode::TerminationTimeout:
    return "termination_timeout";
  case ErrorCode::Network:
    return "network";
  case ErrorCode::InvalidOperation:
    return "invalid_operation";
  case ErrorCode::Canceled:
    return "canceled";
  case ErrorCode::Io:
    return "io";
  }
  return "unknown";
}

/// Failures the API layer reports as caller errors (4xx) rather than server faults.
[[nodiscard]] constexpr bool is_client_error(const ErrorCode code) {
  return code == ErrorCode::ConfigValidation || code == ErrorCode::BinaryNotFound ||
         code == ErrorCode::AssetNotFound || code == ErrorCode::ChecksumMismatch ||
         code == ErrorCode::InvalidOperation;
}

class Status {
public:
  static Status success() { return Status(true, "", ErrorCode::None); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Unknown) {
    return Status(false, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, std::string error, ErrorCode code)
      : ok_(ok), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::string error_;
  ErrorCode code_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), "", ErrorCode::None); }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Unknown) {
    return Result(false, std::nullopt, std::move(message), code);
  }
  /// Carries the message and code of a failed Status or Result of another type.
  template <typename Other> static Result failure_from(const Other &other) {
    return Result(false, std::nullopt, other.error(), other.code());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorCode code)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorCode code_;
};

} // namespace beeptunnel::common
