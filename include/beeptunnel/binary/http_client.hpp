#pragma once

#include "beeptunnel/common/cancellation.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace beeptunnel::binary {

inline constexpr const char *DEFAULT_USER_AGENT = "BeepMyPhone-Tunneling/1.0";

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::uint64_t bytes = 0;
  bool timeout = false;
  bool network_error = false;
  bool canceled = false;
  std::string network_error_message;

  [[nodiscard]] bool ok() const {
    return !network_error && !canceled && status >= 200 && status < 300;
  }
  [[nodiscard]] std::string describe() const;
};

class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms,
                                         const common::CancellationToken *cancel) = 0;

  /// Streams the body into `destination`; the file is removed unless the
  /// response is a 2xx.
  [[nodiscard]] virtual HttpResponse download(const std::string &url,
                                              const std::filesystem::path &destination,
                                              const HttpHeaders &headers,
                                              std::uint64_t timeout_ms,
                                              const common::CancellationToken *cancel) = 0;
};

class CurlHttpClient final : public IHttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms,
                                 const common::CancellationToken *cancel) override;
  [[nodiscard]] HttpResponse download(const std::string &url,
                                      const std::filesystem::path &destination,
                                      const HttpHeaders &headers, std::uint64_t timeout_ms,
                                      const common::CancellationToken *cancel) override;
};

} // namespace beeptunnel::binary
