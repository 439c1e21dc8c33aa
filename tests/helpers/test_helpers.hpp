#pragma once

#include "beeptunnel/binary/acquirer.hpp"
#include "beeptunnel/binary/http_client.hpp"
#include "beeptunnel/observability/observer.hpp"
#include "beeptunnel/tunnel/client.hpp"
#include "beeptunnel/tunnel/frp_client.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace beeptunnel::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

  /// Writes `content` and, unless told otherwise, marks the file executable.
  std::filesystem::path create_binary(const std::string &name, const std::string &content,
                                      bool executable = true) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();
};

/// Filler content larger than the validator's minimum binary size.
std::string binary_payload(char fill = 'x', std::size_t size = 1024 * 1024 + 512);
std::string sha256_hex(const std::string &data);

bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

/// Serves canned responses by URL. Queued responses are consumed in order and
/// the last one keeps being served; unknown URLs get a 404.
class FakeHttpClient final : public binary::IHttpClient {
public:
  void add_response(const std::string &url, std::uint16_t status, std::string body);
  void add_network_error(const std::string &url, std::string message);

  [[nodiscard]] binary::HttpResponse get(const std::string &url, const binary::HttpHeaders &headers,
                                         std::uint64_t timeout_ms,
                                         const common::CancellationToken *cancel) override;
  [[nodiscard]] binary::HttpResponse download(const std::string &url,
                                              const std::filesystem::path &destination,
                                              const binary::HttpHeaders &headers,
                                              std::uint64_t timeout_ms,
                                              const common::CancellationToken *cancel) override;

  [[nodiscard]] std::size_t request_count(const std::string &url) const;
  [[nodiscard]] std::size_t total_requests() const;
  [[nodiscard]] binary::HttpHeaders last_headers() const;

private:
  binary::HttpResponse next_response(const std::string &url, const binary::HttpHeaders &headers,
                                     const common::CancellationToken *cancel);

  mutable std::mutex mutex_;
  std::map<std::string, std::deque<binary::HttpResponse>> responses_;
  std::map<std::string, std::size_t> requests_;
  binary::HttpHeaders last_headers_;
};

/// Resolves every platform to one fixed executable, `/bin/sh` by default.
class FakeAcquirer final : public binary::IBinaryAcquirer {
public:
  explicit FakeAcquirer(std::filesystem::path program = "/bin/sh");

  void fail_with(std::string message, common::ErrorCode code);

  [[nodiscard]] common::Result<binary::BinaryInfo>
  ensure_binary(const std::string &platform,
                const common::CancellationToken *cancel = nullptr) override;
  [[nodiscard]] std::optional<binary::BinaryInfo>
  cached_info(const std::string &platform) const override;
  [[nodiscard]] common::Status clear_cache() override { return common::Status::success(); }
  [[nodiscard]] std::string_view mode() const override { return "fake"; }

  [[nodiscard]] int ensure_calls() const { return ensure_calls_; }

private:
  [[nodiscard]] binary::BinaryInfo describe(const std::string &platform) const;

  std::filesystem::path program_;
  std::optional<std::pair<std::string, common::ErrorCode>> failure_;
  int ensure_calls_ = 0;
};

/// Runs `/bin/sh -c <script>` and parses its output the way frpc output is parsed.
class ScriptClient final : public tunnel::ITunnelClient {
public:
  explicit ScriptClient(std::string script) : script_(std::move(script)) {}

  [[nodiscard]] std::string_view name() const override { return "script"; }
  [[nodiscard]] std::vector<std::string>
  build_arguments(const tunnel::TunnelConfig &) const override {
    return {"-c", script_};
  }
  [[nodiscard]] tunnel::OutputMatch parse_output_line(const std::string &line) const override {
    return frp_.parse_output_line(line);
  }

private:
  std::string script_;
  tunnel::FrpClient frp_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::vector<T> out;
    for (const auto &event : events()) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  template <typename T> [[nodiscard]] std::vector<T> metrics_of() const {
    std::vector<T> out;
    for (const auto &metric : metrics()) {
      if (const auto *typed = std::get_if<T>(&metric); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for the scope's lifetime.
class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_ = nullptr;
};

} // namespace beeptunnel::testing
