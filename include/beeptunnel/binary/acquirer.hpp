#pragma once

#include "beeptunnel/binary/binary_info.hpp"
#include "beeptunnel/binary/http_client.hpp"
#include "beeptunnel/binary/validator.hpp"
#include "beeptunnel/common/cancellation.hpp"
#include "beeptunnel/common/result.hpp"
#include "beeptunnel/config/schema.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beeptunnel::binary {

inline constexpr const char *CHECKSUM_MANIFEST_NAME = "sha256_checksums.txt";

class IBinaryAcquirer {
public:
  virtual ~IBinaryAcquirer() = default;

  /// Guarantees an executable binary for `platform`.
  [[nodiscard]] virtual common::Result<BinaryInfo>
  ensure_binary(const std::string &platform, const common::CancellationToken *cancel = nullptr) = 0;

  [[nodiscard]] virtual std::optional<BinaryInfo>
  cached_info(const std::string &platform) const = 0;

  [[nodiscard]] virtual common::Status clear_cache() = 0;

  [[nodiscard]] virtual std::string_view mode() const = 0;
};

/// Uses binaries shipped next to the application; never touches the network.
class BundledBinaryAcquirer final : public IBinaryAcquirer {
public:
  BundledBinaryAcquirer(std::filesystem::path directory, std::string version,
                        BinaryValidator validator = BinaryValidator());

  [[nodiscard]] common::Result<BinaryInfo>
  ensure_binary(const std::string &platform,
                const common::CancellationToken *cancel = nullptr) override;
  [[nodiscard]] std::optional<BinaryInfo> cached_info(const std::string &platform) const override;
  [[nodiscard]] common::Status clear_cache() override { return common::Status::success(); }
  [[nodiscard]] std::string_view mode() const override { return "bundled"; }

  [[nodiscard]] const std::filesystem::path &directory() const { return directory_; }

private:
  [[nodiscard]] BinaryInfo describe(const std::string &platform) const;

  std::filesystem::path directory_;
  std::string version_;
  BinaryValidator validator_;
};

struct FetchOptions {
  std::filesystem::path cache_dir;
  std::string registry_url = config::DEFAULT_REGISTRY_URL;
  std::string checksum_url_template = config::DEFAULT_CHECKSUM_URL_TEMPLATE;
  std::chrono::hours metadata_ttl{24};
  bool require_checksum = false;
  std::uint64_t http_timeout_ms = 300'000;
  std::string user_agent = DEFAULT_USER_AGENT;
};

struct ReleaseAsset {
  std::string name;
  std::string download_url;
  std::uint64_t size = 0;
};

struct ReleaseInfo {
  std::string tag;
  std::vector<ReleaseAsset> assets;
};

[[nodiscard]] common::Result<ReleaseInfo> parse_release(const std::string &json);

/// First asset whose name starts with `frpc_<platform>`, ignoring case.
[[nodiscard]] std::optional<ReleaseAsset> find_platform_asset(const ReleaseInfo &release,
                                                              const std::string &platform);

/// Looks up `file_name` in a `<hex>  <file name>` manifest.
[[nodiscard]] std::optional<std::string> find_checksum(const std::string &manifest,
                                                       const std::string &file_name);

/// Downloads release assets from a GitHub-style registry into a local cache.
class FetchBinaryAcquirer final : public IBinaryAcquirer {
public:
  FetchBinaryAcquirer(FetchOptions options, std::shared_ptr<IHttpClient> http,
                      BinaryValidator validator = BinaryValidator());

  [[nodiscard]] common::Result<BinaryInfo>
  ensure_binary(const std::string &platform,
                const common::CancellationToken *cancel = nullptr) override;
  [[nodiscard]] std::optional<BinaryInfo> cached_info(const std::string &platform) const override;
  [[nodiscard]] common::Status clear_cache() override;
  [[nodiscard]] std::string_view mode() const override { return "fetch"; }

  [[nodiscard]] const FetchOptions &options() const { return options_; }

private:
  [[nodiscard]] HttpHeaders request_headers() const;
  [[nodiscard]] common::Result<std::string>
  fetch_checksum(const ReleaseInfo &release, const std::string &asset_name,
                 const common::CancellationToken *cancel);
  [[nodiscard]] common::Status download_validated(const ReleaseAsset &asset,
                                                  const std::filesystem::path &target,
                                                  const std::string &checksum,
                                                  const common::CancellationToken *cancel);

  FetchOptions options_;
  std::shared_ptr<IHttpClient> http_;
  BinaryValidator validator_;
};

/// Builds the acquirer selected by `binaries.mode`. A null `http` uses libcurl.
[[nodiscard]] common::Result<std::unique_ptr<IBinaryAcquirer>>
create_acquirer(const config::BinariesConfig &config, std::shared_ptr<IHttpClient> http = nullptr);

} // namespace beeptunnel::binary
