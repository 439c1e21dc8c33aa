#include "beeptunnel/binary/acquirer.hpp"

#include "beeptunnel/binary/platform.hpp"
#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/common/json_util.hpp"
#include "beeptunnel/config/config.hpp"
#include "beeptunnel/observability/global.hpp"

#include <charconv>
#include <sstream>

namespace beeptunnel::binary {

namespace {

constexpr const char *COMPONENT = "binary";

std::uint64_t parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return 0;
  }
  return value;
}

std::string replace_all(std::string text, const std::string &needle,
                        const std::string &replacement) {
  std::size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), replacement);
    pos += replacement.size();
  }
  return text;
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

common::Result<ReleaseInfo> parse_release(const std::string &json) {
  const std::string body = common::trim(json);
  if (body.empty() || body.front() != '{') {
    return common::Result<ReleaseInfo>::failure("release metadata is not a JSON object",
                                                common::ErrorCode::Network);
  }

  ReleaseInfo release;
  release.tag = common::json_get_string(body, "tag_name");
  if (release.tag.empty()) {
    return common::Result<ReleaseInfo>::failure("release metadata has no tag_name",
                                                common::ErrorCode::Network);
  }

  for (const auto &object : common::json_split_top_level_objects(common::json_get_array(body, "assets"))) {
    ReleaseAsset asset;
    asset.name = common::json_get_string(object, "name");
    asset.download_url = common::json_get_string(object, "browser_download_url");
    asset.size = parse_u64(common::json_get_number(object, "size"));
    if (!asset.name.empty() && !asset.download_url.empty()) {
      release.assets.push_back(std::move(asset));
    }
  }
  return common::Result<ReleaseInfo>::success(std::move(release));
}

std::optional<ReleaseAsset> find_platform_asset(const ReleaseInfo &release,
                                                const std::string &platform) {
  const std::string prefix = common::to_lower(std::string(BINARY_BASE_NAME) + "_" + platform);
  for (const auto &asset : release.assets) {
    if (common::starts_with(common::to_lower(asset.name), prefix)) {
      return asset;
    }
  }
  return std::nullopt;
}

std::optional<std::string> find_checksum(const std::string &manifest, const std::string &file_name) {
  std::istringstream stream(manifest);
  std::string line;
  while (std::getline(stream, line)) {
    std::istringstream fields(line);
    std::string hash;
    std::string name;
    if (!(fields >> hash >> name)) {
      continue;
    }
    if (!name.empty() && name.front() == '*') {
      name.erase(0, 1);
    }
    if (common::iequals(name, file_name)) {
      return common::to_lower(hash);
    }
  }
  return std::nullopt;
}

// Bundled

BundledBinaryAcquirer::BundledBinaryAcquirer(std::filesystem::path directory, std::string version,
                                             BinaryValidator validator)
    : directory_(std::move(directory)), version_(std::move(version)), validator_(validator) {}

BinaryInfo BundledBinaryAcquirer::describe(const std::string &platform) const {
  BinaryInfo info;
  info.version = version_;
  info.file_name = binary_file_name(platform);
  info.file_path = directory_ / info.file_name;
  info.platform = platform;
  info.last_updated = std::chrono::system_clock::now();
  std::error_code ec;
  if (const auto size = std::filesystem::file_size(info.file_path, ec); !ec) {
    info.size = size;
  }
  info.is_executable = validator_.is_executable(info.file_path);
  return info;
}

common::Result<BinaryInfo> BundledBinaryAcquirer::ensure_binary(
    const std::string &platform, const common::CancellationToken *cancel) {
  if (common::canceled(cancel)) {
    return common::Result<BinaryInfo>::failure("binary resolution canceled",
                                               common::ErrorCode::Canceled);
  }

  const auto path = directory_ / binary_file_name(platform);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<BinaryInfo>::failure(
        "bundled " + std::string(BINARY_BASE_NAME) + " binary not found for platform " + platform +
            ": " + path.string(),
        common::ErrorCode::BinaryNotFound);
  }

  if (const auto chmod = validator_.make_executable(path); !chmod.ok()) {
    return common::Result<BinaryInfo>::failure(chmod.error(), chmod.code());
  }

  auto info = describe(platform);
  observability::record_binary_resolved(platform, info.file_path.string(), info.version, "bundled");
  return common::Result<BinaryInfo>::success(std::move(info));
}

std::optional<BinaryInfo> BundledBinaryAcquirer::cached_info(const std::string &platform) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(directory_ / binary_file_name(platform), ec)) {
    return std::nullopt;
  }
  return describe(platform);
}

// Fetch

FetchBinaryAcquirer::FetchBinaryAcquirer(FetchOptions options, std::shared_ptr<IHttpClient> http,
                                         BinaryValidator validator)
    : options_(std::move(options)), http_(std::move(http)), validator_(validator) {}

HttpHeaders FetchBinaryAcquirer::request_headers() const {
  return {{"User-Agent", options_.user_agent}, {"Accept", "application/vnd.github+json"}};
}

common::Result<std::string>
FetchBinaryAcquirer::fetch_checksum(const ReleaseInfo &release, const std::string &asset_name,
                                    const common::CancellationToken *cancel) {
  std::string manifest_url;
  for (const auto &asset : release.assets) {
    if (common::iequals(asset.name, CHECKSUM_MANIFEST_NAME)) {
      manifest_url = asset.download_url;
      break;
    }
  }
  if (manifest_url.empty()) {
    manifest_url = replace_all(options_.checksum_url_template, "{version}", release.tag);
  }

  const auto response = http_->get(manifest_url, request_headers(), options_.http_timeout_ms, cancel);
  if (response.canceled) {
    return common::Result<std::string>::failure("checksum download canceled",
                                                common::ErrorCode::Canceled);
  }

  std::optional<std::string> checksum;
  if (response.ok()) {
    checksum = find_checksum(response.body, asset_name);
  }
  if (checksum.has_value()) {
    return common::Result<std::string>::success(*checksum);
  }

  const std::string reason = response.ok()
                                 ? "no checksum entry for " + asset_name + " in release " + release.tag
                                 : "checksum manifest unavailable (" + response.describe() + ")";
  if (options_.require_checksum) {
    return common::Result<std::string>::failure(reason, common::ErrorCode::ChecksumMismatch);
  }
  observability::record_warning(COMPONENT, reason + "; continuing without checksum verification");
  return common::Result<std::string>::success("");
}

common::Status FetchBinaryAcquirer::download_validated(const ReleaseAsset &asset,
                                                       const std::filesystem::path &target,
                                                       const std::string &checksum,
                                                       const common::CancellationToken *cancel) {
  const std::filesystem::path partial = target.string() + ".download";

  for (int attempt = 1; attempt <= 2; ++attempt) {
    const auto started = std::chrono::steady_clock::now();
    const auto response =
        http_->download(asset.download_url, partial, request_headers(), options_.http_timeout_ms, cancel);
    if (response.canceled) {
      remove_quietly(partial);
      return common::Status::error("download canceled", common::ErrorCode::Canceled);
    }
    if (!response.ok()) {
      remove_quietly(partial);
      return common::Status::error("download of " + asset.name + " failed: " + response.describe(),
                                   common::ErrorCode::Network);
    }
    observability::record_download(asset.download_url, response.bytes,
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - started));

    std::error_code ec;
    std::filesystem::rename(partial, target, ec);
    if (ec) {
      remove_quietly(partial);
      return common::Status::error("unable to move download into " + target.string() + ": " +
                                       ec.message(),
                                   common::ErrorCode::Io);
    }
    if (const auto chmod = validator_.make_executable(target); !chmod.ok()) {
      remove_quietly(target);
      return chmod;
    }
    if (validator_.validate(target, checksum)) {
      return common::Status::success();
    }

    remove_quietly(target);
    if (attempt == 1) {
      observability::record_warning(COMPONENT, "downloaded " + asset.name +
                                                   " failed validation; retrying once");
    }
  }

  return common::Status::error("downloaded " + asset.name + " failed validation twice",
                               common::ErrorCode::ChecksumMismatch);
}

common::Result<BinaryInfo> FetchBinaryAcquirer::ensure_binary(
    const std::string &platform, const common::CancellationToken *cancel) {
  if (const auto dir = common::ensure_dir(options_.cache_dir); !dir.ok()) {
    return common::Result<BinaryInfo>::failure_from(dir);
  }

  const auto binary_path = options_.cache_dir / binary_file_name(platform);
  const auto info_path = options_.cache_dir / info_file_name(platform);

  const auto cached = load_binary_info(info_path);
  if (cached.ok()) {
    const auto age = std::chrono::system_clock::now() - cached.value().last_updated;
    if (age < options_.metadata_ttl && validator_.validate(binary_path, cached.value().checksum)) {
      auto info = cached.value();
      info.file_path = binary_path;
      info.is_validated = true;
      info.is_executable = true;
      observability::record_binary_resolved(platform, binary_path.string(), info.version, "cache");
      return common::Result<BinaryInfo>::success(std::move(info));
    }
  }

  if (common::canceled(cancel)) {
    return common::Result<BinaryInfo>::failure("binary resolution canceled",
                                               common::ErrorCode::Canceled);
  }

  const auto response =
      http_->get(options_.registry_url, request_headers(), options_.http_timeout_ms, cancel);
  if (response.canceled) {
    return common::Result<BinaryInfo>::failure("release lookup canceled",
                                               common::ErrorCode::Canceled);
  }
  if (!response.ok()) {
    return common::Result<BinaryInfo>::failure("release metadata request to " +
                                                   options_.registry_url +
                                                   " failed: " + response.describe(),
                                               common::ErrorCode::Network);
  }

  const auto release = parse_release(response.body);
  if (!release.ok()) {
    return common::Result<BinaryInfo>::failure_from(release);
  }

  const auto asset = find_platform_asset(release.value(), platform);
  if (!asset.has_value()) {
    return common::Result<BinaryInfo>::failure("release " + release.value().tag +
                                                   " has no asset for platform " + platform,
                                               common::ErrorCode::AssetNotFound);
  }

  const auto checksum = fetch_checksum(release.value(), asset->name, cancel);
  if (!checksum.ok()) {
    return common::Result<BinaryInfo>::failure_from(checksum);
  }

  // Without a checksum only an identical version in the cache is trusted.
  const bool same_version = cached.ok() && cached.value().version == release.value().tag;
  const bool reuse = (!checksum.value().empty() || same_version) &&
                     validator_.validate(binary_path, checksum.value());
  std::string source = "cache";
  if (!reuse) {
    if (const auto status = download_validated(*asset, binary_path, checksum.value(), cancel);
        !status.ok()) {
      return common::Result<BinaryInfo>::failure(status.error(), status.code());
    }
    source = "download";
  }

  BinaryInfo info;
  info.version = release.value().tag;
  info.file_path = binary_path;
  info.file_name = binary_file_name(platform);
  info.download_url = asset->download_url;
  info.checksum = checksum.value();
  std::error_code ec;
  info.size = std::filesystem::file_size(binary_path, ec);
  if (ec) {
    info.size = asset->size;
  }
  info.platform = platform;
  info.last_updated = std::chrono::system_clock::now();
  info.is_validated = true;
  info.is_executable = true;

  if (const auto saved = save_binary_info(info_path, info); !saved.ok()) {
    observability::record_warning(COMPONENT, "unable to write " + info_path.string() + ": " +
                                                 saved.error());
  }
  observability::record_binary_resolved(platform, binary_path.string(), info.version, source);
  return common::Result<BinaryInfo>::success(std::move(info));
}

std::optional<BinaryInfo> FetchBinaryAcquirer::cached_info(const std::string &platform) const {
  const auto info = load_binary_info(options_.cache_dir / info_file_name(platform));
  if (!info.ok()) {
    return std::nullopt;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(info.value().file_path, ec)) {
    return std::nullopt;
  }
  return info.value();
}

common::Status FetchBinaryAcquirer::clear_cache() {
  std::error_code ec;
  if (!std::filesystem::exists(options_.cache_dir, ec)) {
    return common::Status::success();
  }
  std::vector<std::filesystem::path> entries;
  for (const auto &entry : std::filesystem::directory_iterator(options_.cache_dir, ec)) {
    entries.push_back(entry.path());
  }
  if (ec) {
    return common::Status::error("unable to list " + options_.cache_dir.string() + ": " +
                                     ec.message(),
                                 common::ErrorCode::Io);
  }
  for (const auto &path : entries) {
    std::filesystem::remove_all(path, ec);
    if (ec) {
      return common::Status::error("unable to remove " + path.string() + ": " + ec.message(),
                                   common::ErrorCode::Io);
    }
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<IBinaryAcquirer>>
create_acquirer(const config::BinariesConfig &config, std::shared_ptr<IHttpClient> http) {
  using AcquirerResult = common::Result<std::unique_ptr<IBinaryAcquirer>>;
  const std::string mode = common::to_lower(common::trim(config.mode));

  if (mode == "bundled") {
    return AcquirerResult::success(
        std::make_unique<BundledBinaryAcquirer>(config::bundled_dir(config), config.bundled_version));
  }

  if (mode == "fetch") {
    const auto cache = config::cache_dir(config);
    if (!cache.ok()) {
      return AcquirerResult::failure_from(cache);
    }
    FetchOptions options;
    options.cache_dir = cache.value();
    options.registry_url = config.registry_url;
    options.checksum_url_template = config.checksum_url_template;
    options.metadata_ttl = std::chrono::hours(config.metadata_ttl_hours);
    options.require_checksum = config.require_checksum;
    options.http_timeout_ms = static_cast<std::uint64_t>(config.http_timeout_secs) * 1000;
    if (!http) {
      http = std::make_shared<CurlHttpClient>();
    }
    return AcquirerResult::success(
        std::make_unique<FetchBinaryAcquirer>(std::move(options), std::move(http)));
  }

  return AcquirerResult::failure("Invalid binaries.mode: " + config.mode,
                                 common::ErrorCode::ConfigValidation);
}

} // namespace beeptunnel::binary
