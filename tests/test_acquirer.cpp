#include "test_framework.hpp"

#include "beeptunnel/binary/acquirer.hpp"
#include "beeptunnel/binary/platform.hpp"
#include "beeptunnel/binary/validator.hpp"
#include "beeptunnel/common/cancellation.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <memory>

namespace {

constexpr const char *PLATFORM = "linux_amd64";
constexpr const char *REGISTRY = "https://registry.test/releases/latest";
constexpr const char *ASSET_URL = "https://registry.test/download/frpc_linux_amd64";
constexpr const char *MANIFEST_URL = "https://registry.test/download/sha256_checksums.txt";

std::string release_json(const std::string &tag, bool with_manifest = true) {
  std::string json = "{\"tag_name\": \"" + tag + "\", \"assets\": [";
  json += "{\"name\": \"frpc_darwin_arm64\", \"browser_download_url\": "
          "\"https://registry.test/download/frpc_darwin_arm64\", \"size\": 1}, ";
  json += "{\"name\": \"FRPC_Linux_AMD64\", \"browser_download_url\": \"" + std::string(ASSET_URL) +
          "\", \"size\": 2097152}";
  if (with_manifest) {
    json += ", {\"name\": \"sha256_checksums.txt\", \"browser_download_url\": \"" +
            std::string(MANIFEST_URL) + "\", \"size\": 128}";
  }
  json += "]}";
  return json;
}

std::string manifest_for(const std::string &payload) {
  return "0000000000000000000000000000000000000000000000000000000000000000  frpc_darwin_arm64\n" +
         beeptunnel::testing::sha256_hex(payload) + " *FRPC_Linux_AMD64\n";
}

beeptunnel::binary::FetchOptions fetch_options(const std::filesystem::path &cache) {
  beeptunnel::binary::FetchOptions options;
  options.cache_dir = cache;
  options.registry_url = REGISTRY;
  options.checksum_url_template = "https://checksums.test/{version}/sha256_checksums.txt";
  return options;
}

} // namespace

void register_acquirer_tests(std::vector<beeptunnel::tests::TestCase> &tests) {
  using beeptunnel::tests::require;
  namespace bin = beeptunnel::binary;
  namespace common = beeptunnel::common;
  using beeptunnel::testing::FakeHttpClient;
  using beeptunnel::testing::TempWorkspace;

  tests.push_back({"bundled_acquirer_reports_missing_binary", [] {
                     TempWorkspace workspace;
                     bin::BundledBinaryAcquirer acquirer(workspace.path(), "0.64.0");
                     const auto result = acquirer.ensure_binary(PLATFORM);
                     require(!result.ok(), "missing bundled binary should fail");
                     require(result.code() == common::ErrorCode::BinaryNotFound, "BinaryNotFound");
                     require(result.error().find("frpc_linux_amd64") != std::string::npos,
                             "error should name the file");
                     require(!acquirer.cached_info(PLATFORM).has_value(), "no cached info");
                   }});

  tests.push_back({"bundled_acquirer_marks_binary_executable", [] {
                     TempWorkspace workspace;
                     const auto path = workspace.create_binary("frpc_windows_amd64.exe", "MZ", false);
                     bin::BundledBinaryAcquirer acquirer(workspace.path(), "0.64.0");
                     const auto result = acquirer.ensure_binary("windows_amd64");
                     require(result.ok(), result.error());
                     require(result.value().file_path == path, "bundled path");
                     require(result.value().version == "0.64.0", "configured version reported");
                     require(bin::BinaryValidator().is_executable(path), "chmod applied");
                     require(acquirer.mode() == "bundled", "mode name");
                     require(acquirer.clear_cache().ok(), "clear_cache is a no-op");
                     require(std::filesystem::exists(path), "bundled file survives clear_cache");
                   }});

  tests.push_back({"fetch_acquirer_downloads_verifies_and_caches", [] {
                     TempWorkspace workspace;
                     beeptunnel::testing::ObserverScope scope;
                     const std::string payload = beeptunnel::testing::binary_payload('f');
                     auto http = std::make_shared<FakeHttpClient>();
                     http->add_response(REGISTRY, 200, release_json("v0.61.0"));
                     http->add_response(MANIFEST_URL, 200, manifest_for(payload));
                     http->add_response(ASSET_URL, 200, payload);

                     bin::FetchBinaryAcquirer acquirer(fetch_options(workspace.path()), http);
                     const auto result = acquirer.ensure_binary(PLATFORM);
                     require(result.ok(), result.error());
                     const auto &info = result.value();
                     require(info.version == "v0.61.0", "version is the release tag");
                     require(info.file_path == workspace.path() / "frpc_linux_amd64", "cache path");
                     require(info.checksum == beeptunnel::testing::sha256_hex(payload), "checksum");
                     require(info.size == payload.size(), "size");
                     require(info.is_validated && info.is_executable, "flags");
                     require(std::filesystem::exists(workspace.path() / "frpc_linux_amd64_info.json"),
                             "sidecar written");
                     require(!std::filesystem::exists(workspace.path() / "frpc_linux_amd64.download"),
                             "no partial file left");

                     const auto headers = http->last_headers();
                     const auto agent = headers.find("User-Agent");
                     require(agent != headers.end() && agent->second == bin::DEFAULT_USER_AGENT,
                             "requests should carry the User-Agent");

                     const auto requests = http->total_requests();
                     const auto again = acquirer.ensure_binary(PLATFORM);
                     require(again.ok(), again.error());
                     require(http->total_requests() == requests,
                             "fresh cache should not touch the network");

                     const auto cached = acquirer.cached_info(PLATFORM);
                     require(cached.has_value() && cached->version == "v0.61.0", "cached_info");

                     const auto downloads =
                         scope.observer().metrics_of<beeptunnel::observability::DownloadMetric>();
                     require(downloads.size() == 1, "one download recorded");
                   }});

  tests.push_back({"fetch_acquirer_refreshes_expired_cache_without_redownload", [] {
                     TempWorkspace workspace;
                     const std::string payload = beeptunnel::testing::binary_payload('e');
                     auto http = std::make_shared<FakeHttpClient>();
                     http->add_response(REGISTRY, 200, release_json("v0.61.0"));
                     http->add_response(MANIFEST_URL, 200, manifest_for(payload));
                     http->add_response(ASSET_URL, 200, payload);

                     auto options = fetch_options(workspace.path());
                     options.metadata_ttl = std::chrono::hours(0);
                     bin::FetchBinaryAcquirer acquirer(options, http);
                     require(acquirer.ensure_binary(PLATFORM).ok(), "first resolve");
                     require(acquirer.ensure_binary(PLATFORM).ok(), "second resolve");
                     require(http->request_count(REGISTRY) == 2, "expired metadata is refetched");
                     require(http->request_count(ASSET_URL) == 1,
                             "matching cached binary is not downloaded again");
                   }});

  tests.push_back({"fetch_acquirer_reports_missing_asset", [] {
                     TempWorkspace workspace;
                     auto http = std::make_shared<FakeHttpClient>();
                     http->add_response(REGISTRY, 200, release_json("v0.61.0"));
                     bin::FetchBinaryAcquirer acquirer(fetch_options(workspace.path()), http);
                     const auto result = acquirer.ensure_binary("windows_arm");
                     require(!result.ok(), "unknown platform should fail");
                     require(result.code() == common::ErrorCode::AssetNotFound, "AssetNotFound");
                   }});

  tests.push_back({"fetch_acquirer_maps_registry_failures_to_network", [] {
                     TempWorkspace workspace;
                     auto http = std::make_shared<FakeHttpClient>();
                     http->add_network_error(REGISTRY, "Could not resolve host");
                     bin::FetchBinaryAcquirer acquirer(fetch_options(workspace.path()), http);
                     auto result = acquirer.ensure_binary(PLATFORM);
                     require(!result.ok(), "network error should fail");
                     require(result.code() == common::ErrorCode::Network, "Network");

                     auto rate_limited = std::make_shared<FakeHttpClient>();
                     rate_limited->add_response(REGISTRY, 403, "{\"message\": \"rate limited\"}");
                     bin::FetchBinaryAcquirer limited(fetch_options(workspace.path()), rate_limited);
                     result = limited.ensure_binary(PLATFORM);
                     require(result.code() == common::ErrorCode::Network, "non-2xx is Network");
                   }});

  tests.push_back({"fetch_acquirer_retries_once_then_reports_mismatch", [] {
                     TempWorkspace workspace;
                     const std::string good = beeptunnel::testing::binary_payload('g');
                     auto http = std::make_shared<FakeHttpClient>();
                     http->add_response(REGISTRY, 200, release_json("v0.61.0"));
                     http->add_response(MANIFEST_URL, 200, manifest_for(good));
                     http->add_response(ASSET_URL, 200, beeptunnel::testing::binary_payload('b'));

                     bin::FetchBinaryAcquirer acquirer(fetch_options(workspace.path()), http);
                     const auto result = acquirer.ensure_binary(PLATFORM);
                     require(!result.ok(), "corrupt download should fail");
                     require(result.code() == common::ErrorCode::ChecksumMismatch,
                             "ChecksumMismatch");
                     require(http->request_count(ASSET_URL) == 2, "exactly one retry");
                     require(!std::filesystem::exists(workspace.path() / "frpc_linux_amd64"),
                             "failed binary removed");
                   }});

  tests.push_back({"fetch_acquirer_recovers_on_retry", [] {
                     TempWorkspace workspace;
                     const std::string good = beeptunnel::testing::binary_payload('g');
                     auto http = std::make_shared<FakeHttpClient>();
                     http->add_response(REGISTRY, 200, release_json("v0.61.0"));
                     http->add_response(MANIFEST_URL, 200, manifest_for(good));
                     http->add_response(ASSET_URL, 200, "truncated");
                     http->add_response(ASSET_URL, 200, good);

                     bin::FetchBinaryAcquirer acquirer(fetch_options(workspace.path()), http);
                     const auto result = acquirer.ensure_binary(PLATFORM);
                     require(result.ok(), result.error());
                     require(http->request_count(ASSET_URL) == 2, "second attempt used");
                   }});

  tests.push_back({"fetch_acquirer_checksum_policy", [] {
                     TempWorkspace workspace;
                     const std::string payload = beeptunnel::testing::binary_payload('p');
                     const std::string template_url =
                         "https://checksums.test/v0.62.0/sha256_checksums.txt";

                     auto strict_http = std::make_shared<FakeHttpClient>();
                     strict_http->add_response(REGISTRY, 200, release_json("v0.62.0", false));
                     strict_http->add_response(ASSET_URL, 200, payload);
                     auto strict_options = fetch_options(workspace.path() / "strict");
                     strict_options.require_checksum = true;
                     bin::FetchBinaryAcquirer strict(strict_options, strict_http);
                     const auto refused = strict.ensure_binary(PLATFORM);
                     require(!refused.ok(), "missing manifest must fail when required");
                     require(refused.code() == common::ErrorCode::ChecksumMismatch,
                             "ChecksumMismatch when required");
                     require(strict_http->request_count(template_url) == 1,
                             "template URL should be tried with the tag substituted");
                     require(strict_http->request_count(ASSET_URL) == 0, "nothing downloaded");

                     beeptunnel::testing::ObserverScope scope;
                     auto lax_http = std::make_shared<FakeHttpClient>();
                     lax_http->add_response(REGISTRY, 200, release_json("v0.62.0", false));
                     lax_http->add_response(ASSET_URL, 200, payload);
                     bin::FetchBinaryAcquirer lax(fetch_options(workspace.path() / "lax"), lax_http);
                     const auto accepted = lax.ensure_binary(PLATFORM);
                     require(accepted.ok(), accepted.error());
                     require(accepted.value().checksum.empty(), "no checksum recorded");
                     require(!scope.observer().events_of<beeptunnel::observability::WarningEvent>().empty(),
                             "unverified download should warn");
                   }});

  tests.push_back({"fetch_acquirer_honours_cancellation", [] {
                     TempWorkspace workspace;
                     auto http = std::make_shared<FakeHttpClient>();
                     http->add_response(REGISTRY, 200, release_json("v0.61.0"));
                     bin::FetchBinaryAcquirer acquirer(fetch_options(workspace.path()), http);
                     common::CancellationToken token;
                     token.cancel();
                     const auto result = acquirer.ensure_binary(PLATFORM, &token);
                     require(!result.ok(), "canceled resolve should fail");
                     require(result.code() == common::ErrorCode::Canceled, "Canceled");
                     require(!std::filesystem::exists(workspace.path() / "frpc_linux_amd64.download"),
                             "no partial file");
                   }});

  tests.push_back({"fetch_acquirer_clear_cache_empties_directory", [] {
                     TempWorkspace workspace;
                     const auto cache = workspace.path() / "cache";
                     workspace.create_file("cache/frpc_linux_amd64", "x");
                     workspace.create_file("cache/frpc_linux_amd64_info.json", "{}");
                     auto http = std::make_shared<FakeHttpClient>();
                     bin::FetchBinaryAcquirer acquirer(fetch_options(cache), http);
                     require(acquirer.clear_cache().ok(), "clear should succeed");
                     require(std::filesystem::is_empty(cache), "cache should be empty");
                     require(!acquirer.cached_info(PLATFORM).has_value(), "nothing cached");
                   }});

  tests.push_back({"create_acquirer_selects_mode", [] {
                     TempWorkspace workspace;
                     beeptunnel::config::BinariesConfig config;
                     config.bundled_dir = workspace.path().string();
                     auto bundled = bin::create_acquirer(config);
                     require(bundled.ok(), bundled.error());
                     require(bundled.value()->mode() == "bundled", "bundled mode");

                     config.mode = "fetch";
                     config.cache_dir = (workspace.path() / "cache").string();
                     auto fetch = bin::create_acquirer(config, std::make_shared<FakeHttpClient>());
                     require(fetch.ok(), fetch.error());
                     require(fetch.value()->mode() == "fetch", "fetch mode");

                     config.mode = "sideload";
                     auto invalid = bin::create_acquirer(config);
                     require(!invalid.ok(), "unknown mode should fail");
                     require(invalid.code() == common::ErrorCode::ConfigValidation,
                             "ConfigValidation");
                   }});
}
