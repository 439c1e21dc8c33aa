#include "beeptunnel/binary/http_client.hpp"

#include <curl/curl.h>

#include <fstream>

namespace beeptunnel::binary {

namespace {

struct TransferContext {
  std::string *body = nullptr;
  std::ofstream *file = nullptr;
  std::uint64_t bytes = 0;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<TransferContext *>(userdata);
  if (context->body != nullptr) {
    context->body->append(ptr, total);
  }
  if (context->file != nullptr) {
    context->file->write(ptr, static_cast<std::streamsize>(total));
    if (!*context->file) {
      return 0;
    }
  }
  context->bytes += total;
  return total;
}

int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *cancel = static_cast<const common::CancellationToken *>(clientp);
  return common::canceled(cancel) ? 1 : 0;
}

HttpResponse execute_get(const std::string &url, const HttpHeaders &headers,
                         const std::uint64_t timeout_ms, const common::CancellationToken *cancel,
                         TransferContext &context) {
  HttpResponse response;
  if (common::canceled(cancel)) {
    response.canceled = true;
    response.network_error_message = "canceled";
    return response;
  }

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<common::CancellationToken *>(cancel));

  bool has_user_agent = false;
  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    if (key == "User-Agent") {
      curl_easy_setopt(curl, CURLOPT_USERAGENT, value.c_str());
      has_user_agent = true;
      continue;
    }
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (!has_user_agent) {
    curl_easy_setopt(curl, CURLOPT_USERAGENT, DEFAULT_USER_AGENT);
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code == CURLE_ABORTED_BY_CALLBACK) {
    response.canceled = true;
    response.network_error_message = "canceled";
  } else if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }
  response.bytes = context.bytes;

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

std::string HttpResponse::describe() const {
  if (canceled) {
    return "canceled";
  }
  if (network_error) {
    return timeout ? "timed out: " + network_error_message : network_error_message;
  }
  return "HTTP " + std::to_string(status);
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms,
                                 const common::CancellationToken *cancel) {
  HttpResponse response;
  TransferContext context;
  std::string body;
  context.body = &body;
  response = execute_get(url, headers, timeout_ms, cancel, context);
  response.body = std::move(body);
  return response;
}

HttpResponse CurlHttpClient::download(const std::string &url,
                                      const std::filesystem::path &destination,
                                      const HttpHeaders &headers, const std::uint64_t timeout_ms,
                                      const common::CancellationToken *cancel) {
  HttpResponse response;
  {
    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file) {
      response.network_error = true;
      response.network_error_message = "unable to open " + destination.string();
      return response;
    }
    TransferContext context;
    context.file = &file;
    response = execute_get(url, headers, timeout_ms, cancel, context);
  }

  if (!response.ok()) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
  }
  return response;
}

} // namespace beeptunnel::binary
