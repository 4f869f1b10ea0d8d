#include "gateway/curl_gateway.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace grok_mcp::gateway {
namespace {

struct CurlHandleDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const {
    if (list != nullptr) {
      curl_slist_free_all(list);
    }
  }
};

using CurlHandlePtr = std::unique_ptr<CURL, CurlHandleDeleter>;
using HeaderListPtr = std::unique_ptr<curl_slist, HeaderListDeleter>;

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  const std::size_t total = size * nmemb;
  auto* buffer = static_cast<std::string*>(userdata);
  buffer->append(ptr, total);
  return total;
}

bool append_header(HeaderListPtr& headers, const std::string& line) {
  curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
  if (appended == nullptr) {
    return false;
  }
  headers.release();
  headers.reset(appended);
  return true;
}

}  // namespace

CurlModelGateway::CurlModelGateway(core::GatewayConfig config) : config_(std::move(config)) {
  if (config_.api_key.empty()) {
    throw std::runtime_error("gateway requires a non-empty api key");
  }
  const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (code != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
  }
}

CurlModelGateway::~CurlModelGateway() { curl_global_cleanup(); }

std::string CurlModelGateway::endpoint_url() const { return config_.base_url + "/chat/completions"; }

std::optional<std::string> CurlModelGateway::complete(const CompletionRequest& request, std::string* err) {
  CurlHandlePtr handle(curl_easy_init());
  if (!handle) {
    if (err) *err = "curl_easy_init failed";
    return std::nullopt;
  }

  HeaderListPtr headers;
  if (!append_header(headers, "Content-Type: application/json") ||
      !append_header(headers, "Authorization: Bearer " + config_.api_key)) {
    if (err) *err = "failed to build request headers";
    return std::nullopt;
  }

  const std::string url = endpoint_url();
  const std::string body = build_chat_completion_body(request);
  const long timeout_ms = static_cast<long>(request.timeout.count()) * 1000L;

  std::string response;
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode code = curl_easy_perform(handle.get());
  if (code == CURLE_OPERATION_TIMEDOUT) {
    if (err) *err = "request timed out after " + std::to_string(request.timeout.count()) + "s";
    return std::nullopt;
  }
  if (code != CURLE_OK) {
    if (err) *err = std::string("POST ") + url + " failed: " + curl_easy_strerror(code);
    return std::nullopt;
  }

  long status = 0;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  return parse_chat_completion_response(status, response, err);
}

}  // namespace grok_mcp::gateway
