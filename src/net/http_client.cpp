#include "veilguard/net/http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>

namespace veilguard::net {

namespace {

struct EasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct BodySink {
  std::string *body = nullptr;
  bool overflow = false;
};

size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userdata);
  if (sink->body->size() + total > MAX_RESPONSE_BYTES) {
    sink->overflow = true;
    return 0; // aborts the transfer with CURLE_WRITE_ERROR
  }
  sink->body->append(ptr, total);
  return total;
}

bool append_header(HeaderList &list, const std::string &line) {
  curl_slist *next = curl_slist_append(list.get(), line.c_str());
  if (next == nullptr) {
    return false;
  }
  list.release();
  list.reset(next);
  return true;
}

HttpResponse network_failure(std::string message) {
  HttpResponse response;
  response.network_error = true;
  response.network_error_message = std::move(message);
  return response;
}

} // namespace

std::string describe_failure(const HttpResponse &response) {
  if (response.timeout) {
    return "request timed out";
  }
  if (response.network_error) {
    return "network error: " + response.network_error_message;
  }
  std::string message = "HTTP " + std::to_string(response.status);
  if (!response.body.empty()) {
    message += " " + response.body.substr(0, 200);
  }
  return message;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  EasyHandle curl(curl_easy_init());
  if (curl == nullptr) {
    return network_failure("curl_easy_init failed");
  }

  HeaderList header_list;
  if (!append_header(header_list, "Content-Type: application/json") ||
      !append_header(header_list, "Accept: application/json")) {
    return network_failure("cannot allocate request headers");
  }
  for (const auto &[key, value] : headers) {
    if (!append_header(header_list, key + ": " + value)) {
      return network_failure("cannot allocate request headers");
    }
  }

  HttpResponse response;
  BodySink sink{.body = &response.body};
  const long total_ms = static_cast<long>(std::max<std::uint64_t>(timeout_ms, 1));

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, total_ms);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, total_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "veilguard/0.1");
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

  const CURLcode code = curl_easy_perform(curl.get());
  if (sink.overflow) {
    response.body.clear();
    response.network_error = true;
    response.network_error_message =
        "response exceeds " + std::to_string(MAX_RESPONSE_BYTES) + " bytes";
    return response;
  }
  if (code != CURLE_OK) {
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.network_error = !response.timeout;
    response.network_error_message = curl_easy_strerror(code);
    return response;
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

} // namespace veilguard::net
