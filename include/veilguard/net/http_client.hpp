#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace veilguard::net {

using HeaderMap = std::unordered_map<std::string, std::string>;

/// Analyzer and classifier replies are small; anything larger is refused.
constexpr std::size_t MAX_RESPONSE_BYTES = 4 * 1024 * 1024;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool success() const {
    return !timeout && !network_error && status >= 200 && status < 300;
  }
};

/// One-line description of a failed exchange, suitable for error messages.
[[nodiscard]] std::string describe_failure(const HttpResponse &response);

/// Transport for the remote detector and classifier backends.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  /// `timeout_ms` bounds the whole exchange, connect included.
  [[nodiscard]] HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
};

} // namespace veilguard::net
