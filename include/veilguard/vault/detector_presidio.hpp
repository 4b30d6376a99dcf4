#pragma once

#include "veilguard/vault/detector.hpp"

namespace veilguard::vault {

/// Client for a Presidio analyzer `/analyze` endpoint.
class PresidioEntityDetector final : public IEntityDetector {
public:
  PresidioEntityDetector(std::string endpoint, std::string language, double min_score,
                         std::uint64_t timeout_ms,
                         std::shared_ptr<net::HttpClient> http_client =
                             std::make_shared<net::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override { return "presidio"; }
  [[nodiscard]] common::Result<std::vector<EntityMatch>>
  detect(const std::string &text, const std::vector<std::string> &labels) override;

private:
  std::string endpoint_;
  std::string language_;
  double min_score_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<net::HttpClient> http_client_;
};

/// Parses an analyzer response body. Offsets in the body count code points
/// of `text`; the returned matches carry byte offsets.
[[nodiscard]] common::Result<std::vector<EntityMatch>>
parse_presidio_response(const std::string &text, const std::string &body, double min_score);

} // namespace veilguard::vault
