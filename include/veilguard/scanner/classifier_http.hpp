#pragma once

#include "veilguard/scanner/classifier.hpp"

namespace veilguard::scanner {

/// Text-classification inference endpoint: POST {"inputs": text} and read
/// back [[{label, score}, ...]] (a flat list is accepted too).
class HttpClassifier final : public IIntentClassifier {
public:
  HttpClassifier(std::string endpoint, std::string api_key, std::uint64_t timeout_ms,
                 std::shared_ptr<net::HttpClient> http_client =
                     std::make_shared<net::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override { return "http"; }
  [[nodiscard]] common::Result<LabelDistribution> classify(const std::string &text) override;

private:
  std::string endpoint_;
  std::string api_key_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<net::HttpClient> http_client_;
};

[[nodiscard]] common::Result<LabelDistribution> parse_classifier_response(const std::string &body);

} // namespace veilguard::scanner
