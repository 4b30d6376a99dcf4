#include "veilguard/scanner/classifier_http.hpp"

#include "veilguard/common/json_util.hpp"

namespace veilguard::scanner {

namespace {

using Distribution = common::Result<LabelDistribution>;

Distribution malformed(const std::string &what) {
  return Distribution::failure(common::ErrorKind::ClassificationFailure,
                               "classifier response " + what);
}

} // namespace

HttpClassifier::HttpClassifier(std::string endpoint, std::string api_key,
                               const std::uint64_t timeout_ms,
                               std::shared_ptr<net::HttpClient> http_client)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)), timeout_ms_(timeout_ms),
      http_client_(std::move(http_client)) {}

common::Result<LabelDistribution> HttpClassifier::classify(const std::string &text) {
  net::HeaderMap headers;
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }

  const std::string body = "{\"inputs\":\"" + common::json_escape(text) + "\"}";
  const auto response = http_client_->post_json(endpoint_, headers, body, timeout_ms_);
  if (response.timeout) {
    return Distribution::failure(common::ErrorKind::Timeout, "classifier request timed out");
  }
  if (!response.success()) {
    return Distribution::failure(common::ErrorKind::ClassificationFailure,
                                 "classifier " + net::describe_failure(response));
  }
  return parse_classifier_response(response.body);
}

common::Result<LabelDistribution> parse_classifier_response(const std::string &body) {
  // Batch responses nest one list per input; we always send one input.
  const auto array = common::json_unwrap_batch(body);
  if (!array.has_value()) {
    return malformed("is not a JSON array");
  }

  LabelDistribution distribution;
  for (const auto &object : common::json_array_objects(*array)) {
    const std::string label = common::json_get_string(object, "label");
    const auto score = common::json_get_double(object, "score");
    if (label.empty() || !score.has_value()) {
      return malformed("entry lacks label or numeric score");
    }
    distribution.push_back(LabelScore{.label = label, .score = *score});
  }

  if (const auto status = validate_distribution(distribution); !status.ok()) {
    return Distribution::failure(status);
  }
  return Distribution::success(std::move(distribution));
}

} // namespace veilguard::scanner
