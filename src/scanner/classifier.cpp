#include "veilguard/scanner/classifier.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/scanner/classifier_http.hpp"
#include "veilguard/scanner/classifier_lexicon.hpp"
#include "veilguard/scanner/classifier_timed.hpp"

#include <cmath>

namespace veilguard::scanner {

common::Status validate_distribution(const LabelDistribution &distribution) {
  if (distribution.empty()) {
    return common::Status::error(common::ErrorKind::ClassificationFailure,
                                 "classifier returned no labels");
  }
  for (const auto &entry : distribution) {
    if (common::trim(entry.label).empty()) {
      return common::Status::error(common::ErrorKind::ClassificationFailure,
                                   "classifier returned a blank label");
    }
    if (std::isnan(entry.score) || entry.score < 0.0 || entry.score > 1.0) {
      return common::Status::error(common::ErrorKind::ClassificationFailure,
                                   "classifier score for " + entry.label + " is out of range");
    }
  }
  return common::Status::success();
}

common::Result<std::shared_ptr<IIntentClassifier>>
create_classifier(const config::Config &config, std::shared_ptr<net::HttpClient> http_client) {
  using ClassifierResult = common::Result<std::shared_ptr<IIntentClassifier>>;
  const std::string backend = common::to_lower(common::trim(config.scanner.classifier_backend));

  std::shared_ptr<IIntentClassifier> classifier;
  if (backend == "none") {
    return ClassifierResult::success(nullptr);
  }
  if (backend.empty() || backend == "lexicon") {
    classifier = std::make_shared<LexiconClassifier>();
  } else if (backend == "http") {
    if (config.scanner.classifier_endpoint.empty()) {
      return ClassifierResult::failure(common::ErrorKind::InvalidArgument,
                                       "scanner.classifier_endpoint is required for the http "
                                       "classifier");
    }
    if (http_client == nullptr) {
      http_client = std::make_shared<net::CurlHttpClient>();
    }
    classifier = std::make_shared<HttpClassifier>(config.scanner.classifier_endpoint,
                                                  config.scanner.classifier_api_key,
                                                  config.scanner.classifier_timeout_ms,
                                                  std::move(http_client));
  } else {
    return ClassifierResult::failure(common::ErrorKind::InvalidArgument,
                                     "Unknown classifier backend: " +
                                         config.scanner.classifier_backend);
  }

  if (config.scanner.classifier_timeout_ms > 0) {
    classifier = std::make_shared<TimedClassifier>(
        std::move(classifier), std::chrono::milliseconds(config.scanner.classifier_timeout_ms));
  }
  return ClassifierResult::success(std::move(classifier));
}

} // namespace veilguard::scanner
