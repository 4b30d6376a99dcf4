#pragma once

#include "veilguard/common/result.hpp"
#include "veilguard/config/schema.hpp"
#include "veilguard/net/http_client.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace veilguard::scanner {

struct LabelScore {
  std::string label;
  double score = 0.0;
};

using LabelDistribution = std::vector<LabelScore>;

/// Scores text for hostile intent over a fixed label set.
class IIntentClassifier {
public:
  virtual ~IIntentClassifier() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<LabelDistribution> classify(const std::string &text) = 0;
};

/// ClassificationFailure for an empty distribution, a blank label, or a score
/// that is NaN or outside [0, 1].
[[nodiscard]] common::Status validate_distribution(const LabelDistribution &distribution);

/// nullptr (with success) when classifier_backend is "none".
[[nodiscard]] common::Result<std::shared_ptr<IIntentClassifier>>
create_classifier(const config::Config &config,
                  std::shared_ptr<net::HttpClient> http_client = nullptr);

} // namespace veilguard::scanner
