#pragma once

#include "veilguard/common/result.hpp"
#include "veilguard/config/schema.hpp"
#include "veilguard/scanner/classifier.hpp"
#include "veilguard/scanner/patterns.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veilguard::scanner {

enum class ScanStage {
  None,
  Pattern,
  Classifier,
};

[[nodiscard]] std::string_view scan_stage_name(ScanStage stage);

/// An unsafe verdict is a normal outcome, not an error.
struct ScanVerdict {
  bool safe = true;
  std::optional<std::string> reason;
  ScanStage stage = ScanStage::None;
};

enum class FailurePolicy {
  Open,
  Closed,
};

struct ClassifierPolicy {
  std::vector<std::string> hostile_labels = {"NEGATIVE"};
  double threshold = 0.99;
  FailurePolicy failure_policy = FailurePolicy::Open;
};

[[nodiscard]] common::Result<ClassifierPolicy>
classifier_policy_from_config(const config::ScannerConfig &config);

/// Pattern stage, then classifier stage; the first unsafe stage short-circuits.
/// Stateless apart from its collaborators and safe to share across sessions.
class SecurityScanner {
public:
  SecurityScanner(PatternStage patterns, std::shared_ptr<IIntentClassifier> classifier,
                  ClassifierPolicy policy = {});

  [[nodiscard]] ScanVerdict scan(const std::string &text) const;

  [[nodiscard]] const PatternStage &patterns() const { return patterns_; }
  [[nodiscard]] const ClassifierPolicy &policy() const { return policy_; }

private:
  [[nodiscard]] ScanVerdict classifier_verdict(const std::string &text) const;
  [[nodiscard]] ScanVerdict classifier_fault(const std::string &message) const;

  PatternStage patterns_;
  std::shared_ptr<IIntentClassifier> classifier_;
  ClassifierPolicy policy_;
};

[[nodiscard]] common::Result<std::shared_ptr<SecurityScanner>>
create_scanner(const config::Config &config, std::shared_ptr<net::HttpClient> http_client = nullptr);

} // namespace veilguard::scanner
