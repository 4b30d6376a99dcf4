#include "veilguard/scanner/scanner.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace veilguard::scanner {

namespace {

std::string format_score(const double score) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.4f", score);
  return buffer;
}

ScanVerdict finish(ScanVerdict verdict, const std::chrono::steady_clock::time_point started) {
  observability::record_scan_verdict(verdict.safe, std::string(scan_stage_name(verdict.stage)),
                                     verdict.reason.value_or(""));
  observability::record_metric(observability::ScanLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  return verdict;
}

} // namespace

std::string_view scan_stage_name(const ScanStage stage) {
  switch (stage) {
  case ScanStage::None:
    return "none";
  case ScanStage::Pattern:
    return "pattern";
  case ScanStage::Classifier:
    return "classifier";
  }
  return "none";
}

common::Result<ClassifierPolicy> classifier_policy_from_config(const config::ScannerConfig &config) {
  ClassifierPolicy policy;
  policy.hostile_labels = config.hostile_labels;
  policy.threshold = config.classifier_threshold;

  const std::string failure = common::to_lower(common::trim(config.failure_policy));
  if (failure == "open" || failure.empty()) {
    policy.failure_policy = FailurePolicy::Open;
  } else if (failure == "closed") {
    policy.failure_policy = FailurePolicy::Closed;
  } else {
    return common::Result<ClassifierPolicy>::failure(
        common::ErrorKind::InvalidArgument, "Invalid scanner.failure_policy: " + config.failure_policy);
  }
  return common::Result<ClassifierPolicy>::success(std::move(policy));
}

SecurityScanner::SecurityScanner(PatternStage patterns,
                                 std::shared_ptr<IIntentClassifier> classifier,
                                 ClassifierPolicy policy)
    : patterns_(std::move(patterns)), classifier_(std::move(classifier)),
      policy_(std::move(policy)) {}

ScanVerdict SecurityScanner::scan(const std::string &text) const {
  const auto started = std::chrono::steady_clock::now();

  if (const auto pattern = patterns_.first_match(text); pattern.has_value()) {
    return finish(ScanVerdict{.safe = false,
                              .reason = "pattern: " + *pattern,
                              .stage = ScanStage::Pattern},
                  started);
  }

  if (classifier_ == nullptr || common::trim(text).empty()) {
    return finish(ScanVerdict{}, started);
  }
  return finish(classifier_verdict(text), started);
}

ScanVerdict SecurityScanner::classifier_verdict(const std::string &text) const {
  common::Result<LabelDistribution> distribution =
      common::Result<LabelDistribution>::failure("classifier not invoked");
  try {
    distribution = classifier_->classify(text);
  } catch (const std::exception &ex) {
    return classifier_fault(std::string("classifier threw: ") + ex.what());
  } catch (...) {
    return classifier_fault("classifier threw a non-standard exception");
  }

  if (!distribution.ok()) {
    return classifier_fault(distribution.error());
  }
  if (const auto status = validate_distribution(distribution.value()); !status.ok()) {
    return classifier_fault(status.error());
  }

  for (const auto &entry : distribution.value()) {
    const bool hostile = std::find(policy_.hostile_labels.begin(), policy_.hostile_labels.end(),
                                   entry.label) != policy_.hostile_labels.end();
    if (hostile && entry.score > policy_.threshold) {
      return ScanVerdict{.safe = false,
                         .reason = "classifier: " + entry.label + "=" + format_score(entry.score),
                         .stage = ScanStage::Classifier};
    }
  }
  return ScanVerdict{.safe = true, .reason = std::nullopt, .stage = ScanStage::Classifier};
}

ScanVerdict SecurityScanner::classifier_fault(const std::string &message) const {
  const bool open = policy_.failure_policy == FailurePolicy::Open;
  observability::record_classifier_failure(message, open);
  if (open) {
    return ScanVerdict{};
  }
  return ScanVerdict{.safe = false,
                     .reason = "classifier unavailable: " + message,
                     .stage = ScanStage::Classifier};
}

common::Result<std::shared_ptr<SecurityScanner>>
create_scanner(const config::Config &config, std::shared_ptr<net::HttpClient> http_client) {
  using ScannerResult = common::Result<std::shared_ptr<SecurityScanner>>;

  auto patterns = PatternStage::create(config.scanner.scan_patterns);
  if (!patterns.ok()) {
    return ScannerResult::failure(patterns.status());
  }
  auto policy = classifier_policy_from_config(config.scanner);
  if (!policy.ok()) {
    return ScannerResult::failure(policy.status());
  }
  auto classifier = create_classifier(config, std::move(http_client));
  if (!classifier.ok()) {
    return ScannerResult::failure(classifier.status());
  }

  return ScannerResult::success(std::make_shared<SecurityScanner>(
      std::move(patterns.value()), std::move(classifier.value()), std::move(policy.value())));
}

} // namespace veilguard::scanner
