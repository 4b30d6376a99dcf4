#pragma once

#include "veilguard/scanner/classifier.hpp"

#include <unordered_map>

namespace veilguard::scanner {

/// Offline hostility scorer: logistic over weighted terms, reported as
/// {NEGATIVE: p, POSITIVE: 1 - p}.
class LexiconClassifier final : public IIntentClassifier {
public:
  LexiconClassifier();
  LexiconClassifier(std::unordered_map<std::string, double> weights, double bias);

  [[nodiscard]] std::string_view name() const override { return "lexicon"; }
  [[nodiscard]] common::Result<LabelDistribution> classify(const std::string &text) override;

  [[nodiscard]] double hostility(const std::string &text) const;

private:
  std::unordered_map<std::string, double> weights_;
  double bias_;
};

} // namespace veilguard::scanner
