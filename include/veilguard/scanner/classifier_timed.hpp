#pragma once

#include "veilguard/scanner/classifier.hpp"

#include <chrono>

namespace veilguard::scanner {

class TimedClassifier final : public IIntentClassifier {
public:
  TimedClassifier(std::shared_ptr<IIntentClassifier> inner, std::chrono::milliseconds timeout);

  [[nodiscard]] std::string_view name() const override { return inner_->name(); }
  [[nodiscard]] common::Result<LabelDistribution> classify(const std::string &text) override;

private:
  std::shared_ptr<IIntentClassifier> inner_;
  std::chrono::milliseconds timeout_;
};

} // namespace veilguard::scanner
