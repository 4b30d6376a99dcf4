#include "veilguard/scanner/classifier_timed.hpp"

#include "veilguard/common/deadline.hpp"

namespace veilguard::scanner {

TimedClassifier::TimedClassifier(std::shared_ptr<IIntentClassifier> inner,
                                 const std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout) {}

common::Result<LabelDistribution> TimedClassifier::classify(const std::string &text) {
  using Distribution = common::Result<LabelDistribution>;

  std::function<Distribution()> call = [inner = inner_, text]() { return inner->classify(text); };
  try {
    auto result = common::run_with_deadline<Distribution>(std::move(call), timeout_);
    if (!result.has_value()) {
      return Distribution::failure(common::ErrorKind::Timeout,
                                   std::string(inner_->name()) + " classifier exceeded " +
                                       std::to_string(timeout_.count()) + "ms");
    }
    return std::move(*result);
  } catch (const std::exception &ex) {
    return Distribution::failure(common::ErrorKind::ClassificationFailure,
                                 std::string(inner_->name()) + " classifier failed: " + ex.what());
  } catch (...) {
    return Distribution::failure(common::ErrorKind::ClassificationFailure,
                                 std::string(inner_->name()) +
                                     " classifier threw a non-standard exception");
  }
}

} // namespace veilguard::scanner
