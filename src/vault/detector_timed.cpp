#include "veilguard/vault/detector_timed.hpp"

#include "veilguard/common/deadline.hpp"

namespace veilguard::vault {

TimedEntityDetector::TimedEntityDetector(std::shared_ptr<IEntityDetector> inner,
                                         const std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout) {}

common::Result<std::vector<EntityMatch>>
TimedEntityDetector::detect(const std::string &text, const std::vector<std::string> &labels) {
  using Matches = common::Result<std::vector<EntityMatch>>;

  // The worker may outlive this call, so it owns copies of everything it reads.
  std::function<Matches()> call = [inner = inner_, text, labels]() {
    return inner->detect(text, labels);
  };

  try {
    auto result = common::run_with_deadline<Matches>(std::move(call), timeout_);
    if (!result.has_value()) {
      return Matches::failure(common::ErrorKind::Timeout,
                              std::string(inner_->name()) + " detector exceeded " +
                                  std::to_string(timeout_.count()) + "ms");
    }
    return std::move(*result);
  } catch (const std::exception &ex) {
    return Matches::failure(common::ErrorKind::DetectionFailure,
                            std::string(inner_->name()) + " detector failed: " + ex.what());
  } catch (...) {
    return Matches::failure(common::ErrorKind::DetectionFailure,
                            std::string(inner_->name()) +
                                " detector threw a non-standard exception");
  }
}

} // namespace veilguard::vault
