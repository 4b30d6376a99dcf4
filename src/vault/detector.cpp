#include "veilguard/vault/detector.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/vault/detector_local.hpp"
#include "veilguard/vault/detector_presidio.hpp"
#include "veilguard/vault/detector_timed.hpp"

namespace veilguard::vault {

common::Result<std::shared_ptr<IEntityDetector>>
create_detector(const config::Config &config, std::shared_ptr<net::HttpClient> http_client) {
  using DetectorResult = common::Result<std::shared_ptr<IEntityDetector>>;
  const std::string backend = common::to_lower(common::trim(config.detector.backend));

  std::shared_ptr<IEntityDetector> detector;
  if (backend.empty() || backend == "local") {
    detector = std::make_shared<LocalEntityDetector>();
  } else if (backend == "presidio") {
    if (http_client == nullptr) {
      http_client = std::make_shared<net::CurlHttpClient>();
    }
    detector = std::make_shared<PresidioEntityDetector>(
        config.detector.endpoint, config.detector.language, config.detector.min_score,
        config.detector.timeout_ms, std::move(http_client));
  } else {
    return DetectorResult::failure(common::ErrorKind::InvalidArgument,
                                   "Unknown detector backend: " + config.detector.backend);
  }

  if (config.detector.timeout_ms > 0) {
    detector = std::make_shared<TimedEntityDetector>(
        std::move(detector), std::chrono::milliseconds(config.detector.timeout_ms));
  }
  return DetectorResult::success(std::move(detector));
}

} // namespace veilguard::vault
