#include "veilguard/observability/factory.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/observability/log_observer.hpp"
#include "veilguard/observability/multi_observer.hpp"
#include "veilguard/observability/noop_observer.hpp"

#include <sstream>

namespace veilguard::observability {

namespace {

std::unique_ptr<IObserver> observer_for(const std::string &backend, const LogLevel level) {
  if (backend == "noop" || backend == "none") {
    return std::make_unique<NoopObserver>();
  }
  // validate_config rejects other names; anything that slips through still logs.
  return std::make_unique<LogObserver>(level);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const LogLevel level = parse_log_level(config.observability.log_level);
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backend.find(',') == std::string::npos) {
    return observer_for(backend, level);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (const std::string name = common::trim(part); !name.empty()) {
      multi->add(observer_for(name, level));
    }
  }
  return multi;
}

} // namespace veilguard::observability
