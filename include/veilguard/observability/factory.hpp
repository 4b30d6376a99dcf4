#pragma once

#include "veilguard/config/schema.hpp"
#include "veilguard/observability/observer.hpp"

#include <memory>

namespace veilguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace veilguard::observability
