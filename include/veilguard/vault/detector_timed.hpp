#pragma once

#include "veilguard/vault/detector.hpp"

#include <chrono>

namespace veilguard::vault {

/// Bounds another detector's latency. A missed deadline is ErrorKind::Timeout.
class TimedEntityDetector final : public IEntityDetector {
public:
  TimedEntityDetector(std::shared_ptr<IEntityDetector> inner, std::chrono::milliseconds timeout);

  [[nodiscard]] std::string_view name() const override { return inner_->name(); }
  [[nodiscard]] common::Result<std::vector<EntityMatch>>
  detect(const std::string &text, const std::vector<std::string> &labels) override;

private:
  std::shared_ptr<IEntityDetector> inner_;
  std::chrono::milliseconds timeout_;
};

} // namespace veilguard::vault
