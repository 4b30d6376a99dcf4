#pragma once

#include "veilguard/observability/observer.hpp"

#include <string>

namespace veilguard::observability {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

/// debug | info | warn | error, case-insensitive; unknown names give Info.
[[nodiscard]] LogLevel parse_log_level(const std::string &name);

/// One line per event on stderr: `[LEVEL] component.event key=value ...`.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message) const;

  LogLevel min_level_;
};

} // namespace veilguard::observability
