#include "veilguard/observability/log_observer.hpp"

#include "veilguard/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace veilguard::observability {

namespace {

const char *level_tag(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string join_kinds(const std::vector<std::string> &kinds) {
  std::string out;
  for (const auto &kind : kinds) {
    if (!out.empty()) {
      out += ",";
    }
    out += kind;
  }
  return out;
}

} // namespace

LogLevel parse_log_level(const std::string &name) {
  const std::string level = common::to_lower(common::trim(name));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

void LogObserver::log_line(const LogLevel level, const std::string &message) const {
  if (level < min_level_) {
    return;
  }
  std::cerr << "[" << level_tag(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RedactionEvent>) {
          log_line(LogLevel::Info, "vault.redact session=" + evt.session_id +
                                       " entities=" + std::to_string(evt.entities) +
                                       " kinds=" + join_kinds(evt.kinds));
        } else if constexpr (std::is_same_v<T, RestorationEvent>) {
          // Unresolved placeholders usually mean the session expired.
          log_line(evt.unresolved > 0 ? LogLevel::Warn : LogLevel::Info,
                   "vault.restore session=" + evt.session_id +
                       " restored=" + std::to_string(evt.restored) +
                       " unresolved=" + std::to_string(evt.unresolved));
        } else if constexpr (std::is_same_v<T, ScanVerdictEvent>) {
          if (evt.safe) {
            log_line(LogLevel::Debug, "scan.verdict safe=true stage=" + evt.stage);
          } else {
            log_line(LogLevel::Warn,
                     "scan.verdict safe=false stage=" + evt.stage + " reason=" + evt.reason);
          }
        } else if constexpr (std::is_same_v<T, ClassifierFailureEvent>) {
          log_line(LogLevel::Warn, "scan.classifier_failure policy=" +
                                       std::string(evt.failed_open ? "open" : "closed") + " " +
                                       evt.message);
        } else if constexpr (std::is_same_v<T, StorageErrorEvent>) {
          log_line(LogLevel::Error, "store." + evt.operation + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ScanLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.scan_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, AnonymizeLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.anonymize_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, StoreSizeMetric>) {
          log_line(LogLevel::Debug, "metric.store_bytes=" + std::to_string(m.bytes) +
                                        " records=" + std::to_string(m.records));
        } else if constexpr (std::is_same_v<T, StoreEvictionMetric>) {
          log_line(LogLevel::Info, "metric.store_evictions=" + std::to_string(m.evicted));
        }
      },
      metric);
}

} // namespace veilguard::observability
