#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace veilguard::observability {

/// Events never carry original PII values, only kinds, counts and session ids.
struct RedactionEvent {
  std::string session_id;
  std::size_t entities = 0;
  std::vector<std::string> kinds;
};

struct RestorationEvent {
  std::string session_id;
  std::size_t restored = 0;
  std::size_t unresolved = 0;
};

struct ScanVerdictEvent {
  bool safe = true;
  std::string stage;
  std::string reason;
};

struct ClassifierFailureEvent {
  std::string message;
  bool failed_open = true;
};

struct StorageErrorEvent {
  std::string operation;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RedactionEvent, RestorationEvent, ScanVerdictEvent,
                                   ClassifierFailureEvent, StorageErrorEvent, ErrorEvent>;

struct ScanLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct AnonymizeLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct StoreSizeMetric {
  std::uint64_t bytes = 0;
  std::uint64_t records = 0;
};

struct StoreEvictionMetric {
  std::uint64_t evicted = 0;
};

using ObserverMetric =
    std::variant<ScanLatencyMetric, AnonymizeLatencyMetric, StoreSizeMetric, StoreEvictionMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace veilguard::observability
