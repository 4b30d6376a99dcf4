#include "veilguard/observability/global.hpp"

#include <mutex>

namespace veilguard::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_redaction(const std::string &session_id, const std::size_t entities,
                      std::vector<std::string> kinds) {
  record_event(
      RedactionEvent{.session_id = session_id, .entities = entities, .kinds = std::move(kinds)});
}

void record_restoration(const std::string &session_id, const std::size_t restored,
                        const std::size_t unresolved) {
  record_event(RestorationEvent{
      .session_id = session_id, .restored = restored, .unresolved = unresolved});
}

void record_scan_verdict(const bool safe, const std::string &stage, const std::string &reason) {
  record_event(ScanVerdictEvent{.safe = safe, .stage = stage, .reason = reason});
}

void record_classifier_failure(const std::string &message, const bool failed_open) {
  record_event(ClassifierFailureEvent{.message = message, .failed_open = failed_open});
}

void record_storage_error(const std::string &operation, const std::string &message) {
  record_event(StorageErrorEvent{.operation = operation, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace veilguard::observability
