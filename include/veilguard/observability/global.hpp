#pragma once

#include "veilguard/observability/observer.hpp"

#include <memory>

namespace veilguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_redaction(const std::string &session_id, std::size_t entities,
                      std::vector<std::string> kinds);
void record_restoration(const std::string &session_id, std::size_t restored,
                        std::size_t unresolved);
void record_scan_verdict(bool safe, const std::string &stage, const std::string &reason);
void record_classifier_failure(const std::string &message, bool failed_open);
void record_storage_error(const std::string &operation, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace veilguard::observability
