#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "veilguard/observability/factory.hpp"
#include "veilguard/observability/global.hpp"
#include "veilguard/observability/log_observer.hpp"
#include "veilguard/observability/multi_observer.hpp"

#include <iostream>
#include <sstream>

namespace {

using veilguard::tests::require;
namespace obs = veilguard::observability;
namespace vt = veilguard::testing;

/// Redirects std::cerr into a buffer for the scope.
class CerrCapture {
public:
  CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(old_); }

  CerrCapture(const CerrCapture &) = delete;
  CerrCapture &operator=(const CerrCapture &) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *old_;
};

} // namespace

void register_observability_tests(std::vector<veilguard::tests::TestCase> &tests) {
  using veilguard::tests::TestCase;

  tests.push_back({"observability_factory_selects_backend", [] {
                     veilguard::config::Config config;
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = "log, noop";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list builds a multi observer");
                     const auto *typed = dynamic_cast<obs::MultiObserver *>(multi.get());
                     require(typed != nullptr && typed->size() == 2, "two children");
                   }});

  tests.push_back({"observability_global_helpers_reach_installed_observer", [] {
                     vt::ObserverCapture capture;
                     obs::record_redaction("s-1", 2, {"PERSON", "EMAIL_ADDRESS"});
                     obs::record_scan_verdict(false, "pattern", "pattern: jailbreak");
                     obs::record_storage_error("set", "disk full");
                     obs::record_metric(obs::StoreEvictionMetric{.evicted = 3});

                     const auto redactions = capture.observer().events_of<obs::RedactionEvent>();
                     require(redactions.size() == 1, "one redaction event");
                     require(redactions[0].session_id == "s-1" && redactions[0].entities == 2,
                             "redaction fields");
                     const auto verdicts = capture.observer().events_of<obs::ScanVerdictEvent>();
                     require(verdicts.size() == 1 && !verdicts[0].safe, "verdict recorded");
                     const auto storage = capture.observer().events_of<obs::StorageErrorEvent>();
                     require(storage.size() == 1 && storage[0].operation == "set",
                             "storage error recorded");
                     require(capture.observer().metrics().size() == 1, "metric recorded");
                   }});

  tests.push_back({"observability_multi_observer_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<vt::RecordingObserver>();
                     auto second = std::make_unique<vt::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.record_event(obs::ErrorEvent{.component = "vault", .message = "x"});
                     require(first_ptr->events().size() == 1, "first child saw event");
                     require(second_ptr->events().size() == 1, "second child saw event");
                   }});

  tests.push_back({"observability_log_observer_formats_lines", [] {
                     CerrCapture capture;
                     obs::LogObserver log;
                     log.record_event(obs::ScanVerdictEvent{
                         .safe = false, .stage = "classifier", .reason = "classifier: NEGATIVE=0.9950"});
                     log.record_event(obs::RedactionEvent{
                         .session_id = "abc", .entities = 2, .kinds = {"PERSON", "CREDIT_CARD"}});
                     const auto text = capture.text();
                     require(text.find("[WARN] scan.verdict safe=false stage=classifier") !=
                                 std::string::npos,
                             "unsafe verdicts log at WARN");
                     require(text.find("[INFO] vault.redact session=abc entities=2 "
                                       "kinds=PERSON,CREDIT_CARD") != std::string::npos,
                             "redaction line lists kinds");
                   }});

  tests.push_back({"observability_restoration_logs_counts", [] {
                     CerrCapture capture;
                     obs::LogObserver log;
                     log.record_event(obs::RestorationEvent{
                         .session_id = "abc", .restored = 1, .unresolved = 1});
                     const auto text = capture.text();
                     require(text.find("restored=1 unresolved=1") != std::string::npos,
                             "restoration counts logged");
                   }});

  tests.push_back({"observability_log_level_filters_lines", [] {
                     require(obs::parse_log_level("WARN") == obs::LogLevel::Warn, "upper case");
                     require(obs::parse_log_level(" debug ") == obs::LogLevel::Debug, "trimmed");
                     require(obs::parse_log_level("loud") == obs::LogLevel::Info, "unknown");

                     CerrCapture capture;
                     obs::LogObserver log(obs::LogLevel::Warn);
                     log.record_event(obs::RedactionEvent{.session_id = "quiet", .entities = 1});
                     log.record_event(obs::ScanVerdictEvent{.safe = true, .stage = "none"});
                     log.record_event(
                         obs::StorageErrorEvent{.operation = "merge", .message = "locked"});
                     const auto text = capture.text();
                     require(text.find("quiet") == std::string::npos, "info dropped at warn");
                     require(text.find("scan.verdict") == std::string::npos, "debug dropped");
                     require(text.find("[ERROR] store.merge: locked") != std::string::npos,
                             "errors still logged");
                   }});

  tests.push_back({"observability_factory_applies_log_level", [] {
                     veilguard::config::Config config;
                     config.observability.backend = "log";
                     config.observability.log_level = "error";
                     auto observer = obs::create_observer(config);
                     const auto *log = dynamic_cast<obs::LogObserver *>(observer.get());
                     require(log != nullptr && log->min_level() == obs::LogLevel::Error,
                             "level reaches the log backend");
                   }});
}
