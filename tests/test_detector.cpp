#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "veilguard/vault/detector.hpp"
#include "veilguard/vault/detector_local.hpp"
#include "veilguard/vault/detector_presidio.hpp"
#include "veilguard/vault/detector_timed.hpp"
#include "veilguard/vault/entity.hpp"

#include <algorithm>

namespace {

using veilguard::tests::require;
namespace common = veilguard::common;
namespace vault = veilguard::vault;
namespace vt = veilguard::testing;

const std::vector<std::string> ALL_LABELS = {"PERSON", "EMAIL_ADDRESS", "PHONE_NUMBER",
                                             "CREDIT_CARD"};

std::vector<vault::EntityMatch> local_detect(const std::string &text,
                                             const std::vector<std::string> &labels = ALL_LABELS) {
  vault::LocalEntityDetector detector;
  auto result = detector.detect(text, labels);
  require(result.ok(), result.error());
  return result.value();
}

std::string span(const std::string &text, const vault::EntityMatch &match) {
  return text.substr(match.start, match.end - match.start);
}

veilguard::net::HttpResponse net_ok(std::string body) {
  veilguard::net::HttpResponse response;
  response.status = 200;
  response.body = std::move(body);
  return response;
}

std::size_t count_label(const std::vector<vault::EntityMatch> &matches, const std::string &label) {
  return static_cast<std::size_t>(
      std::count_if(matches.begin(), matches.end(),
                    [&](const vault::EntityMatch &m) { return m.label == label; }));
}

class ThrowingDetector final : public vault::IEntityDetector {
public:
  [[nodiscard]] std::string_view name() const override { return "throwing"; }
  [[nodiscard]] common::Result<std::vector<vault::EntityMatch>>
  detect(const std::string &, const std::vector<std::string> &) override {
    throw 7;
  }
};

} // namespace

void register_detector_tests(std::vector<veilguard::tests::TestCase> &tests) {
  using veilguard::tests::TestCase;

  tests.push_back({"entity_kind_parsing", [] {
                     require(vault::parse_entity_kind("PERSON") == vault::EntityKind::Person,
                             "PERSON");
                     require(vault::parse_entity_kind("CREDIT_CARD") ==
                                 vault::EntityKind::CreditCard,
                             "CREDIT_CARD");
                     require(vault::parse_entity_kind("LOCATION") == vault::EntityKind::Other,
                             "analyzer-only labels map to Other");
                     require(!vault::parse_entity_kind("SHOE_SIZE").has_value(),
                             "unknown labels are rejected");
                     require(vault::entity_kind_name(vault::EntityKind::PhoneNumber) ==
                                 "PHONE_NUMBER",
                             "kind name");
                   }});

  tests.push_back({"entity_luhn_check", [] {
                     require(vault::luhn_valid("4111111111111111"), "visa test number");
                     require(vault::luhn_valid("5500005555555559"), "mastercard test number");
                     require(!vault::luhn_valid("4111111111111112"), "bad check digit");
                     require(!vault::luhn_valid("41111"), "too short");
                     require(!vault::luhn_valid("4111-1111-1111-1111"), "separators rejected");
                   }});

  tests.push_back({"local_detector_finds_person_and_email", [] {
                     const std::string text =
                         "My name is Sarah Connor and my email is sarah.connor@example.com";
                     const auto matches = local_detect(text);
                     require(matches.size() == 2, "expected two entities, got " +
                                                      std::to_string(matches.size()));
                     require(matches[0].label == "PERSON", "person first");
                     require(span(text, matches[0]) == "Sarah Connor", "person span");
                     require(matches[1].label == "EMAIL_ADDRESS", "email second");
                     require(span(text, matches[1]) == "sarah.connor@example.com", "email span");
                   }});

  tests.push_back({"local_detector_finds_us_and_indian_phones", [] {
                     const std::string text = "Call me at (415) 555-0132 or +91 98765 43210.";
                     const auto matches = local_detect(text);
                     require(count_label(matches, "PHONE_NUMBER") == 2, "two phones expected");
                     require(span(text, matches[0]) == "(415) 555-0132", "US phone span");
                     require(span(text, matches[1]) == "+91 98765 43210", "Indian phone span");
                   }});

  tests.push_back({"local_detector_requires_luhn_for_cards", [] {
                     const std::string valid = "Card 4111 1111 1111 1111 expires soon";
                     const auto hits = local_detect(valid);
                     require(count_label(hits, "CREDIT_CARD") == 1, "valid card detected");
                     require(span(valid, hits[0]) == "4111 1111 1111 1111", "card span");
                     require(hits[0].score == 1.0, "card score");

                     const auto misses = local_detect("Order 4111 1111 1111 1112 shipped");
                     require(count_label(misses, "CREDIT_CARD") == 0,
                             "Luhn failure is not a card");
                   }});

  tests.push_back({"local_detector_handles_long_single_token", [] {
                     const std::string blob(200000, 'a');
                     require(local_detect(blob).empty(), "a bare token holds no entity");

                     const std::string address = blob + "@example.com";
                     const auto emails = local_detect(address);
                     require(emails.size() == 1, "tail of the token is an address");
                     require(emails[0].end == address.size(), "address runs to the end");
                     require(emails[0].end - emails[0].start == 64 + 12,
                             "local part is capped at 64 bytes");

                     const std::string padded = "contact" + std::string(200000, ' ') + "Mx Zed";
                     require(local_detect(padded).empty(), "whitespace run is not a cue");
                   }});

  tests.push_back({"local_detector_given_name_without_cue", [] {
                     const std::string text = "Tell Priya Sharma the meeting moved";
                     const auto matches = local_detect(text);
                     require(matches.size() == 1, "one person");
                     require(span(text, matches[0]) == "Priya Sharma", "full name captured");
                   }});

  tests.push_back({"local_detector_ignores_neutral_text", [] {
                     require(local_detect("What is the weather like in the mountains today?")
                                 .empty(),
                             "no entities in neutral text");
                     require(local_detect("").empty(), "empty text");
                   }});

  tests.push_back({"local_detector_honors_requested_labels", [] {
                     const std::string text =
                         "My name is Sarah Connor and my email is sarah.connor@example.com";
                     const auto matches = local_detect(text, {"EMAIL_ADDRESS"});
                     require(matches.size() == 1 && matches[0].label == "EMAIL_ADDRESS",
                             "only emails requested");
                   }});

  tests.push_back({"local_detector_spans_never_overlap", [] {
                     const std::string text =
                         "Dear Alice, reach bob.smith@example.org or 415-555-0199; "
                         "card 5500 0055 5555 5559.";
                     const auto matches = local_detect(text);
                     for (std::size_t i = 1; i < matches.size(); ++i) {
                       require(matches[i - 1].end <= matches[i].start,
                               "spans must be sorted and disjoint");
                     }
                     require(count_label(matches, "EMAIL_ADDRESS") == 1, "email");
                     require(count_label(matches, "PHONE_NUMBER") == 1, "phone");
                     require(count_label(matches, "CREDIT_CARD") == 1, "card");
                     require(count_label(matches, "PERSON") == 1, "person");
                   }});

  tests.push_back({"presidio_response_converts_codepoint_offsets", [] {
                     const std::string text = "Hi Zo\xC3\xAB, mail zoe@example.com";
                     const std::string body =
                         R"([{"entity_type":"PERSON","start":3,"end":6,"score":0.85},)"
                         R"({"entity_type":"EMAIL_ADDRESS","start":13,"end":28,"score":1.0},)"
                         R"({"entity_type":"LOCATION","start":0,"end":2,"score":0.2}])";
                     const auto parsed = vault::parse_presidio_response(text, body, 0.5);
                     require(parsed.ok(), parsed.error());
                     const auto &matches = parsed.value();
                     require(matches.size() == 2, "low score entry dropped");
                     require(span(text, matches[0]) == "Zo\xC3\xAB", "multi-byte name span");
                     require(matches[0].kind == vault::EntityKind::Person, "person kind");
                     require(span(text, matches[1]) == "zoe@example.com", "email span");
                   }});

  tests.push_back({"presidio_response_rejects_bad_spans", [] {
                     const auto out_of_range = vault::parse_presidio_response(
                         "short", R"([{"entity_type":"PERSON","start":0,"end":99}])", 0.0);
                     require(!out_of_range.ok(), "span past the end must fail");
                     require(out_of_range.kind() == common::ErrorKind::DetectionFailure,
                             "detection failure kind");

                     const auto not_array =
                         vault::parse_presidio_response("short", R"({"error":"x"})", 0.0);
                     require(!not_array.ok(), "non-array body must fail");

                     const auto empty = vault::parse_presidio_response("short", "[]", 0.0);
                     require(empty.ok() && empty.value().empty(), "empty array is fine");
                   }});

  tests.push_back({"presidio_detector_posts_analyze_request", [] {
                     auto http = std::make_shared<vt::ScriptedHttpClient>();
                     http->set_response(
                         net_ok(R"([{"entity_type":"PERSON","start":0,"end":5,"score":0.9}])"));
                     vault::PresidioEntityDetector detector("http://analyzer/analyze", "en", 0.0,
                                                            1000, http);
                     const auto result = detector.detect("Alice says hi", {"PERSON"});
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "one match");
                     require(http->last_url == "http://analyzer/analyze", "endpoint used");
                     require(http->last_body.find(R"("entities":["PERSON"])") !=
                                 std::string::npos,
                             "labels sent");
                     require(http->last_body.find(R"("language":"en")") != std::string::npos,
                             "language sent");
                   }});

  tests.push_back({"presidio_detector_maps_transport_failures", [] {
                     auto http = std::make_shared<vt::ScriptedHttpClient>();
                     vault::PresidioEntityDetector detector("http://analyzer/analyze", "en", 0.0,
                                                            1000, http);

                     veilguard::net::HttpResponse timed_out;
                     timed_out.timeout = true;
                     http->set_response(timed_out);
                     const auto timeout = detector.detect("Alice", {"PERSON"});
                     require(!timeout.ok() && timeout.kind() == common::ErrorKind::Timeout,
                             "timeout kind");

                     veilguard::net::HttpResponse server_error;
                     server_error.status = 500;
                     server_error.body = "boom";
                     http->set_response(server_error);
                     const auto failed = detector.detect("Alice", {"PERSON"});
                     require(!failed.ok() &&
                                 failed.kind() == common::ErrorKind::DetectionFailure,
                             "HTTP 500 is a detection failure");
                   }});

  tests.push_back({"timed_detector_reports_timeout", [] {
                     auto slow = std::make_shared<vt::FakeDetector>();
                     slow->set_delay(std::chrono::milliseconds(300));
                     vault::TimedEntityDetector timed(slow, std::chrono::milliseconds(20));
                     const auto result = timed.detect("Alice", ALL_LABELS);
                     require(!result.ok(), "slow detector should time out");
                     require(result.kind() == common::ErrorKind::Timeout, "timeout kind");
                   }});

  tests.push_back({"timed_detector_passes_through_fast_results", [] {
                     auto fast = std::make_shared<vt::FakeDetector>();
                     fast->add_literal("Alice", "PERSON");
                     vault::TimedEntityDetector timed(fast, std::chrono::milliseconds(1000));
                     const auto result = timed.detect("Alice and Alice", ALL_LABELS);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "both occurrences reported");
                   }});

  tests.push_back({"timed_detector_contains_non_standard_exceptions", [] {
                     vault::TimedEntityDetector timed(std::make_shared<ThrowingDetector>(),
                                                      std::chrono::milliseconds(1000));
                     const auto result = timed.detect("Hi Sarah", ALL_LABELS);
                     require(!result.ok() &&
                                 result.kind() == common::ErrorKind::DetectionFailure,
                             "non-standard throw becomes a detection failure");
                     require(result.error().find("throwing") != std::string::npos,
                             "error names the backend: " + result.error());
                   }});

  tests.push_back({"create_detector_selects_backend", [] {
                     veilguard::config::Config config;
                     auto local = vault::create_detector(config);
                     require(local.ok(), local.error());
                     require(local.value()->name() == "local", "local by default");

                     config.detector.backend = "presidio";
                     auto presidio =
                         vault::create_detector(config, std::make_shared<vt::ScriptedHttpClient>());
                     require(presidio.ok(), presidio.error());
                     require(presidio.value()->name() == "presidio", "presidio backend");

                     config.detector.backend = "spacy";
                     const auto unknown = vault::create_detector(config);
                     require(!unknown.ok() &&
                                 unknown.kind() == common::ErrorKind::InvalidArgument,
                             "unknown backend rejected");
                   }});
}
