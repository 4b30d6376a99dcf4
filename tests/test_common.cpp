#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "veilguard/common/deadline.hpp"
#include "veilguard/common/fs.hpp"
#include "veilguard/common/json_util.hpp"
#include "veilguard/common/random.hpp"
#include "veilguard/common/result.hpp"
#include "veilguard/common/toml.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>

namespace {

using veilguard::tests::require;

bool is_lower_hex(const char ch) { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'); }

} // namespace

void register_common_tests(std::vector<veilguard::tests::TestCase> &tests) {
  using veilguard::tests::TestCase;
  namespace common = veilguard::common;

  tests.push_back({"common_result_carries_error_kind", [] {
                     const auto failed = common::Result<int>::failure(
                         common::ErrorKind::StorageUnavailable, "db gone");
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.kind() == common::ErrorKind::StorageUnavailable,
                             "kind should be preserved");
                     require(failed.status().kind() == common::ErrorKind::StorageUnavailable,
                             "status should keep kind");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");
                     require(common::error_kind_name(common::ErrorKind::Timeout) == "timeout",
                             "timeout kind name");
                   }});

  tests.push_back({"common_toml_sections_and_scalars", [] {
                     const auto doc = common::parse_toml("top = 1\n"
                                                         "[vault]\n"
                                                         "ttl_seconds = 60 # one minute\n"
                                                         "cache_directory = \"/tmp/v#1\"\n"
                                                         "[scanner]\n"
                                                         "classifier_threshold = 0.75\n"
                                                         "strict = true\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_u64("top", 0) == 1, "top-level key");
                     require(doc.value().get_u64("vault.ttl_seconds", 0) == 60,
                             "inline comment should be stripped");
                     require(doc.value().get_string("vault.cache_directory") == "/tmp/v#1",
                             "hash inside quotes is not a comment");
                     require(doc.value().get_double("scanner.classifier_threshold", 0.0) == 0.75,
                             "double value");
                     require(doc.value().get_u64("vault.missing", 7) == 7, "fallback");
                     require(doc.value().mismatched_keys.empty(), "nothing mismatched yet");
                     require(doc.value().get_string("scanner.strict", "x") == "x",
                             "bare value is not a string");
                     require(doc.value().get_u64("vault.cache_directory", 3) == 3,
                             "string is not a number");
                     require(doc.value().mismatched_keys ==
                                 std::vector<std::string>{"scanner.strict",
                                                          "vault.cache_directory"},
                             "wrong-typed keys are remembered");
                   }});

  tests.push_back({"common_toml_multiline_literal_array", [] {
                     const auto doc = common::parse_toml("[scanner]\n"
                                                         "scan_patterns = [\n"
                                                         "  'ignore\\s+previous',\n"
                                                         "  \"dan\\\\s+mode\",\n"
                                                         "]\n");
                     require(doc.ok(), doc.error());
                     const auto patterns = doc.value().get_string_array("scanner.scan_patterns");
                     require(patterns.size() == 2, "two patterns expected");
                     require(patterns[0] == "ignore\\s+previous",
                             "literal strings keep backslashes");
                     require(patterns[1] == "dan\\s+mode", "basic strings unescape backslashes");
                   }});

  tests.push_back({"common_toml_rejects_malformed_lines", [] {
                     require(!common::parse_toml("[vault]\njust words\n").ok(),
                             "line without = should fail");
                     require(!common::parse_toml("[]\n").ok(), "empty section should fail");
                     const auto unterminated = common::parse_toml("list = ['a',\n'b'\n");
                     require(!unterminated.ok(), "unterminated array should fail");
                     require(unterminated.kind() == common::ErrorKind::InvalidArgument,
                             "parse errors are invalid arguments");
                   }});

  tests.push_back({"common_json_escape_survives_string_read", [] {
                     const std::string raw = "line \"one\"\nline\ttwo \\ done";
                     const std::string object = "{\"text\":\"" + common::json_escape(raw) + "\"}";
                     require(common::json_get_string(object, "text") == raw,
                             "escaped value reads back unchanged");
                     require(common::json_get_string(R"({"name":"caf\u00e9"})", "name") ==
                                 "caf\xC3\xA9",
                             "\\u escapes decode to UTF-8");
                     require(common::json_string_array({"PERSON", "CREDIT_CARD"}) ==
                                 R"(["PERSON","CREDIT_CARD"])",
                             "string array literal");
                   }});

  tests.push_back({"common_json_field_extraction", [] {
                     const std::string body =
                         R"([{"entity_type":"PERSON","start":11,"end":23,"score":0.85},)"
                         R"( "noise", [1, 2],)"
                         R"( {"entity_type":"EMAIL_ADDRESS","note":"a } b","start":40,"score":1.0}])";
                     const auto objects = common::json_array_objects(body);
                     require(objects.size() == 2, "two objects expected");
                     require(common::json_get_string(objects[0], "entity_type") == "PERSON",
                             "string field");
                     require(common::json_get_index(objects[0], "start") == std::size_t{11},
                             "index field");
                     require(common::json_get_double(objects[0], "score") == 0.85, "score field");
                     require(common::json_get_string(objects[1], "note") == "a } b",
                             "braces inside strings do not split objects");
                     require(!common::json_get_double(objects[1], "missing").has_value(),
                             "missing field");
                     require(!common::json_get_index(R"({"start":-1})", "start").has_value(),
                             "negative index rejected");
                     require(!common::json_get_double(R"({"score":"high"})", "score").has_value(),
                             "quoted number rejected");
                   }});

  tests.push_back({"common_json_unwrap_batch", [] {
                     require(common::json_unwrap_batch(R"( [[{"a":1}], [{"b":2}]])") ==
                                 std::optional<std::string>(R"([{"a":1}])"),
                             "first batch entry");
                     require(common::json_unwrap_batch(R"([{"a":1}])") ==
                                 std::optional<std::string>(R"([{"a":1}])"),
                             "flat array unchanged");
                     require(!common::json_unwrap_batch(R"({"a":1})").has_value(), "object");
                     require(!common::json_unwrap_batch("[[{").has_value(), "unterminated");
                   }});

  tests.push_back({"common_replace_all_counts_replacements", [] {
                     std::string text = "Mia met Mia at Mia's";
                     const auto count = common::replace_all(text, "Mia", "Sarah");
                     require(count == 3, "three replacements expected");
                     require(text == "Sarah met Sarah at Sarah's", "all occurrences replaced");

                     std::string untouched = "nothing here";
                     require(common::replace_all(untouched, "", "x") == 0,
                             "empty needle replaces nothing");
                     require(untouched == "nothing here", "text unchanged");
                   }});

  tests.push_back({"common_string_helpers", [] {
                     require(common::trim("  hi \n") == "hi", "trim");
                     require(common::to_upper("email_address") == "EMAIL_ADDRESS", "to_upper");
                     require(common::to_lower("NEGATIVE") == "negative", "to_lower");
                     require(common::starts_with("https://x", "https://"), "starts_with");
                   }});

  tests.push_back({"common_expand_path_home_and_env", [] {
                     veilguard::testing::EnvGuard home("HOME", std::string("/home/vg"));
                     veilguard::testing::EnvGuard dir("VG_TEST_DIR", std::string("data"));
                     veilguard::testing::EnvGuard unset("VG_TEST_UNSET", std::nullopt);
                     require(common::expand_path("~/vault") == "/home/vg/vault", "tilde");
                     require(common::expand_path("~other/x") == "~other/x",
                             "only a bare tilde is the home directory");
                     require(common::expand_path("/srv/${VG_TEST_DIR}/v") == "/srv/data/v",
                             "braced variable");
                     require(common::expand_path("/srv/$VG_TEST_DIR") == "/srv/data",
                             "bare variable");
                     require(common::expand_path("/a/${VG_TEST_UNSET}b") == "/a/b",
                             "unset variable is empty");
                   }});

  tests.push_back({"common_random_uuid_v4_format", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 50; ++i) {
                       const auto uuid = common::random_uuid_v4();
                       require(uuid.size() == 36, "uuid length");
                       require(uuid[8] == '-' && uuid[13] == '-' && uuid[18] == '-' &&
                                   uuid[23] == '-',
                               "uuid dashes");
                       require(uuid[14] == '4', "version nibble");
                       require(uuid[19] == '8' || uuid[19] == '9' || uuid[19] == 'a' ||
                                   uuid[19] == 'b',
                               "variant nibble");
                       for (std::size_t j = 0; j < uuid.size(); ++j) {
                         if (j == 8 || j == 13 || j == 18 || j == 23) {
                           continue;
                         }
                         require(is_lower_hex(uuid[j]), "uuid should be lowercase hex");
                       }
                       seen.insert(uuid);
                     }
                     require(seen.size() == 50, "uuids should be unique");
                   }});

  tests.push_back({"common_random_below_stays_in_range", [] {
                     for (int i = 0; i < 500; ++i) {
                       require(common::random_below(7) < 7, "value out of range");
                     }
                     require(common::random_below(1) == 0, "bound 1 yields 0");
                     require(common::random_hex(4).size() == 8, "hex length");
                   }});

  tests.push_back({"common_deadline_returns_value_in_time", [] {
                     const auto value = common::run_with_deadline<int>(
                         [] { return 42; }, std::chrono::milliseconds(1000));
                     require(value.has_value() && *value == 42, "fast call should complete");

                     const auto inline_value = common::run_with_deadline<int>(
                         [] { return 7; }, std::chrono::milliseconds(0));
                     require(inline_value.has_value() && *inline_value == 7,
                             "zero timeout runs inline");
                   }});

  tests.push_back({"common_deadline_expires_on_slow_call", [] {
                     const auto value = common::run_with_deadline<int>(
                         [] {
                           std::this_thread::sleep_for(std::chrono::milliseconds(300));
                           return 1;
                         },
                         std::chrono::milliseconds(20));
                     require(!value.has_value(), "slow call should miss the deadline");
                   }});

  tests.push_back({"common_deadline_caps_stalled_workers", [] {
                     const auto drained = [] {
                       for (int i = 0; i < 1000 && common::deadline_workers_in_flight() > 0; ++i) {
                         std::this_thread::sleep_for(std::chrono::milliseconds(10));
                       }
                       return common::deadline_workers_in_flight() == 0;
                     };
                     require(drained(), "earlier workers should finish");

                     std::promise<void> gate;
                     const std::shared_future<void> open = gate.get_future().share();
                     for (std::size_t i = 0; i < common::MAX_DEADLINE_WORKERS; ++i) {
                       const auto value = common::run_with_deadline<int>(
                           [open] {
                             open.wait();
                             return 1;
                           },
                           std::chrono::milliseconds(1));
                       require(!value.has_value(), "gated call misses its deadline");
                     }
                     require(common::deadline_workers_in_flight() == common::MAX_DEADLINE_WORKERS,
                             "every stalled worker is counted");

                     auto ran = std::make_shared<std::atomic<bool>>(false);
                     const auto refused = common::run_with_deadline<int>(
                         [ran] {
                           ran->store(true);
                           return 2;
                         },
                         std::chrono::milliseconds(1000));
                     require(!refused.has_value(), "saturated pool refuses new work");

                     gate.set_value();
                     require(drained(), "released workers exit");
                     require(!ran->load(), "refused work never starts");

                     const auto after = common::run_with_deadline<int>(
                         [] { return 3; }, std::chrono::milliseconds(1000));
                     require(after.has_value() && *after == 3, "capacity returns once drained");
                   }});

  tests.push_back({"common_deadline_rethrows", [] {
                     bool threw = false;
                     try {
                       (void)common::run_with_deadline<int>(
                           []() -> int { throw std::runtime_error("boom"); },
                           std::chrono::milliseconds(1000));
                     } catch (const std::runtime_error &) {
                       threw = true;
                     }
                     require(threw, "worker exception should surface");
                   }});
}
