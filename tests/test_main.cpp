#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_config_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_observability_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_detector_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_placeholder_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_store_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_engine_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_scanner_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_pipeline_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_cli_tests(std::vector<veilguard::tests::TestCase> &tests);
void register_vault_integration_tests(std::vector<veilguard::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<veilguard::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_detector_tests(tests);
  register_placeholder_tests(tests);
  register_store_tests(tests);
  register_engine_tests(tests);
  register_scanner_tests(tests);
  register_pipeline_tests(tests);
  register_cli_tests(tests);
  register_vault_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
