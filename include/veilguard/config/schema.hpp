#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace veilguard::config {

/// Upper bound for vault.ttl_seconds (100 years). Keeps an expiry stamp of
/// now + ttl, in milliseconds, well inside int64.
inline constexpr std::uint64_t MAX_TTL_SECONDS = 100ULL * 365ULL * 24ULL * 3600ULL;

struct VaultConfig {
  std::string cache_directory = "~/.veilguard/vault";
  std::uint64_t ttl_seconds = 1800;
  std::uint64_t size_limit_bytes = 100ULL * 1024ULL * 1024ULL;
  std::vector<std::string> supported_entity_kinds = {"PERSON", "EMAIL_ADDRESS", "PHONE_NUMBER",
                                                     "CREDIT_CARD"};
  std::uint32_t placeholder_attempts = 8;
};

struct DetectorConfig {
  std::string backend = "local";
  std::string endpoint = "http://127.0.0.1:5002/analyze";
  std::string language = "en";
  double min_score = 0.0;
  std::uint64_t timeout_ms = 5000;
};

struct ScannerConfig {
  std::vector<std::string> scan_patterns = {
      R"(ignore\s+previous\s+instructions)",
      R"(ignore\s+all\s+previous\s+instructions)",
      R"(system\s+override)",
      R"(you\s+are\s+now)",
      R"(jailbreak)",
      R"(developer\s+mode)",
      R"(do\s+anything\s+now)",
      R"(always\s+answer)",
      R"(unfiltered)",
      R"(dan\s+mode)",
  };
  std::string classifier_backend = "lexicon";
  std::string classifier_endpoint;
  std::string classifier_api_key;
  std::vector<std::string> hostile_labels = {"NEGATIVE"};
  double classifier_threshold = 0.99;
  std::string failure_policy = "open";
  std::uint64_t classifier_timeout_ms = 3000;
};

struct ObservabilityConfig {
  std::string backend = "log";
  /// debug | info | warn | error; lines below it are dropped by the log backend.
  std::string log_level = "info";
};

struct Config {
  VaultConfig vault;
  DetectorConfig detector;
  ScannerConfig scanner;
  ObservabilityConfig observability;
};

} // namespace veilguard::config
