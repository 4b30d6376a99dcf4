#pragma once

#include "veilguard/common/result.hpp"
#include "veilguard/config/schema.hpp"
#include "veilguard/vault/detector.hpp"
#include "veilguard/vault/mapping_store.hpp"
#include "veilguard/vault/placeholder.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace veilguard::vault {

struct EngineOptions {
  std::chrono::seconds ttl{1800};
  std::vector<std::string> supported_kinds = {"PERSON", "EMAIL_ADDRESS", "PHONE_NUMBER",
                                              "CREDIT_CARD"};
  std::uint32_t placeholder_attempts = 8;
};

[[nodiscard]] EngineOptions engine_options_from_config(const config::VaultConfig &config);

/// Reversible redaction: detect -> substitute -> record, and the inverse.
///
/// Matches are applied back to front so earlier offsets stay valid. When the
/// detector reports overlapping spans the later-processed (lower-offset) one
/// is clamped to the rewritten buffer and may cut into an already substituted
/// placeholder; that is a detector-quality problem, not undefined behavior.
///
/// Every mapping is written before the session set is merged, so an
/// interrupted call never exposes a placeholder without its mapping.
class AnonymizationEngine {
public:
  AnonymizationEngine(std::shared_ptr<IEntityDetector> detector,
                      std::shared_ptr<IPlaceholderGenerator> generator,
                      std::shared_ptr<IMappingStore> store, EngineOptions options = {});

  /// Fails with DetectionFailure, Timeout or StorageUnavailable rather than
  /// ever returning text that might still carry unredacted PII.
  [[nodiscard]] common::Result<std::string> anonymize(const std::string &text,
                                                      const std::string &session_id);

  /// Never fails. Unknown sessions, expired mappings and store faults all
  /// leave the affected placeholders in place.
  [[nodiscard]] std::string deanonymize(const std::string &text, const std::string &session_id);

  [[nodiscard]] common::Status clear_storage();

  [[nodiscard]] IMappingStore &store() { return *store_; }
  [[nodiscard]] const EngineOptions &options() const { return options_; }

private:
  [[nodiscard]] std::string unique_placeholder(const EntityMatch &match, const std::string &text,
                                               const std::vector<std::string> &issued,
                                               const std::vector<std::string> &existing);

  std::shared_ptr<IEntityDetector> detector_;
  std::shared_ptr<IPlaceholderGenerator> generator_;
  std::shared_ptr<IMappingStore> store_;
  EngineOptions options_;
};

} // namespace veilguard::vault
