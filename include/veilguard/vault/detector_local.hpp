#pragma once

#include "veilguard/vault/detector.hpp"

namespace veilguard::vault {

/// Offline recognizer: regexes for emails and phone numbers, Luhn-checked
/// card numbers, and person names found after introduction cues or starting
/// with a known given name. Output spans never overlap.
class LocalEntityDetector final : public IEntityDetector {
public:
  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] common::Result<std::vector<EntityMatch>>
  detect(const std::string &text, const std::vector<std::string> &labels) override;
};

} // namespace veilguard::vault
