#pragma once

#include "veilguard/vault/entity.hpp"

#include <string>

namespace veilguard::vault {

/// Produces synthetic stand-ins shaped like the entity they replace.
class IPlaceholderGenerator {
public:
  virtual ~IPlaceholderGenerator() = default;
  [[nodiscard]] virtual std::string generate(EntityKind kind, const std::string &label) = 0;
};

/// Names from en_US and en_IN tables, example.* emails, US or Indian phone
/// shapes and Luhn-valid cards. Kinds without a shape get `<LABEL_xxxxxxxx>`.
class SyntheticPlaceholderGenerator final : public IPlaceholderGenerator {
public:
  [[nodiscard]] std::string generate(EntityKind kind, const std::string &label) override;

  [[nodiscard]] static std::string person_name();
  [[nodiscard]] static std::string email_address();
  [[nodiscard]] static std::string phone_number();
  [[nodiscard]] static std::string card_number();
  [[nodiscard]] static std::string tagged(const std::string &label);
};

} // namespace veilguard::vault
