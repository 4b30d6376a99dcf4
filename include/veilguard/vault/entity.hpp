#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace veilguard::vault {

enum class EntityKind {
  Person,
  EmailAddress,
  PhoneNumber,
  CreditCard,
  Other,
};

/// Half-open byte range [start, end) into the detector's input text.
struct EntityMatch {
  EntityKind kind = EntityKind::Other;
  std::string label;
  std::size_t start = 0;
  std::size_t end = 0;
  double score = 1.0;
};

[[nodiscard]] std::string_view entity_kind_name(EntityKind kind);

/// Maps a detector label (PERSON, EMAIL_ADDRESS, ...) to a kind. Recognized
/// labels without a dedicated generator map to EntityKind::Other; labels the
/// vault has never heard of yield std::nullopt.
[[nodiscard]] std::optional<EntityKind> parse_entity_kind(std::string_view label);

[[nodiscard]] bool luhn_valid(std::string_view digits);

} // namespace veilguard::vault
