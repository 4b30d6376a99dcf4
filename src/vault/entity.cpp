#include "veilguard/vault/entity.hpp"

#include <array>
#include <cctype>

namespace veilguard::vault {

namespace {

constexpr std::array<std::string_view, 14> OTHER_LABELS = {
    "LOCATION",       "DATE_TIME",         "NRP",           "IP_ADDRESS", "URL",
    "IBAN_CODE",      "CRYPTO",            "MEDICAL_LICENSE", "US_SSN",   "US_PASSPORT",
    "US_BANK_NUMBER", "US_DRIVER_LICENSE", "IN_PAN",        "IN_AADHAAR",
};

} // namespace

std::string_view entity_kind_name(const EntityKind kind) {
  switch (kind) {
  case EntityKind::Person:
    return "PERSON";
  case EntityKind::EmailAddress:
    return "EMAIL_ADDRESS";
  case EntityKind::PhoneNumber:
    return "PHONE_NUMBER";
  case EntityKind::CreditCard:
    return "CREDIT_CARD";
  case EntityKind::Other:
    return "OTHER";
  }
  return "OTHER";
}

std::optional<EntityKind> parse_entity_kind(const std::string_view label) {
  if (label == "PERSON") {
    return EntityKind::Person;
  }
  if (label == "EMAIL_ADDRESS") {
    return EntityKind::EmailAddress;
  }
  if (label == "PHONE_NUMBER") {
    return EntityKind::PhoneNumber;
  }
  if (label == "CREDIT_CARD") {
    return EntityKind::CreditCard;
  }
  for (const auto other : OTHER_LABELS) {
    if (label == other) {
      return EntityKind::Other;
    }
  }
  return std::nullopt;
}

bool luhn_valid(const std::string_view digits) {
  if (digits.size() < 12 || digits.size() > 19) {
    return false;
  }
  int sum = 0;
  bool double_it = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    if (std::isdigit(static_cast<unsigned char>(*it)) == 0) {
      return false;
    }
    int digit = *it - '0';
    if (double_it) {
      digit *= 2;
      if (digit > 9) {
        digit -= 9;
      }
    }
    sum += digit;
    double_it = !double_it;
  }
  return sum % 10 == 0;
}

} // namespace veilguard::vault
