#include "veilguard/vault/placeholder.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/common/random.hpp"

#include <array>
#include <string_view>

namespace veilguard::vault {

namespace {

struct NameTable {
  const std::string_view *first;
  std::size_t first_count;
  const std::string_view *last;
  std::size_t last_count;
};

constexpr std::array<std::string_view, 20> US_FIRST = {
    "James",  "Olivia", "Liam",   "Emma",  "Noah",    "Ava",     "Ethan",
    "Sophia", "Mason",  "Harper", "Lucas", "Amelia",  "Henry",   "Evelyn",
    "Jack",   "Chloe",  "Owen",   "Grace", "Wyatt",   "Hazel",
};

constexpr std::array<std::string_view, 20> US_LAST = {
    "Smith",  "Johnson", "Williams", "Brown",  "Jones",  "Miller",   "Davis",
    "Garcia", "Wilson",  "Anderson", "Taylor", "Thomas", "Moore",    "Martin",
    "Clark",  "Lewis",   "Walker",   "Hall",   "Young",  "Harrison",
};

constexpr std::array<std::string_view, 20> IN_FIRST = {
    "Aarav", "Vivaan", "Aditya", "Arjun",  "Reyansh", "Kabir",  "Ishaan",
    "Riya",  "Ananya", "Diya",   "Saanvi", "Myra",    "Kiara",  "Anika",
    "Rohan", "Nikhil", "Tanvi",  "Meera",  "Kunal",   "Pallavi",
};

constexpr std::array<std::string_view, 20> IN_LAST = {
    "Sharma", "Verma",  "Iyer",  "Reddy",   "Nair",   "Gupta",  "Mehta",
    "Kapoor", "Joshi",  "Rao",   "Patel",   "Desai",  "Bhat",   "Menon",
    "Malhotra", "Chopra", "Kulkarni", "Pillai", "Banerjee", "Chatterjee",
};

constexpr std::array<std::string_view, 3> EMAIL_DOMAINS = {"example.com", "example.org",
                                                           "example.net"};

NameTable pick_table() {
  if (common::random_below(2) == 0) {
    return NameTable{US_FIRST.data(), US_FIRST.size(), US_LAST.data(), US_LAST.size()};
  }
  return NameTable{IN_FIRST.data(), IN_FIRST.size(), IN_LAST.data(), IN_LAST.size()};
}

char random_digit(const char min = '0') {
  return static_cast<char>(min + common::random_below(static_cast<std::uint64_t>('9' - min + 1)));
}

std::string random_digits(const std::size_t count) {
  std::string out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(random_digit());
  }
  return out;
}

char luhn_check_digit(const std::string &payload) {
  int sum = 0;
  bool double_it = true;
  for (auto it = payload.rbegin(); it != payload.rend(); ++it) {
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
  return static_cast<char>('0' + (10 - sum % 10) % 10);
}

} // namespace

std::string SyntheticPlaceholderGenerator::generate(const EntityKind kind,
                                                    const std::string &label) {
  switch (kind) {
  case EntityKind::Person:
    return person_name();
  case EntityKind::EmailAddress:
    return email_address();
  case EntityKind::PhoneNumber:
    return phone_number();
  case EntityKind::CreditCard:
    return card_number();
  case EntityKind::Other:
    break;
  }
  return tagged(label);
}

std::string SyntheticPlaceholderGenerator::person_name() {
  const auto table = pick_table();
  const auto first = table.first[common::random_below(table.first_count)];
  const auto last = table.last[common::random_below(table.last_count)];
  return std::string(first) + " " + std::string(last);
}

std::string SyntheticPlaceholderGenerator::email_address() {
  const auto table = pick_table();
  const std::string first =
      common::to_lower(std::string(table.first[common::random_below(table.first_count)]));
  const std::string last =
      common::to_lower(std::string(table.last[common::random_below(table.last_count)]));
  const auto domain = EMAIL_DOMAINS[common::random_below(EMAIL_DOMAINS.size())];
  return first + "." + last + random_digits(2) + "@" + std::string(domain);
}

std::string SyntheticPlaceholderGenerator::phone_number() {
  if (common::random_below(2) == 0) {
    // 555 exchange numbers are reserved for fiction.
    std::string area;
    area.push_back(random_digit('2'));
    area += random_digits(2);
    return "(" + area + ") 555-" + random_digits(4);
  }
  return "+91 9" + random_digits(4) + " " + random_digits(5);
}

std::string SyntheticPlaceholderGenerator::card_number() {
  const std::string payload = "4" + random_digits(14);
  return payload + luhn_check_digit(payload);
}

std::string SyntheticPlaceholderGenerator::tagged(const std::string &label) {
  std::string tag = common::to_upper(common::trim(label));
  if (tag.empty()) {
    tag = "ENTITY";
  }
  return "<" + tag + "_" + common::random_hex(4) + ">";
}

} // namespace veilguard::vault
