#include "veilguard/vault/detector_local.hpp"

#include "veilguard/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace veilguard::vault {

namespace {

constexpr std::array<std::string_view, 72> GIVEN_NAMES = {
    // en_US
    "james", "john", "robert", "michael", "william", "david", "richard", "joseph", "thomas",
    "charles", "daniel", "matthew", "mark", "steven", "paul", "andrew", "kevin", "brian",
    "mary", "patricia", "jennifer", "linda", "elizabeth", "barbara", "susan", "jessica",
    "sarah", "karen", "nancy", "lisa", "emily", "alice", "bob", "emma", "olivia", "sophia",
    // en_IN
    "aarav", "arjun", "vikram", "rahul", "rohan", "amit", "sanjay", "deepak", "suresh",
    "ravi", "aditya", "ishaan", "vivek", "rajesh", "anil", "karthik", "manoj", "nikhil",
    "priya", "ananya", "sneha", "pooja", "neha", "kavya", "meera", "lakshmi", "divya",
    "anjali", "deepika", "shreya", "aishwarya", "swati", "nisha", "sunita", "rekha", "geeta",
};

// libstdc++ matches by recursion, one frame per character a quantifier consumes.
// Every repeat below is bounded so a long token cannot exhaust the stack.
const std::regex &email_regex() {
  static const std::regex re(
      R"([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(?:\.[A-Za-z0-9-]{1,63}){0,6}\.[A-Za-z]{2,24})");
  return re;
}

const std::regex &card_regex() {
  static const std::regex re(R"(\b(?:\d[ -]?){12,18}\d\b)");
  return re;
}

const std::vector<std::regex> &phone_regexes() {
  static const std::vector<std::regex> regexes = {
      std::regex(R"((?:\+91[\s-]?|\b)[6-9]\d{4}[\s-]?\d{5}\b)"),
      std::regex(R"((?:\+1[\s.-]?)?(?:\(\d{3}\)\s?|\b\d{3}[\s.-])\d{3}[\s.-]\d{4}\b)"),
      std::regex(R"(\+\d{1,3}[\s.-]?\d{2,4}[\s.-]\d{3,4}[\s.-]\d{3,4}\b)"),
  };
  return regexes;
}

const std::regex &person_cue_regex() {
  static const std::regex re(
      R"(\b(?:my name is|name is|i am|i'm|this is|contact|call|meet|dear|named|ask for|mr\.?|mrs\.?|ms\.?|dr\.?)\s{1,8})",
      std::regex::icase);
  return re;
}

bool wants(const std::vector<std::string> &labels, const std::string_view label) {
  return std::find(labels.begin(), labels.end(), label) != labels.end();
}

bool overlaps_any(const std::vector<EntityMatch> &taken, const std::size_t start,
                  const std::size_t end) {
  return std::any_of(taken.begin(), taken.end(), [&](const EntityMatch &m) {
    return start < m.end && m.start < end;
  });
}

void add_match(std::vector<EntityMatch> &out, const EntityKind kind, const std::size_t start,
               const std::size_t end, const double score) {
  if (end <= start || overlaps_any(out, start, end)) {
    return;
  }
  out.push_back(EntityMatch{.kind = kind,
                            .label = std::string(entity_kind_name(kind)),
                            .start = start,
                            .end = end,
                            .score = score});
}

void collect_regex(const std::string &text, const std::regex &re, const EntityKind kind,
                   const double score, std::vector<EntityMatch> &out) {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator();
       ++it) {
    const auto start = static_cast<std::size_t>(it->position(0));
    add_match(out, kind, start, start + static_cast<std::size_t>(it->length(0)), score);
  }
}

void collect_cards(const std::string &text, std::vector<EntityMatch> &out) {
  const auto &re = card_regex();
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator();
       ++it) {
    std::string digits;
    for (const char ch : it->str(0)) {
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        digits.push_back(ch);
      }
    }
    if (digits.size() >= 13 && luhn_valid(digits)) {
      const auto start = static_cast<std::size_t>(it->position(0));
      add_match(out, EntityKind::CreditCard, start,
                start + static_cast<std::size_t>(it->length(0)), 1.0);
    }
  }
}

bool is_upper(const char ch) { return ch >= 'A' && ch <= 'Z'; }
bool is_lower(const char ch) { return ch >= 'a' && ch <= 'z'; }

/// Length of a capitalized word at `pos` ("Sarah", "O'Neil", "Mary-Jane"), 0 if none.
std::size_t capitalized_word(const std::string &text, const std::size_t pos) {
  if (pos >= text.size() || !is_upper(text[pos])) {
    return 0;
  }
  if (pos > 0 && std::isalnum(static_cast<unsigned char>(text[pos - 1])) != 0) {
    return 0;
  }
  std::size_t i = pos + 1;
  std::size_t lower = 0;
  while (i < text.size()) {
    if (is_lower(text[i])) {
      ++lower;
      ++i;
    } else if ((text[i] == '\'' || text[i] == '-') && i + 1 < text.size() &&
               (is_upper(text[i + 1]) || is_lower(text[i + 1]))) {
      i += 2;
    } else {
      break;
    }
  }
  if (lower == 0) {
    return 0;
  }
  if (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) != 0 ||
                          static_cast<unsigned char>(text[i]) >= 0x80U)) {
    return 0;
  }
  return i - pos;
}

/// End offset of a run of up to three capitalized words separated by single spaces.
std::size_t capitalized_run(const std::string &text, const std::size_t pos) {
  std::size_t end = pos;
  std::size_t words = 0;
  std::size_t cursor = pos;
  while (words < 3) {
    const std::size_t len = capitalized_word(text, cursor);
    if (len == 0) {
      break;
    }
    end = cursor + len;
    ++words;
    if (end + 1 >= text.size() || text[end] != ' ') {
      break;
    }
    cursor = end + 1;
  }
  return end;
}

bool is_given_name(const std::string &word) {
  const std::string lower = common::to_lower(word);
  return std::find(GIVEN_NAMES.begin(), GIVEN_NAMES.end(), lower) != GIVEN_NAMES.end();
}

void collect_persons(const std::string &text, std::vector<EntityMatch> &out) {
  const auto &cue = person_cue_regex();
  for (auto it = std::sregex_iterator(text.begin(), text.end(), cue); it != std::sregex_iterator();
       ++it) {
    const auto start = static_cast<std::size_t>(it->position(0) + it->length(0));
    const std::size_t end = capitalized_run(text, start);
    if (end > start) {
      add_match(out, EntityKind::Person, start, end, 0.85);
    }
  }

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t len = capitalized_word(text, pos);
    if (len == 0) {
      ++pos;
      continue;
    }
    if (is_given_name(text.substr(pos, len))) {
      const std::size_t end = capitalized_run(text, pos);
      add_match(out, EntityKind::Person, pos, end, 0.6);
      pos = end;
    } else {
      pos += len;
    }
  }
}

} // namespace

common::Result<std::vector<EntityMatch>>
LocalEntityDetector::detect(const std::string &text, const std::vector<std::string> &labels) {
  std::vector<EntityMatch> out;
  if (text.empty()) {
    return common::Result<std::vector<EntityMatch>>::success(std::move(out));
  }

  try {
    // Higher-confidence recognizers claim their spans first.
    if (wants(labels, "EMAIL_ADDRESS")) {
      collect_regex(text, email_regex(), EntityKind::EmailAddress, 1.0, out);
    }
    if (wants(labels, "CREDIT_CARD")) {
      collect_cards(text, out);
    }
    if (wants(labels, "PHONE_NUMBER")) {
      for (const auto &re : phone_regexes()) {
        collect_regex(text, re, EntityKind::PhoneNumber, 0.75, out);
      }
    }
    if (wants(labels, "PERSON")) {
      collect_persons(text, out);
    }
  } catch (const std::regex_error &ex) {
    return common::Result<std::vector<EntityMatch>>::failure(
        common::ErrorKind::DetectionFailure, std::string("local detector: ") + ex.what());
  }

  std::sort(out.begin(), out.end(),
            [](const EntityMatch &a, const EntityMatch &b) { return a.start < b.start; });
  return common::Result<std::vector<EntityMatch>>::success(std::move(out));
}

} // namespace veilguard::vault
