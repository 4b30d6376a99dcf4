#include "veilguard/common/toml.hpp"

#include "veilguard/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace veilguard::common {

namespace {

// Tracks whether a position is inside a "basic" or 'literal' string.
struct QuoteState {
  char open = '\0';
  bool escaped = false;

  bool step(const char ch) {
    if (open == '\0') {
      if (ch == '"' || ch == '\'') {
        open = ch;
      }
      return open != '\0';
    }
    if (open == '"') {
      if (escaped) {
        escaped = false;
        return true;
      }
      if (ch == '\\') {
        escaped = true;
        return true;
      }
    }
    if (ch == open) {
      open = '\0';
      return true;
    }
    return true;
  }
};

std::string strip_comment(const std::string &line) {
  QuoteState state;
  std::string output;
  output.reserve(line.size());

  for (const char ch : line) {
    const bool was_quoted = state.open != '\0';
    state.step(ch);
    if (!was_quoted && state.open == '\0' && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

int bracket_balance(const std::string &value) {
  QuoteState state;
  int depth = 0;
  for (const char ch : value) {
    const bool was_quoted = state.open != '\0';
    state.step(ch);
    if (was_quoted || state.open != '\0') {
      continue;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  QuoteState state;

  for (const char ch : array_value) {
    const bool was_quoted = state.open != '\0';
    state.step(ch);
    if (!was_quoted && state.open == '\0' && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unescape_basic(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool escaped = false;
  for (const char ch : raw) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

/// Quoted TOML string -> its contents; nullopt for anything unquoted.
std::optional<std::string> unquote(const std::string &value) {
  if (value.size() < 2 || value.front() != value.back()) {
    return std::nullopt;
  }
  if (value.front() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.front() == '"') {
    return unescape_basic(value.substr(1, value.size() - 2));
  }
  return std::nullopt;
}

} // namespace

const std::string *TomlDocument::raw(const std::string &key) const {
  const auto it = values.find(key);
  return it == values.end() ? nullptr : &it->second;
}

void TomlDocument::mismatch(const std::string &key) const {
  if (std::find(mismatched_keys.begin(), mismatched_keys.end(), key) == mismatched_keys.end()) {
    mismatched_keys.push_back(key);
  }
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const std::string *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  const auto text = unquote(*value);
  if (!text.has_value()) {
    mismatch(key);
    return fallback;
  }
  return *text;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const std::string *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  // 1_000_000 style separators are allowed.
  std::string digits;
  for (const char ch : *value) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
    mismatch(key);
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const std::string *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value->c_str(), &end);
  if (value->empty() || end != value->c_str() + value->size()) {
    mismatch(key);
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const std::string *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  if (value->size() < 2 || value->front() != '[' || value->back() != ']') {
    mismatch(key);
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_array_elements(value->substr(1, value->size() - 2))) {
    if (element.empty()) {
      continue;
    }
    auto text = unquote(element);
    if (!text.has_value()) {
      mismatch(key);
      return fallback;
    }
    out.push_back(std::move(*text));
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(ErrorKind::InvalidArgument,
                                             "Invalid empty section at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorKind::InvalidArgument,
                                           "Invalid key/value at line " +
                                               std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorKind::InvalidArgument,
                                           "Missing key at line " + std::to_string(line_number));
    }

    if (!value.empty() && value.front() == '[') {
      const std::size_t opened_at = line_number;
      while (bracket_balance(value) > 0) {
        if (!std::getline(stream, line)) {
          return Result<TomlDocument>::failure(ErrorKind::InvalidArgument,
                                               "Unterminated array starting at line " +
                                                   std::to_string(opened_at));
        }
        ++line_number;
        value += " " + trim(strip_comment(line));
      }
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace veilguard::common
