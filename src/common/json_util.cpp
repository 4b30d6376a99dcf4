#include "veilguard/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace veilguard::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

std::optional<std::uint32_t> hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const auto ch = static_cast<unsigned char>(raw[i]);
    if (std::isxdigit(ch) == 0) {
      return std::nullopt;
    }
    value = (value << 4U) |
            static_cast<std::uint32_t>(std::isdigit(ch) != 0 ? ch - '0' : std::tolower(ch) - 'a' + 10);
  }
  return value;
}

std::string unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto cp = hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back(next);
        break;
      }
      i += 4;
      // Surrogate pair.
      if (*cp >= 0xD800U && *cp <= 0xDBFFU && raw.compare(i + 1, 2, "\\u") == 0) {
        if (const auto low = hex4(raw, i + 3); low.has_value() && *low >= 0xDC00U && *low <= 0xDFFFU) {
          *cp = 0x10000U + ((*cp - 0xD800U) << 10U) + (*low - 0xDC00U);
          i += 6;
        }
      }
      append_utf8(out, *cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

/// Index of the quote closing the string that opens at `quote`, or npos.
std::size_t string_end(const std::string &json, const std::size_t quote) {
  bool escaped = false;
  for (std::size_t i = quote + 1; i < json.size(); ++i) {
    if (escaped) {
      escaped = false;
    } else if (json[i] == '\\') {
      escaped = true;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

/// Scans one bracketed value starting at `open` (which must hold `open_ch`);
/// returns the index of its closing token. Strings are skipped.
std::size_t matching_close(const std::string &json, const std::size_t open, const char open_ch,
                           const char close_ch) {
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }
    if (ch == '"') {
      in_string = true;
    } else if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch && depth > 0 && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

/// Offset of the first character of `field`'s value, or npos.
std::size_t value_offset(const std::string &object, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key = object.find(quoted);
  while (key != std::string::npos) {
    const std::size_t colon = skip_ws(object, key + quoted.size());
    if (colon < object.size() && object[colon] == ':') {
      return skip_ws(object, colon + 1);
    }
    key = object.find(quoted, key + 1);
  }
  return std::string::npos;
}

std::optional<std::string> number_token(const std::string &object, const std::string &field) {
  const std::size_t start = value_offset(object, field);
  if (start == std::string::npos || start >= object.size()) {
    return std::nullopt;
  }
  std::size_t end = start;
  while (end < object.size() &&
         (std::isdigit(static_cast<unsigned char>(object[end])) != 0 || object[end] == '-' ||
          object[end] == '+' || object[end] == '.' || object[end] == 'e' || object[end] == 'E')) {
    ++end;
  }
  if (end == start) {
    return std::nullopt;
  }
  return object.substr(start, end - start);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += "\"" + json_escape(values[i]) + "\"";
  }
  return out + "]";
}

std::string json_get_string(const std::string &object, const std::string &field) {
  const std::size_t start = value_offset(object, field);
  if (start == std::string::npos || start >= object.size() || object[start] != '"') {
    return "";
  }
  const std::size_t end = string_end(object, start);
  if (end == std::string::npos) {
    return "";
  }
  return unescape(object.substr(start + 1, end - start - 1));
}

std::optional<double> json_get_double(const std::string &object, const std::string &field) {
  const auto token = number_token(object, field);
  if (!token.has_value()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(token->c_str(), &end);
  if (end != token->c_str() + token->size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::size_t> json_get_index(const std::string &object, const std::string &field) {
  const auto token = number_token(object, field);
  if (!token.has_value() ||
      token->find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  char *end = nullptr;
  const unsigned long long value = std::strtoull(token->c_str(), &end, 10);
  if (end != token->c_str() + token->size()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(value);
}

std::vector<std::string> json_array_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::size_t open = skip_ws(array_json, 0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return out;
  }
  const std::size_t close = matching_close(array_json, open, '[', ']');
  if (close == std::string::npos) {
    return out;
  }

  std::size_t pos = open + 1;
  while (pos < close) {
    const char ch = array_json[pos];
    if (ch == '{') {
      const std::size_t end = matching_close(array_json, pos, '{', '}');
      if (end == std::string::npos || end > close) {
        break;
      }
      out.push_back(array_json.substr(pos, end - pos + 1));
      pos = end + 1;
    } else if (ch == '[') {
      const std::size_t end = matching_close(array_json, pos, '[', ']');
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
    } else if (ch == '"') {
      const std::size_t end = string_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

std::optional<std::string> json_unwrap_batch(const std::string &text) {
  const std::size_t open = skip_ws(text, 0);
  if (open >= text.size() || text[open] != '[') {
    return std::nullopt;
  }
  const std::size_t inner = skip_ws(text, open + 1);
  if (inner >= text.size() || text[inner] != '[') {
    return text.substr(open);
  }
  const std::size_t close = matching_close(text, inner, '[', ']');
  if (close == std::string::npos) {
    return std::nullopt;
  }
  return text.substr(inner, close - inner + 1);
}

} // namespace veilguard::common
