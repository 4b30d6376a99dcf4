#include "veilguard/scanner/patterns.hpp"

#include <cctype>
#include <cstdint>

namespace veilguard::scanner {

namespace {

bool decode_utf8_codepoint(const std::string &input, std::size_t &index, std::uint32_t &cp,
                           std::string &raw) {
  if (index >= input.size()) {
    return false;
  }

  const unsigned char lead = static_cast<unsigned char>(input[index]);
  std::size_t extra = 0;
  std::uint32_t value = 0;
  if (lead < 0x80U) {
    extra = 0;
    value = lead;
  } else if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  } else {
    extra = 0;
    value = lead;
  }

  // Truncated or malformed sequences pass through one byte at a time.
  bool valid = index + extra < input.size();
  for (std::size_t i = 1; valid && i <= extra; ++i) {
    const auto cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      valid = false;
    } else {
      value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
    }
  }
  if (!valid) {
    extra = 0;
    value = lead;
  }

  raw.assign(input, index, extra + 1);
  cp = value;
  index += extra + 1;
  return true;
}

std::string fold_codepoint(const std::uint32_t cp, const std::string &raw) {
  // Full-width ASCII block.
  if (cp >= 0xFF01U && cp <= 0xFF5EU) {
    return std::string(1, static_cast<char>(cp - 0xFEE0U));
  }

  switch (cp) {
  case 0x00A0U:
  case 0x2000U:
  case 0x2001U:
  case 0x2002U:
  case 0x2003U:
  case 0x2009U:
  case 0x202FU:
  case 0x3000U:
    return " ";
  case 0x200BU:
  case 0x200CU:
  case 0x200DU:
  case 0x2060U:
  case 0xFEFFU:
    return "";
  // Cyrillic letters that render like Latin ones.
  case 0x0430U:
    return "a";
  case 0x0435U:
    return "e";
  case 0x043EU:
    return "o";
  case 0x0440U:
    return "p";
  case 0x0441U:
    return "c";
  case 0x0443U:
    return "y";
  case 0x0445U:
    return "x";
  case 0x0456U:
    return "i";
  case 0x0458U:
    return "j";
  case 0x0455U:
    return "s";
  case 0x0410U:
    return "A";
  case 0x0415U:
    return "E";
  case 0x041EU:
    return "O";
  case 0x0420U:
    return "P";
  case 0x0421U:
    return "C";
  case 0x0422U:
    return "T";
  case 0x041DU:
    return "H";
  case 0x041CU:
    return "M";
  default:
    break;
  }
  return raw;
}

} // namespace

common::Result<PatternStage> PatternStage::create(const std::vector<std::string> &sources) {
  PatternStage stage;
  stage.patterns_.reserve(sources.size());
  for (const auto &source : sources) {
    try {
      stage.patterns_.push_back(
          ScanPattern{.source = source, .regex = std::regex(source, std::regex::icase)});
    } catch (const std::regex_error &ex) {
      return common::Result<PatternStage>::failure(common::ErrorKind::InvalidArgument,
                                                   "invalid scan pattern '" + source +
                                                       "': " + ex.what());
    }
  }
  return common::Result<PatternStage>::success(std::move(stage));
}

std::optional<std::string> PatternStage::first_match(const std::string &text) const {
  // std::regex recurses once per character a quantifier consumes, so `\s+`
  // must never see an unbounded run of padding.
  const std::string plain = collapse_whitespace(text);
  const std::string folded = collapse_whitespace(fold_homoglyphs(text));
  const bool check_folded = folded != plain;
  for (const auto &pattern : patterns_) {
    if (std::regex_search(plain, pattern.regex) ||
        (check_folded && std::regex_search(folded, pattern.regex))) {
      return pattern.source;
    }
  }
  return std::nullopt;
}

std::string fold_homoglyphs(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t index = 0;
  std::uint32_t cp = 0;
  std::string raw;
  while (decode_utf8_codepoint(text, index, cp, raw)) {
    out += fold_codepoint(cp, raw);
  }
  return out;
}

std::string collapse_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool in_run = false;
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!in_run) {
        out.push_back(' ');
      }
      in_run = true;
    } else {
      out.push_back(ch);
      in_run = false;
    }
  }
  return out;
}

} // namespace veilguard::scanner
