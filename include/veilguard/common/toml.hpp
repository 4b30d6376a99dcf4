#pragma once

#include "veilguard/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace veilguard::common {

/// Flat view of a TOML document: `section.key` -> raw value text.
///
/// Getters return the fallback for absent keys. A present key whose value
/// does not convert also yields the fallback and is remembered in
/// `mismatched_keys` so callers can reject the document.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  mutable std::vector<std::string> mismatched_keys;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

private:
  [[nodiscard]] const std::string *raw(const std::string &key) const;
  void mismatch(const std::string &key) const;
};

/// Parses the subset of TOML used by veilguard configs: sections, basic and
/// literal strings, numbers and (possibly multi-line) string arrays.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace veilguard::common
