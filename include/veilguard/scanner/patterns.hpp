#pragma once

#include "veilguard/common/result.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace veilguard::scanner {

struct ScanPattern {
  std::string source;
  std::regex regex;
};

/// Ordered, case-insensitive phrase patterns. The first hit wins.
class PatternStage {
public:
  /// Fails with InvalidArgument naming the first pattern that does not compile.
  [[nodiscard]] static common::Result<PatternStage> create(const std::vector<std::string> &sources);

  /// Source of the first pattern matching `text` or its homoglyph-folded form.
  /// Both are matched with whitespace runs collapsed to one space.
  [[nodiscard]] std::optional<std::string> first_match(const std::string &text) const;
  [[nodiscard]] std::size_t size() const { return patterns_.size(); }

private:
  PatternStage() = default;

  std::vector<ScanPattern> patterns_;
};

/// Folds full-width Latin, common Cyrillic look-alikes and odd spaces to
/// ASCII, and drops zero-width characters. Anything else passes through.
[[nodiscard]] std::string fold_homoglyphs(const std::string &text);

/// Replaces each run of ASCII whitespace with a single space.
[[nodiscard]] std::string collapse_whitespace(const std::string &text);

} // namespace veilguard::scanner
