#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace veilguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Serialize a string list as a JSON array literal.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

// The readers below cover flat objects as returned by analyzer and
// classifier services; they do not validate the full document.

/// String value of `field`, unescaped. Empty when absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &object, const std::string &field);

/// Numeric value of `field`; nullopt when absent, quoted or not a number.
[[nodiscard]] std::optional<double> json_get_double(const std::string &object,
                                                    const std::string &field);

/// Non-negative integer value of `field` (offsets, counts).
[[nodiscard]] std::optional<std::size_t> json_get_index(const std::string &object,
                                                        const std::string &field);

/// Top-level objects of an array literal, in order. Nested arrays and
/// non-object elements are skipped.
[[nodiscard]] std::vector<std::string> json_array_objects(const std::string &array_json);

/// `[[...]]` -> `[...]` for batch responses holding a single input; other
/// arrays come back unchanged. nullopt when `text` is not an array or the
/// inner array is unterminated.
[[nodiscard]] std::optional<std::string> json_unwrap_batch(const std::string &text);

} // namespace veilguard::common
