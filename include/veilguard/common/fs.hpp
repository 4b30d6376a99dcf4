#pragma once

#include "veilguard/common/result.hpp"

#include <filesystem>
#include <string>

namespace veilguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Replace every non-overlapping occurrence of `needle`; returns the number of replacements.
std::size_t replace_all(std::string &haystack, const std::string &needle,
                        const std::string &replacement);

} // namespace veilguard::common
