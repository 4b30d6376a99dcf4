#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace veilguard::common {

// All draws come from OpenSSL's CSPRNG and throw std::runtime_error if it fails.

/// Uniform in [0, bound); bound must be > 0.
[[nodiscard]] std::uint64_t random_below(std::uint64_t bound);
[[nodiscard]] std::string random_hex(std::size_t bytes);
/// RFC 4122 version-4 UUID in canonical lowercase form.
[[nodiscard]] std::string random_uuid_v4();

} // namespace veilguard::common
