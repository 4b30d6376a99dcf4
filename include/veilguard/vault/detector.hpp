#pragma once

#include "veilguard/common/result.hpp"
#include "veilguard/config/schema.hpp"
#include "veilguard/net/http_client.hpp"
#include "veilguard/vault/entity.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace veilguard::vault {

/// Finds PII spans. Matches may overlap and arrive in any order; offsets are
/// UTF-8 byte offsets into `text`.
class IEntityDetector {
public:
  virtual ~IEntityDetector() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<EntityMatch>>
  detect(const std::string &text, const std::vector<std::string> &labels) = 0;
};

/// Builds the configured backend, wrapped in a deadline when timeout_ms > 0.
[[nodiscard]] common::Result<std::shared_ptr<IEntityDetector>>
create_detector(const config::Config &config,
                std::shared_ptr<net::HttpClient> http_client = nullptr);

} // namespace veilguard::vault
