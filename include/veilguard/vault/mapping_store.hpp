#pragma once

#include "veilguard/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veilguard::vault {

using Clock = std::function<std::chrono::system_clock::time_point()>;

[[nodiscard]] Clock system_clock();

struct StoreStats {
  std::uint64_t records = 0;
  std::uint64_t live_sessions = 0;
  std::uint64_t bytes = 0;
  std::uint64_t size_limit_bytes = 0;
  std::uint64_t evictions = 0;
};

/// Durable, TTL-bounded placeholder -> original mapping, scoped by session.
/// Expired entries are never returned, whether or not they were purged yet.
class IMappingStore {
public:
  virtual ~IMappingStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Upsert; resets the expiry to now + ttl.
  [[nodiscard]] virtual common::Status set(const std::string &session_id,
                                           const std::string &placeholder,
                                           const std::string &value,
                                           std::chrono::seconds ttl) = 0;
  /// std::nullopt both for unknown and for expired records.
  [[nodiscard]] virtual common::Result<std::optional<std::string>>
  get(const std::string &session_id, const std::string &placeholder) = 0;
  /// Placeholders in insertion order; empty for unknown or expired sessions.
  [[nodiscard]] virtual common::Result<std::vector<std::string>>
  get_session_set(const std::string &session_id) = 0;
  /// Set union with the stored members; refreshes the set expiry to now + ttl.
  [[nodiscard]] virtual common::Status
  merge_session_set(const std::string &session_id, const std::vector<std::string> &placeholders,
                    std::chrono::seconds ttl) = 0;

  [[nodiscard]] virtual common::Status clear() = 0;
  [[nodiscard]] virtual common::Status clear_session(const std::string &session_id) = 0;
  /// Physically removes expired records; returns how many mappings went away.
  [[nodiscard]] virtual common::Result<std::size_t> purge_expired() = 0;

  [[nodiscard]] virtual bool health_check() = 0;
  [[nodiscard]] virtual StoreStats stats() = 0;
};

} // namespace veilguard::vault
