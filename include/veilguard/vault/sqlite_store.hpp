#pragma once

#include "veilguard/vault/mapping_store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace veilguard::vault {

/// SQLite-backed store. Several instances, in one process or many, may share
/// the same file: every write runs in its own IMMEDIATE transaction.
class SqliteMappingStore final : public IMappingStore {
public:
  SqliteMappingStore(std::filesystem::path db_path, std::uint64_t size_limit_bytes,
                     Clock clock = system_clock());
  ~SqliteMappingStore() override;

  SqliteMappingStore(const SqliteMappingStore &) = delete;
  SqliteMappingStore &operator=(const SqliteMappingStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  [[nodiscard]] common::Status set(const std::string &session_id, const std::string &placeholder,
                                   const std::string &value, std::chrono::seconds ttl) override;
  [[nodiscard]] common::Result<std::optional<std::string>>
  get(const std::string &session_id, const std::string &placeholder) override;
  [[nodiscard]] common::Result<std::vector<std::string>>
  get_session_set(const std::string &session_id) override;
  [[nodiscard]] common::Status merge_session_set(const std::string &session_id,
                                                 const std::vector<std::string> &placeholders,
                                                 std::chrono::seconds ttl) override;

  [[nodiscard]] common::Status clear() override;
  [[nodiscard]] common::Status clear_session(const std::string &session_id) override;
  [[nodiscard]] common::Result<std::size_t> purge_expired() override;

  [[nodiscard]] bool health_check() override;
  [[nodiscard]] StoreStats stats() override;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status unavailable() const;
  [[nodiscard]] std::int64_t now_ms() const;
  [[nodiscard]] common::Result<std::uint64_t> enforce_size_limit();
  [[nodiscard]] common::Result<std::size_t> purge_expired_locked();

  std::filesystem::path db_path_;
  std::uint64_t size_limit_bytes_;
  Clock clock_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
  std::uint64_t evictions_ = 0;
};

} // namespace veilguard::vault
