#include "veilguard/vault/sqlite_store.hpp"

#include "veilguard/common/fs.hpp"
#include "veilguard/config/schema.hpp"
#include "veilguard/observability/global.hpp"

namespace veilguard::vault {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorKind::StorageUnavailable, msg);
  }
  return common::Status::success();
}

common::Status sqlite_failure(sqlite3 *db, const std::string &context) {
  return common::Status::error(common::ErrorKind::StorageUnavailable,
                               context + ": " + sqlite3_errmsg(db));
}

/// Owns a prepared statement for the lifetime of one call.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

  void bind(const int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(const int index, const std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  }

private:
  sqlite3_stmt *stmt_ = nullptr;
};

/// BEGIN IMMEDIATE on construction; rolls back unless commit() succeeded.
class WriteTransaction {
public:
  explicit WriteTransaction(sqlite3 *db) : db_(db) {
    status_ = exec_sql(db_, "BEGIN IMMEDIATE;");
    open_ = status_.ok();
  }
  ~WriteTransaction() {
    if (open_) {
      (void)exec_sql(db_, "ROLLBACK;");
    }
  }
  WriteTransaction(const WriteTransaction &) = delete;
  WriteTransaction &operator=(const WriteTransaction &) = delete;

  [[nodiscard]] const common::Status &status() const { return status_; }

  [[nodiscard]] common::Status commit() {
    auto status = exec_sql(db_, "COMMIT;");
    if (status.ok()) {
      open_ = false;
    }
    return status;
  }

private:
  sqlite3 *db_;
  common::Status status_ = common::Status::success();
  bool open_ = false;
};

common::Status check_ttl(const std::chrono::seconds ttl) {
  if (ttl.count() <= 0 || static_cast<std::uint64_t>(ttl.count()) > config::MAX_TTL_SECONDS) {
    return common::Status::error(common::ErrorKind::InvalidArgument,
                                 "ttl of " + std::to_string(ttl.count()) +
                                     "s is outside (0, " +
                                     std::to_string(config::MAX_TTL_SECONDS) + "]");
  }
  return common::Status::success();
}

std::int64_t expiry_ms(const std::int64_t now, const std::chrono::seconds ttl) {
  return now + std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
}

} // namespace

Clock system_clock() {
  return []() { return std::chrono::system_clock::now(); };
}

SqliteMappingStore::SqliteMappingStore(std::filesystem::path db_path,
                                       const std::uint64_t size_limit_bytes, Clock clock)
    : db_path_(std::move(db_path)), size_limit_bytes_(size_limit_bytes),
      clock_(clock ? std::move(clock) : system_clock()) {
  if (const auto dir = db_path_.has_parent_path() ? common::ensure_dir(db_path_.parent_path())
                                                  : common::Result<std::filesystem::path>::success({});
      !dir.ok()) {
    open_error_ = dir.error();
    observability::record_storage_error("open", open_error_);
    return;
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    observability::record_storage_error("open", db_path_.string() + ": " + open_error_);
    return;
  }
  sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

  if (const auto status = init_schema(); !status.ok()) {
    open_error_ = status.error();
    observability::record_storage_error("init", open_error_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto purged = purge_expired_locked(); !purged.ok()) {
    observability::record_storage_error("purge", purged.error());
  }
}

SqliteMappingStore::~SqliteMappingStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteMappingStore::unavailable() const {
  return common::Status::error(common::ErrorKind::StorageUnavailable,
                               "vault database unavailable (" + db_path_.string() +
                                   "): " + open_error_);
}

std::int64_t SqliteMappingStore::now_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch())
      .count();
}

common::Status SqliteMappingStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS mappings (
  session_id TEXT NOT NULL,
  placeholder TEXT NOT NULL,
  value TEXT NOT NULL,
  expires_at INTEGER NOT NULL,
  written_seq INTEGER NOT NULL,
  bytes INTEGER NOT NULL,
  PRIMARY KEY (session_id, placeholder)
);
CREATE INDEX IF NOT EXISTS idx_mappings_written ON mappings(written_seq);
CREATE INDEX IF NOT EXISTS idx_mappings_expiry ON mappings(expires_at);
CREATE TABLE IF NOT EXISTS session_sets (
  session_id TEXT PRIMARY KEY,
  expires_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS session_members (
  session_id TEXT NOT NULL,
  placeholder TEXT NOT NULL,
  position INTEGER NOT NULL,
  PRIMARY KEY (session_id, placeholder)
);
)");
}

common::Status SqliteMappingStore::set(const std::string &session_id,
                                       const std::string &placeholder, const std::string &value,
                                       const std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return unavailable();
  }
  if (const auto valid = check_ttl(ttl); !valid.ok()) {
    return valid;
  }

  const auto bytes = static_cast<std::int64_t>(session_id.size() + placeholder.size() + value.size());
  if (static_cast<std::uint64_t>(bytes) > size_limit_bytes_) {
    return common::Status::error(common::ErrorKind::StorageUnavailable,
                                 "mapping of " + std::to_string(bytes) +
                                     " bytes exceeds the store size limit");
  }

  WriteTransaction tx(db_);
  if (!tx.status().ok()) {
    return tx.status();
  }

  Statement stmt(db_, R"(
INSERT INTO mappings(session_id, placeholder, value, expires_at, written_seq, bytes)
VALUES(?1, ?2, ?3, ?4, (SELECT COALESCE(MAX(written_seq), 0) + 1 FROM mappings), ?5)
ON CONFLICT(session_id, placeholder) DO UPDATE SET
  value=excluded.value,
  expires_at=excluded.expires_at,
  written_seq=excluded.written_seq,
  bytes=excluded.bytes
)");
  if (!stmt.ok()) {
    return sqlite_failure(db_, "prepare set");
  }
  stmt.bind(1, session_id);
  stmt.bind(2, placeholder);
  stmt.bind(3, value);
  stmt.bind(4, expiry_ms(now_ms(), ttl));
  stmt.bind(5, bytes);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return sqlite_failure(db_, "set");
  }

  const auto evicted = enforce_size_limit();
  if (!evicted.ok()) {
    return evicted.status();
  }

  auto status = tx.commit();
  if (status.ok() && evicted.value() > 0) {
    evictions_ += evicted.value();
    observability::record_metric(observability::StoreEvictionMetric{.evicted = evicted.value()});
  }
  return status;
}

common::Result<std::uint64_t> SqliteMappingStore::enforce_size_limit() {
  // Keep the newest records whose running total fits; everything older goes.
  Statement stmt(db_, R"(
DELETE FROM mappings WHERE written_seq IN (
  SELECT written_seq FROM (
    SELECT written_seq, SUM(bytes) OVER (ORDER BY written_seq DESC) AS running
    FROM mappings
  ) WHERE running > ?1
)
)");
  if (!stmt.ok()) {
    return common::Result<std::uint64_t>::failure(sqlite_failure(db_, "prepare eviction"));
  }
  stmt.bind(1, static_cast<std::int64_t>(size_limit_bytes_));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return common::Result<std::uint64_t>::failure(sqlite_failure(db_, "eviction"));
  }

  const auto evicted = static_cast<std::uint64_t>(sqlite3_changes(db_));
  if (evicted > 0) {
    const auto status = exec_sql(db_, R"(
DELETE FROM session_members WHERE NOT EXISTS (
  SELECT 1 FROM mappings m
  WHERE m.session_id = session_members.session_id AND m.placeholder = session_members.placeholder
)
)");
    if (!status.ok()) {
      return common::Result<std::uint64_t>::failure(status);
    }
  }
  return common::Result<std::uint64_t>::success(evicted);
}

common::Result<std::optional<std::string>>
SqliteMappingStore::get(const std::string &session_id, const std::string &placeholder) {
  using Lookup = common::Result<std::optional<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Lookup::failure(unavailable());
  }

  Statement stmt(db_, "SELECT value FROM mappings WHERE session_id = ?1 AND placeholder = ?2 "
                      "AND expires_at > ?3");
  if (!stmt.ok()) {
    return Lookup::failure(sqlite_failure(db_, "prepare get"));
  }
  stmt.bind(1, session_id);
  stmt.bind(2, placeholder);
  stmt.bind(3, now_ms());

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 0));
    const int size = sqlite3_column_bytes(stmt.get(), 0);
    return Lookup::success(std::string(text == nullptr ? "" : text, static_cast<std::size_t>(size)));
  }
  if (rc != SQLITE_DONE) {
    return Lookup::failure(sqlite_failure(db_, "get"));
  }
  return Lookup::success(std::nullopt);
}

common::Result<std::vector<std::string>>
SqliteMappingStore::get_session_set(const std::string &session_id) {
  using Members = common::Result<std::vector<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Members::failure(unavailable());
  }

  Statement stmt(db_, R"(
SELECT m.placeholder
FROM session_members m
JOIN session_sets s ON s.session_id = m.session_id
JOIN mappings r ON r.session_id = m.session_id AND r.placeholder = m.placeholder
WHERE m.session_id = ?1 AND s.expires_at > ?2 AND r.expires_at > ?2
ORDER BY m.position ASC
)");
  if (!stmt.ok()) {
    return Members::failure(sqlite_failure(db_, "prepare get_session_set"));
  }
  stmt.bind(1, session_id);
  stmt.bind(2, now_ms());

  std::vector<std::string> members;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 0));
    const int size = sqlite3_column_bytes(stmt.get(), 0);
    members.emplace_back(text == nullptr ? "" : text, static_cast<std::size_t>(size));
  }
  if (rc != SQLITE_DONE) {
    return Members::failure(sqlite_failure(db_, "get_session_set"));
  }
  return Members::success(std::move(members));
}

common::Status SqliteMappingStore::merge_session_set(const std::string &session_id,
                                                     const std::vector<std::string> &placeholders,
                                                     const std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return unavailable();
  }
  if (const auto valid = check_ttl(ttl); !valid.ok()) {
    return valid;
  }
  if (placeholders.empty()) {
    return common::Status::success();
  }

  WriteTransaction tx(db_);
  if (!tx.status().ok()) {
    return tx.status();
  }
  const std::int64_t now = now_ms();

  // An expired set is logically gone; the merge starts a fresh one.
  {
    Statement stale(db_, R"(
DELETE FROM session_members WHERE session_id = ?1 AND EXISTS (
  SELECT 1 FROM session_sets s WHERE s.session_id = ?1 AND s.expires_at <= ?2
)
)");
    if (!stale.ok()) {
      return sqlite_failure(db_, "prepare merge");
    }
    stale.bind(1, session_id);
    stale.bind(2, now);
    if (sqlite3_step(stale.get()) != SQLITE_DONE) {
      return sqlite_failure(db_, "merge");
    }
  }

  {
    Statement refresh(db_, R"(
INSERT INTO session_sets(session_id, expires_at) VALUES(?1, ?2)
ON CONFLICT(session_id) DO UPDATE SET expires_at=excluded.expires_at
)");
    if (!refresh.ok()) {
      return sqlite_failure(db_, "prepare merge");
    }
    refresh.bind(1, session_id);
    refresh.bind(2, expiry_ms(now, ttl));
    if (sqlite3_step(refresh.get()) != SQLITE_DONE) {
      return sqlite_failure(db_, "merge");
    }
  }

  Statement append(db_, R"(
INSERT INTO session_members(session_id, placeholder, position)
VALUES(?1, ?2, (SELECT COALESCE(MAX(position), 0) + 1 FROM session_members WHERE session_id = ?1))
ON CONFLICT(session_id, placeholder) DO NOTHING
)");
  if (!append.ok()) {
    return sqlite_failure(db_, "prepare merge");
  }
  for (const auto &placeholder : placeholders) {
    sqlite3_reset(append.get());
    sqlite3_clear_bindings(append.get());
    append.bind(1, session_id);
    append.bind(2, placeholder);
    if (sqlite3_step(append.get()) != SQLITE_DONE) {
      return sqlite_failure(db_, "merge");
    }
  }

  return tx.commit();
}

common::Status SqliteMappingStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return unavailable();
  }
  WriteTransaction tx(db_);
  if (!tx.status().ok()) {
    return tx.status();
  }
  auto status =
      exec_sql(db_, "DELETE FROM mappings; DELETE FROM session_members; DELETE FROM session_sets;");
  if (!status.ok()) {
    return status;
  }
  return tx.commit();
}

common::Status SqliteMappingStore::clear_session(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return unavailable();
  }
  WriteTransaction tx(db_);
  if (!tx.status().ok()) {
    return tx.status();
  }
  for (const char *sql : {"DELETE FROM mappings WHERE session_id = ?1",
                          "DELETE FROM session_members WHERE session_id = ?1",
                          "DELETE FROM session_sets WHERE session_id = ?1"}) {
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
      return sqlite_failure(db_, "prepare clear_session");
    }
    stmt.bind(1, session_id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return sqlite_failure(db_, "clear_session");
    }
  }
  return tx.commit();
}

common::Result<std::size_t> SqliteMappingStore::purge_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(unavailable());
  }
  return purge_expired_locked();
}

common::Result<std::size_t> SqliteMappingStore::purge_expired_locked() {
  WriteTransaction tx(db_);
  if (!tx.status().ok()) {
    return common::Result<std::size_t>::failure(tx.status());
  }
  const std::int64_t now = now_ms();

  std::size_t purged = 0;
  {
    Statement stmt(db_, "DELETE FROM mappings WHERE expires_at <= ?1");
    if (!stmt.ok()) {
      return common::Result<std::size_t>::failure(sqlite_failure(db_, "prepare purge"));
    }
    stmt.bind(1, now);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return common::Result<std::size_t>::failure(sqlite_failure(db_, "purge"));
    }
    purged = static_cast<std::size_t>(sqlite3_changes(db_));
  }
  {
    Statement stmt(db_, "DELETE FROM session_sets WHERE expires_at <= ?1");
    if (!stmt.ok()) {
      return common::Result<std::size_t>::failure(sqlite_failure(db_, "prepare purge"));
    }
    stmt.bind(1, now);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return common::Result<std::size_t>::failure(sqlite_failure(db_, "purge"));
    }
  }
  const auto status = exec_sql(db_, R"(
DELETE FROM session_members WHERE session_id NOT IN (SELECT session_id FROM session_sets)
)");
  if (!status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }

  if (const auto committed = tx.commit(); !committed.ok()) {
    return common::Result<std::size_t>::failure(committed);
  }
  return common::Result<std::size_t>::success(purged);
}

bool SqliteMappingStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return false;
  }
  return exec_sql(db_, "SELECT 1;").ok();
}

StoreStats SqliteMappingStore::stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  StoreStats out;
  out.size_limit_bytes = size_limit_bytes_;
  out.evictions = evictions_;
  if (db_ == nullptr) {
    return out;
  }

  const std::int64_t now = now_ms();
  {
    Statement stmt(db_, "SELECT COUNT(*), COALESCE(SUM(bytes), 0) FROM mappings WHERE expires_at > ?1");
    if (stmt.ok()) {
      stmt.bind(1, now);
      if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out.records = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 0));
        out.bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
      }
    }
  }
  {
    Statement stmt(db_, "SELECT COUNT(*) FROM session_sets WHERE expires_at > ?1");
    if (stmt.ok()) {
      stmt.bind(1, now);
      if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out.live_sessions = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 0));
      }
    }
  }

  observability::record_metric(
      observability::StoreSizeMetric{.bytes = out.bytes, .records = out.records});
  return out;
}

} // namespace veilguard::vault
