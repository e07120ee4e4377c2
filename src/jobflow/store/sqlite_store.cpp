#include "jobflow/store/sqlite_store.hpp"

#include "jobflow/store/path.hpp"
#include "jobflow/util/log.hpp"

#include <sqlite3.h>

#include <set>

namespace jobflow {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

// Upper bound of the key range holding every descendant of `prefix`:
// '0' is the character after '/'.
auto descendant_upper_bound(std::string_view prefix) -> std::string {
  std::string upper{prefix};
  upper.back() = '0';
  return upper;
}

}  // namespace

auto SqliteStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteStore::Statement::~Statement() {
  reset();
}

auto SqliteStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteStore::SqliteStore(std::string_view db_path, int busy_timeout_ms)
    : db_path_(db_path), busy_timeout_ms_(busy_timeout_ms) {
}

SqliteStore::~SqliteStore() {
  close();
}

auto SqliteStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open store database {}: {}", db_path_,
               sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::StoreFailure);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), busy_timeout_ms_);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Store database opened: {}", db_path_);
  return ok();
}

auto SqliteStore::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto SqliteStore::create_tables() -> Result<void> {
  return execute(R"(
    CREATE TABLE IF NOT EXISTS znodes (
      path TEXT PRIMARY KEY,
      data TEXT NOT NULL,
      version INTEGER NOT NULL DEFAULT 0
    );
  )");
}

auto SqliteStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::StoreFailure);
  }
  return ok();
}

auto SqliteStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::StoreFailure);
  }
  return stmt;
}

auto SqliteStore::ensure_open() const -> Result<void> {
  if (!db_) {
    log::error("Store database {} is not open", db_path_);
    return fail(Error::StoreFailure);
  }
  return ok();
}

auto SqliteStore::get(std::string_view p)
    -> Result<std::optional<VersionedRecord>> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r) {
    return fail(r.error());
  }

  auto result = prepare("SELECT data, version FROM znodes WHERE path = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto key = path::normalize(p);
  bind_text(stmt.get(), 1, key);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return ok(std::optional<VersionedRecord>{});
  }
  if (rc != SQLITE_ROW) {
    log::error("Failed to read {}: {}", key, sqlite3_errmsg(db_.get()));
    return fail(Error::StoreFailure);
  }

  auto record = Record::from_json(col_text(stmt.get(), 0));
  if (!record) {
    return fail(record.error());
  }
  return ok(std::optional<VersionedRecord>{
      VersionedRecord{std::move(*record), sqlite3_column_int64(stmt.get(), 1)}});
}

auto SqliteStore::set(std::string_view p, const Record& record)
    -> Result<void> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r) {
    return r;
  }

  constexpr auto sql = R"(
    INSERT INTO znodes (path, data, version) VALUES (?, ?, 0)
    ON CONFLICT(path) DO UPDATE SET
      data = excluded.data,
      version = znodes.version + 1;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto key = path::normalize(p);
  auto data = record.to_json();
  bind_text(stmt.get(), 1, key);
  bind_text(stmt.get(), 2, data);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to write {}: {}", key, sqlite3_errmsg(db_.get()));
    return fail(Error::StoreFailure);
  }
  return ok();
}

auto SqliteStore::compare_and_set(std::string_view p, const Record& record,
                                  std::int64_t expected_version)
    -> Result<void> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r) {
    return r;
  }

  auto key = path::normalize(p);
  auto data = record.to_json();

  if (expected_version == kAbsentVersion) {
    auto result = prepare(
        "INSERT INTO znodes (path, data, version) VALUES (?, ?, 0) "
        "ON CONFLICT(path) DO NOTHING;");
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);
    bind_text(stmt.get(), 1, key);
    bind_text(stmt.get(), 2, data);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::error("Failed to create {}: {}", key, sqlite3_errmsg(db_.get()));
      return fail(Error::StoreFailure);
    }
  } else {
    auto result = prepare(
        "UPDATE znodes SET data = ?, version = version + 1 "
        "WHERE path = ? AND version = ?;");
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);
    bind_text(stmt.get(), 1, data);
    bind_text(stmt.get(), 2, key);
    sqlite3_bind_int64(stmt.get(), 3, expected_version);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::error("Failed to update {}: {}", key, sqlite3_errmsg(db_.get()));
      return fail(Error::StoreFailure);
    }
  }

  if (sqlite3_changes(db_.get()) == 0) {
    return fail(Error::StoreConflict);
  }
  return ok();
}

auto SqliteStore::remove(std::string_view p) -> Result<void> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r) {
    return r;
  }

  auto result = prepare(
      "DELETE FROM znodes WHERE path = ? OR (path >= ? AND path < ?);");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto key = path::normalize(p);
  auto prefix = path::child_prefix(key);
  auto upper = descendant_upper_bound(prefix);
  bind_text(stmt.get(), 1, key);
  bind_text(stmt.get(), 2, prefix);
  bind_text(stmt.get(), 3, upper);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to remove {}: {}", key, sqlite3_errmsg(db_.get()));
    return fail(Error::StoreFailure);
  }
  return ok();
}

auto SqliteStore::children(std::string_view p)
    -> Result<std::vector<std::string>> {
  std::lock_guard lock(mu_);
  if (auto r = ensure_open(); !r) {
    return fail(r.error());
  }

  auto result = prepare(
      "SELECT path FROM znodes WHERE path >= ? AND path < ? ORDER BY path;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto prefix = path::child_prefix(p);
  auto upper = descendant_upper_bound(prefix);
  bind_text(stmt.get(), 1, prefix);
  bind_text(stmt.get(), 2, upper);

  std::set<std::string, std::less<>> names;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto full = col_text(stmt.get(), 0);
    auto name = path::first_segment(full, prefix);
    if (!name.empty()) {
      names.emplace(name);
    }
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to list {}: {}", prefix, sqlite3_errmsg(db_.get()));
    return fail(Error::StoreFailure);
  }
  return ok(std::vector<std::string>(names.begin(), names.end()));
}

}  // namespace jobflow
