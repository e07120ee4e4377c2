#pragma once

#include "jobflow/store/metadata_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace jobflow {

// Store backed by a SQLite database file. Several processes may open the
// same file; compare_and_set is a conditional UPDATE/INSERT and stays atomic
// across them.
class SqliteStore final : public MetadataStore {
public:
  explicit SqliteStore(std::string_view db_path, int busy_timeout_ms = 5000);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto get(std::string_view path)
      -> Result<std::optional<VersionedRecord>> override;
  [[nodiscard]] auto set(std::string_view path, const Record& record)
      -> Result<void> override;
  [[nodiscard]] auto compare_and_set(std::string_view path,
                                     const Record& record,
                                     std::int64_t expected_version)
      -> Result<void> override;
  [[nodiscard]] auto remove(std::string_view path) -> Result<void> override;
  [[nodiscard]] auto children(std::string_view path)
      -> Result<std::vector<std::string>> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto ensure_open() const -> Result<void>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  int busy_timeout_ms_;
  // One connection per store; statements are stepped under this lock.
  std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace jobflow
