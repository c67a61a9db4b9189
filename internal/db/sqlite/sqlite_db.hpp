#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace kbsync::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  One SqliteDB per thread of work: each pipeline stage opens its own, the
  same as independent processes sharing the ledger file would.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  static constexpr int kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
};

} // namespace kbsync::db::sqlite
