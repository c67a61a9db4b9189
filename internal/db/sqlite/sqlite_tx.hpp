#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace kbsync::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - a row re-read inside the transaction cannot change before commit
  Read transactions use BEGIN DEFERRED and never block writers (WAL).
*/
class SqliteTransaction final : public db::Transaction {
 public:
  enum class Mode { kImmediate, kDeferred };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kImmediate);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace kbsync::db::sqlite
