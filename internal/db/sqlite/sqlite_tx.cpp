#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace kbsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode) : db_(std::move(db)) {
  db_->Exec(mode == Mode::kImmediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    KBSYNC_LOG_WARN("ledger rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", err ? err : "")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace kbsync::db::sqlite
