#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace kbsync::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result                               InsertDocument(Transaction&, model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t id) override;
  std::optional<model::DocumentRecord> GetDocumentByPath(Transaction&, const std::string& filepath) override;
  Result                               UpdateDocument(Transaction&, const model::DocumentRecord&) override;
  std::vector<model::DocumentRecord>   ListDocuments(Transaction&, const DocumentFilter&, const Pagination&) override;
  int64_t                              CountDocuments(Transaction&, const DocumentFilter&) override;
  std::vector<StatusCount>             CountByStatus(Transaction&) override;

  Result                               InsertScriptRun(Transaction&, model::ScriptRunRecord&) override;
  std::vector<model::ScriptRunRecord> ListScriptRuns(Transaction&, const std::string& script_name, std::size_t limit) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace kbsync::db::sqlite
