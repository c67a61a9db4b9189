#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/script_run_record.hpp"

namespace kbsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - filepath is unique; a second insert for the same path fails with
    AlreadyExists
  - Rows of document_status_table are never physically removed

  The ledger is the only channel between the pipeline stages, so every
  backend must give a writer exclusive access between Begin() and
  Commit().
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Write transaction; takes the write lock up front.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only snapshot.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Documents
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertDocument(Transaction&, model::DocumentRecord& record) = 0;

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t id) = 0;

  virtual std::optional<model::DocumentRecord> GetDocumentByPath(Transaction&, const std::string& filepath) = 0;

  // Full-row update keyed by id.
  virtual Result UpdateDocument(Transaction&, const model::DocumentRecord& record) = 0;

  virtual std::vector<model::DocumentRecord> ListDocuments(Transaction&, const DocumentFilter& filter, const Pagination& page) = 0;

  virtual int64_t CountDocuments(Transaction&, const DocumentFilter& filter) = 0;

  // Grouped by the stored status text.
  virtual std::vector<StatusCount> CountByStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Run audit log
  // ---------------------------------------------------------------------

  virtual Result InsertScriptRun(Transaction&, model::ScriptRunRecord& run) = 0;

  // Most recent first; empty script_name lists every stage.
  virtual std::vector<model::ScriptRunRecord> ListScriptRuns(Transaction&, const std::string& script_name, std::size_t limit) = 0;
};

} // namespace kbsync::db
