#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace kbsync::db::memory {

class MemoryTransaction;

/*
  In-process ledger with the same contract as the SQLite backend.

  Used by tests and by dry runs (database: { memory: {} }). Write
  transactions are serialized on a dedicated writer mutex, which matches
  BEGIN IMMEDIATE; reads take a snapshot and never block.
*/
class MemoryRepository final : public db::Repository {
 public:
  // Snapshot unit copied by write transactions and swapped in on commit.
  struct State {
    // keyed by id so iteration is insertion order
    std::map<int64_t, model::DocumentRecord>  documents;
    std::unordered_map<std::string, int64_t> path_to_id;
    std::vector<model::ScriptRunRecord>       runs;
    int64_t                                   next_document_id = 1;
    int64_t                                   next_run_id      = 1;
  };

  MemoryRepository();

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
  friend class MemoryTransaction;

  std::mutex mutex_;
  std::mutex writer_mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace kbsync::db::memory
