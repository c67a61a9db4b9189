#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/script_run_record.hpp"
#include "internal/model/document_status.hpp"

namespace kbsync::ledger {

enum class UpsertOutcome {
  kInserted,           // new discover row
  kReset,              // changed file, row back to discover
  kUnchanged,          // same size and mtime
  kDeferredProcessing, // changed, but the row is processing; next run
  kSkippedDeleted,     // path belongs to a deleted row
};

const char* ToString(UpsertOutcome outcome);

/*
  LedgerStore

  The only writer of document_status_table and script_process_record.

  Every mutation runs in its own single-row write transaction: the row is
  re-read inside the transaction, the change is validated against the
  document state machine and only then written. An illegal change throws
  util::InvalidState and leaves the row untouched. Backend failures throw
  util::LedgerUnavailable; a missing row throws util::NotFound.
*/
class LedgerStore {
 public:
  using DocumentRecord  = db::model::DocumentRecord;
  using ScriptRunRecord = db::model::ScriptRunRecord;
  using DocumentStatus  = kbsync::model::DocumentStatus;

  explicit LedgerStore(std::shared_ptr<db::Repository> repository);

  UpsertOutcome UpsertDiscovered(const std::string& path, int64_t size, double mtime);

  // false when the row was already deleted. A row still holding a
  // knowledge_id other than purged_knowledge_id is refused (InvalidState):
  // its remote entity has not been deleted.
  bool MarkDeleted(const std::string& path, const std::optional<std::string>& purged_knowledge_id = std::nullopt);

  // id order; limit 0 = unbounded
  std::vector<DocumentRecord> ListByStatus(DocumentStatus status, std::size_t limit);

  // pending and processing rows, id order; limit 0 = unbounded
  std::vector<DocumentRecord> ListInFlight(std::size_t limit);

  void TransitionOnSubmit(int64_t id, DocumentStatus new_status, const std::string& knowledge_id, const std::string& file_hash,
                          const std::optional<std::string>& file_store_path);

  // discover -> failed; any other current status is InvalidState
  void MarkFailed(int64_t id, const std::string& reason);

  // pending/processing -> completed/failed. expected_knowledge_id, when
  // given, must still be the row's knowledge_id.
  void Finalize(int64_t id, DocumentStatus status, const std::optional<std::string>& reason = std::nullopt,
                const std::optional<std::string>& expected_knowledge_id = std::nullopt);

  // pending <-> processing; false when the row already had that status
  bool UpdateStatus(int64_t id, DocumentStatus status, const std::optional<std::string>& expected_knowledge_id = std::nullopt);

  // every non-deleted row keyed by filepath, from one read transaction
  std::map<std::string, DocumentRecord> LoadActive();

  std::optional<DocumentRecord> Find(int64_t id);
  std::optional<DocumentRecord> FindByPath(const std::string& path);

  // Appends one audit row; assigns run.id.
  void RecordRun(ScriptRunRecord& run);

 private:
  DocumentRecord Load(db::Transaction& tx, int64_t id);
  void           Store(db::Transaction& tx, const DocumentRecord& record);

  static void RequireTransition(const DocumentRecord& record, DocumentStatus to);
  static void RequireKnowledgeId(const DocumentRecord& record, const std::optional<std::string>& expected);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace kbsync::ledger
