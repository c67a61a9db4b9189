#include "ledger_store.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace kbsync::ledger {

using kbsync::model::CanTransition;
using kbsync::model::DocumentStatus;
using kbsync::model::ToString;

namespace {

std::string BaseName(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;

  const std::string detail = context + ": " + std::string(db::ToString(result.code)) + (result.message.empty() ? "" : " (" + result.message + ")");
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(detail);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(detail);
    default:
      throw util::LedgerUnavailable(detail);
  }
}

// Domain errors pass through; anything a backend throws becomes LedgerUnavailable.
template <typename Fn>
auto Guarded(const char* op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::NotFound&) {
    throw;
  } catch (const util::AlreadyExists&) {
    throw;
  } catch (const util::InvalidState&) {
    throw;
  } catch (const util::LedgerUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::LedgerUnavailable(std::string(op) + ": " + e.what());
  }
}

} // namespace

const char* ToString(UpsertOutcome outcome) {
  switch (outcome) {
    case UpsertOutcome::kInserted:
      return "inserted";
    case UpsertOutcome::kReset:
      return "reset";
    case UpsertOutcome::kUnchanged:
      return "unchanged";
    case UpsertOutcome::kDeferredProcessing:
      return "deferred_processing";
    case UpsertOutcome::kSkippedDeleted:
      return "skipped_deleted";
  }
  return "unknown";
}

LedgerStore::LedgerStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

LedgerStore::DocumentRecord LedgerStore::Load(db::Transaction& tx, int64_t id) {
  auto record = repository_->GetDocument(tx, id);
  if (!record) throw util::NotFound("document " + std::to_string(id));
  return *record;
}

void LedgerStore::Store(db::Transaction& tx, const DocumentRecord& record) {
  ThrowIfDbError(repository_->UpdateDocument(tx, record), "update document " + std::to_string(record.id));
}

void LedgerStore::RequireTransition(const DocumentRecord& record, DocumentStatus to) {
  if (!CanTransition(record.status, to)) {
    throw util::InvalidState("document " + std::to_string(record.id) + " cannot move from " + std::string(ToString(record.status)) + " to " +
                             std::string(ToString(to)));
  }
}

void LedgerStore::RequireKnowledgeId(const DocumentRecord& record, const std::optional<std::string>& expected) {
  if (expected && record.knowledge_id != expected) {
    throw util::InvalidState("document " + std::to_string(record.id) + " was resubmitted (knowledge_id " + record.knowledge_id.value_or("<none>") +
                             ", expected " + *expected + ")");
  }
}

// ------------------------------------------------------------------
// Discovery
// ------------------------------------------------------------------

UpsertOutcome LedgerStore::UpsertDiscovered(const std::string& path, int64_t size, double mtime) {
  return Guarded("upsert discovered", [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetDocumentByPath(*tx, path);
    auto now      = util::Now();

    if (!existing) {
      DocumentRecord record;
      record.filename           = BaseName(path);
      record.filepath           = path;
      record.status             = DocumentStatus::kDiscover;
      record.created_at         = now;
      record.last_modified_time = mtime;
      record.file_size          = size;
      ThrowIfDbError(repository_->InsertDocument(*tx, record), "insert " + path);
      tx->Commit();
      return UpsertOutcome::kInserted;
    }

    if (existing->status == DocumentStatus::kDeleted) {
      return UpsertOutcome::kSkippedDeleted;
    }

    if (existing->file_size == size && existing->last_modified_time == mtime) {
      return UpsertOutcome::kUnchanged;
    }

    if (existing->status == DocumentStatus::kProcessing) {
      return UpsertOutcome::kDeferredProcessing;
    }

    RequireTransition(*existing, DocumentStatus::kDiscover);

    existing->status             = DocumentStatus::kDiscover;
    existing->created_at         = now;
    existing->last_modified_time = mtime;
    existing->file_size          = size;
    existing->knowledge_id.reset();
    existing->file_hash.reset();
    existing->file_store_path.reset();
    existing->process_at.reset();
    existing->finish_at.reset();
    existing->failed_msg.reset();
    Store(*tx, *existing);
    tx->Commit();
    return UpsertOutcome::kReset;
  });
}

bool LedgerStore::MarkDeleted(const std::string& path, const std::optional<std::string>& purged_knowledge_id) {
  return Guarded("mark deleted", [&] {
    auto tx     = repository_->Begin();
    auto record = repository_->GetDocumentByPath(*tx, path);
    if (!record) throw util::NotFound("document " + path);
    if (record->status == DocumentStatus::kDeleted) return false;
    if (record->knowledge_id && record->knowledge_id != purged_knowledge_id) {
      throw util::InvalidState("document " + path + " still holds remote knowledge " + *record->knowledge_id);
    }

    record->status    = DocumentStatus::kDeleted;
    record->finish_at = util::Now();
    record->knowledge_id.reset();
    Store(*tx, *record);
    tx->Commit();
    return true;
  });
}

std::map<std::string, LedgerStore::DocumentRecord> LedgerStore::LoadActive() {
  return Guarded("load active", [&] {
    auto tx   = repository_->BeginRead();
    auto rows = repository_->ListDocuments(*tx, db::DocumentFilter{.exclude_deleted = true}, db::Pagination{});
    tx->Commit();

    std::map<std::string, DocumentRecord> active;
    for (auto& row : rows) {
      auto path = row.filepath;
      active.emplace(std::move(path), std::move(row));
    }
    return active;
  });
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<LedgerStore::DocumentRecord> LedgerStore::ListByStatus(DocumentStatus status, std::size_t limit) {
  return Guarded("list by status", [&] {
    auto tx   = repository_->BeginRead();
    auto rows = repository_->ListDocuments(*tx, db::DocumentFilter{.status = status}, db::Pagination{.limit = limit});
    tx->Commit();
    return rows;
  });
}

std::vector<LedgerStore::DocumentRecord> LedgerStore::ListInFlight(std::size_t limit) {
  return Guarded("list in flight", [&] {
    auto tx         = repository_->BeginRead();
    auto rows       = repository_->ListDocuments(*tx, db::DocumentFilter{.status = DocumentStatus::kPending}, db::Pagination{.limit = limit});
    auto processing = repository_->ListDocuments(*tx, db::DocumentFilter{.status = DocumentStatus::kProcessing}, db::Pagination{.limit = limit});
    tx->Commit();

    rows.insert(rows.end(), std::make_move_iterator(processing.begin()), std::make_move_iterator(processing.end()));
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    if (limit > 0 && rows.size() > limit) rows.resize(limit);
    return rows;
  });
}

std::optional<LedgerStore::DocumentRecord> LedgerStore::Find(int64_t id) {
  return Guarded("find", [&] {
    auto tx     = repository_->BeginRead();
    auto record = repository_->GetDocument(*tx, id);
    tx->Commit();
    return record;
  });
}

std::optional<LedgerStore::DocumentRecord> LedgerStore::FindByPath(const std::string& path) {
  return Guarded("find by path", [&] {
    auto tx     = repository_->BeginRead();
    auto record = repository_->GetDocumentByPath(*tx, path);
    tx->Commit();
    return record;
  });
}

// ------------------------------------------------------------------
// Submission / polling
// ------------------------------------------------------------------

void LedgerStore::TransitionOnSubmit(int64_t id, DocumentStatus new_status, const std::string& knowledge_id, const std::string& file_hash,
                                     const std::optional<std::string>& file_store_path) {
  Guarded("transition on submit", [&] {
    if (!kbsync::model::IsInFlight(new_status)) {
      throw util::InvalidState("submission cannot set status " + std::string(ToString(new_status)));
    }

    auto tx     = repository_->Begin();
    auto record = Load(*tx, id);

    // a second submitter must not overwrite the first one's knowledge_id
    if (record.status != DocumentStatus::kDiscover) {
      throw util::InvalidState("document " + std::to_string(id) + " is " + std::string(ToString(record.status)) + ", expected discover");
    }
    RequireTransition(record, new_status);

    record.status          = new_status;
    record.knowledge_id    = knowledge_id;
    record.file_hash       = file_hash;
    record.file_store_path = file_store_path;
    record.process_at      = util::Now();
    record.failed_msg.reset();
    Store(*tx, record);
    tx->Commit();
  });
}

void LedgerStore::MarkFailed(int64_t id, const std::string& reason) {
  Guarded("mark failed", [&] {
    auto tx     = repository_->Begin();
    auto record = Load(*tx, id);
    // submission failures only; in-flight rows are finalized by the poller
    if (record.status != DocumentStatus::kDiscover) {
      throw util::InvalidState("document " + std::to_string(id) + " is " + std::string(ToString(record.status)) + ", expected discover");
    }

    record.status     = DocumentStatus::kFailed;
    record.failed_msg = reason;
    record.finish_at  = util::Now();
    Store(*tx, record);
    tx->Commit();
  });
}

void LedgerStore::Finalize(int64_t id, DocumentStatus status, const std::optional<std::string>& reason,
                           const std::optional<std::string>& expected_knowledge_id) {
  Guarded("finalize", [&] {
    if (status != DocumentStatus::kCompleted && status != DocumentStatus::kFailed) {
      throw util::InvalidState("finalize needs completed or failed, got " + std::string(ToString(status)));
    }

    auto tx     = repository_->Begin();
    auto record = Load(*tx, id);
    RequireKnowledgeId(record, expected_knowledge_id);
    if (!kbsync::model::IsInFlight(record.status)) {
      throw util::InvalidState("document " + std::to_string(id) + " is " + std::string(ToString(record.status)) + ", not in flight");
    }
    RequireTransition(record, status);

    record.status    = status;
    record.finish_at = util::Now();
    if (status == DocumentStatus::kFailed) {
      record.failed_msg = reason.value_or("unknown error");
    } else {
      record.failed_msg.reset();
    }
    Store(*tx, record);
    tx->Commit();
  });
}

bool LedgerStore::UpdateStatus(int64_t id, DocumentStatus status, const std::optional<std::string>& expected_knowledge_id) {
  return Guarded("update status", [&] {
    if (!kbsync::model::IsInFlight(status)) {
      throw util::InvalidState("status sync only moves between pending and processing, got " + std::string(ToString(status)));
    }

    auto tx     = repository_->Begin();
    auto record = Load(*tx, id);
    RequireKnowledgeId(record, expected_knowledge_id);
    if (record.status == status) return false;
    if (!kbsync::model::IsInFlight(record.status)) {
      throw util::InvalidState("document " + std::to_string(id) + " is " + std::string(ToString(record.status)) + ", not in flight");
    }
    RequireTransition(record, status);

    record.status = status;
    Store(*tx, record);
    tx->Commit();
    return true;
  });
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

void LedgerStore::RecordRun(ScriptRunRecord& run) {
  Guarded("record run", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertScriptRun(*tx, run), "insert run " + run.script_name);
    tx->Commit();
  });
}

} // namespace kbsync::ledger
