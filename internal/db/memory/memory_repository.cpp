#include "memory_repository.hpp"

#include <algorithm>
#include <stdexcept>

#include "memory_tx.hpp"

namespace kbsync::db::memory {

using kbsync::model::DocumentStatus;

namespace {

bool Matches(const model::DocumentRecord& r, const DocumentFilter& filter) {
  if (filter.status && r.status != *filter.status) return false;
  if (filter.exclude_deleted && r.status == DocumentStatus::kDeleted) return false;
  return true;
}

// Same ordering the SQL backend produces (NULL finish_at sorts last).
void Sort(std::vector<model::DocumentRecord>& rows, DocumentOrder order) {
  switch (order) {
    case DocumentOrder::kInsertion:
      return;
    case DocumentOrder::kNewestFirst:
      std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
      });
      return;
    case DocumentOrder::kRecentlyFinished:
      std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.finish_at != b.finish_at) {
          if (!a.finish_at) return false;
          if (!b.finish_at) return true;
          return *a.finish_at > *b.finish_at;
        }
        return a.id > b.id;
      });
      return;
  }
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static MemoryRepository::State& Writable(db::Transaction& tx) {
  auto& mtx = TX(tx);
  if (!mtx.Writable()) throw std::logic_error("write inside a read-only transaction");
  return mtx.Mutable();
}

Result MemoryRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
  auto& s = Writable(t);
  if (s.path_to_id.contains(r.filepath)) {
    return Result::Err(ErrorCode::AlreadyExists, "UNIQUE constraint failed: document_status_table.filepath");
  }
  r.id                     = s.next_document_id++;
  s.documents[r.id]        = r;
  s.path_to_id[r.filepath] = r.id;
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.documents.find(id);
  if (it == s.documents.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocumentByPath(Transaction& t, const std::string& filepath) {
  const auto& s  = TX(t).View();
  auto        it = s.path_to_id.find(filepath);
  if (it == s.path_to_id.end()) return std::nullopt;
  return s.documents.at(it->second);
}

Result MemoryRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r) {
  auto& s  = Writable(t);
  auto  it = s.documents.find(r.id);
  if (it == s.documents.end()) return Result::Err(ErrorCode::NotFound, "document " + std::to_string(r.id));

  if (it->second.filepath != r.filepath) {
    if (s.path_to_id.contains(r.filepath)) {
      return Result::Err(ErrorCode::AlreadyExists, "UNIQUE constraint failed: document_status_table.filepath");
    }
    s.path_to_id.erase(it->second.filepath);
    s.path_to_id[r.filepath] = r.id;
  }
  it->second = r;
  return Result::Ok();
}

std::vector<model::DocumentRecord> MemoryRepository::ListDocuments(Transaction& t, const DocumentFilter& filter, const Pagination& page) {
  const auto&                        s = TX(t).View();
  std::vector<model::DocumentRecord> rows;
  for (const auto& [_, record] : s.documents) {
    if (Matches(record, filter)) rows.push_back(record);
  }
  Sort(rows, filter.order);

  if (page.offset >= rows.size()) return {};
  auto first = rows.begin() + static_cast<std::ptrdiff_t>(page.offset);
  auto last  = rows.end();
  if (page.limit > 0 && page.limit < static_cast<std::size_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(page.limit);
  }
  return {first, last};
}

int64_t MemoryRepository::CountDocuments(Transaction& t, const DocumentFilter& filter) {
  const auto& s = TX(t).View();
  return std::count_if(s.documents.begin(), s.documents.end(), [&filter](const auto& kv) { return Matches(kv.second, filter); });
}

std::vector<StatusCount> MemoryRepository::CountByStatus(Transaction& t) {
  std::map<std::string, int64_t> counts;
  for (const auto& [_, record] : TX(t).View().documents) {
    counts[std::string(kbsync::model::ToString(record.status))]++;
  }

  std::vector<StatusCount> out;
  out.reserve(counts.size());
  for (const auto& [status, count] : counts) {
    out.push_back(StatusCount{.status = status, .count = count});
  }
  return out;
}

Result MemoryRepository::InsertScriptRun(Transaction& t, model::ScriptRunRecord& r) {
  auto& s = Writable(t);
  r.id    = s.next_run_id++;
  s.runs.push_back(r);
  return Result::Ok();
}

std::vector<model::ScriptRunRecord> MemoryRepository::ListScriptRuns(Transaction& t, const std::string& script_name, std::size_t limit) {
  const auto&                         s = TX(t).View();
  std::vector<model::ScriptRunRecord> out;
  for (auto it = s.runs.rbegin(); it != s.runs.rend(); ++it) {
    if (!script_name.empty() && it->script_name != script_name) continue;
    out.push_back(*it);
    if (limit > 0 && out.size() >= limit) break;
  }
  return out;
}

} // namespace kbsync::db::memory
