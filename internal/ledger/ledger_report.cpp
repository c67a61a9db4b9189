#include "ledger_report.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace kbsync::ledger {

using kbsync::model::DocumentStatus;

namespace {

constexpr DocumentStatus kReportedStatuses[] = {
    DocumentStatus::kDiscover,  DocumentStatus::kPending, DocumentStatus::kProcessing,
    DocumentStatus::kCompleted, DocumentStatus::kFailed,  DocumentStatus::kDeleted,
};

template <typename Fn>
auto Reading(const char* op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::LedgerUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::LedgerUnavailable(std::string(op) + ": " + e.what());
  }
}

} // namespace

LedgerReport::LedgerReport(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

StatusSummary LedgerReport::Summary() {
  return Reading("summary", [&] {
    auto          tx = repository_->BeginRead();
    StatusSummary summary;

    for (auto status : kReportedStatuses) {
      summary.counts[std::string(kbsync::model::ToString(status))] = 0;
    }
    for (const auto& row : repository_->CountByStatus(*tx)) {
      auto parsed = kbsync::model::ParseDocumentStatus(row.status);
      auto key    = parsed ? std::string(kbsync::model::ToString(*parsed)) : std::string("unknown");
      summary.counts[key] += row.count;
      summary.total += row.count;
    }

    db::DocumentFilter failures{.status = DocumentStatus::kFailed, .exclude_deleted = false, .order = db::DocumentOrder::kRecentlyFinished};
    summary.recent_failures = repository_->ListDocuments(*tx, failures, db::Pagination{.limit = kRecentCount, .offset = 0});
    summary.recent_runs     = repository_->ListScriptRuns(*tx, "", kRecentCount);
    tx->Commit();
    return summary;
  });
}

DocumentPage LedgerReport::Documents(std::optional<DocumentStatus> status, std::size_t page) {
  return Reading("documents", [&] {
    auto tx = repository_->BeginRead();

    db::DocumentFilter filter{.status = status, .exclude_deleted = false, .order = db::DocumentOrder::kNewestFirst};

    DocumentPage out;
    out.page  = std::max<std::size_t>(page, 1);
    out.total = repository_->CountDocuments(*tx, filter);
    out.pages = static_cast<std::size_t>((out.total + kPageSize - 1) / kPageSize);
    out.rows  = repository_->ListDocuments(*tx, filter, db::Pagination{.limit = kPageSize, .offset = (out.page - 1) * kPageSize});
    tx->Commit();
    return out;
  });
}

std::vector<db::model::ScriptRunRecord> LedgerReport::Runs(std::size_t limit) {
  return Reading("runs", [&] {
    auto tx   = repository_->BeginRead();
    auto runs = repository_->ListScriptRuns(*tx, "", limit == 0 ? kDefaultRunList : limit);
    tx->Commit();
    return runs;
  });
}

} // namespace kbsync::ledger
