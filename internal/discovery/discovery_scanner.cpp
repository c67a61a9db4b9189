#include "discovery_scanner.hpp"

#include <utility>

#include "internal/ingest/ingestion_client.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/run_recorder.hpp"
#include "internal/util/errors.hpp"

namespace kbsync::discovery {

using kbsync::model::DocumentStatus;
using ledger::UpsertOutcome;
using observability::IntField;
using observability::StringField;

DiscoveryScanner::DiscoveryScanner(std::shared_ptr<ledger::LedgerStore> ledger, std::shared_ptr<ingest::IngestionClient> client,
                                   DiscoveryOptions options)
    : ledger_(std::move(ledger)), client_(std::move(client)), options_(std::move(options)) {
}

Classification DiscoveryScanner::Classify(const std::map<std::string, FileInfo>&                  current,
                                          const std::map<std::string, db::model::DocumentRecord>& ledger,
                                          const std::set<std::string>&                            unobserved) {
  Classification out;

  // single ordered merge over both key sets
  auto cur = current.begin();
  auto led = ledger.begin();
  while (cur != current.end() || led != ledger.end()) {
    if (led == ledger.end() || (cur != current.end() && cur->first < led->first)) {
      out.inserted.push_back(cur->first);
      ++cur;
    } else if (cur == current.end() || led->first < cur->first) {
      if (!unobserved.contains(led->first)) out.removed.push_back(led->first);
      ++led;
    } else {
      const auto& info   = cur->second;
      const auto& record = led->second;
      if (info.size != record.file_size || info.mtime != record.last_modified_time) {
        out.changed.push_back(cur->first);
      } else {
        ++out.unchanged;
      }
      ++cur;
      ++led;
    }
  }
  return out;
}

db::model::ScriptRunRecord DiscoveryScanner::Run() {
  return pipeline::RecordStageRun(*ledger_, Name(), [this](pipeline::StageCounts& counts) {
    if (options_.scan.roots.empty()) {
      throw util::FilesystemError("no discovery roots configured");
    }

    FileScanner scanner(options_.scan);
    auto        scan   = scanner.Scan();
    auto        active = ledger_->LoadActive();
    auto        diff   = Classify(scan.files, active, scan.unobserved);

    KBSYNC_LOG_INFO("discovery classified", {IntField("files", static_cast<int64_t>(scan.files.size())), IntField("ledger", static_cast<int64_t>(active.size())),
                                             IntField("new", static_cast<int64_t>(diff.inserted.size())),
                                             IntField("changed", static_cast<int64_t>(diff.changed.size())),
                                             IntField("removed", static_cast<int64_t>(diff.removed.size())),
                                             IntField("unobserved", static_cast<int64_t>(scan.unobserved.size()))});

    int64_t skipped_deleted = 0;
    for (const auto& path : diff.inserted) {
      const auto& info = scan.files.at(path);
      try {
        switch (ledger_->UpsertDiscovered(path, info.size, info.mtime)) {
          case UpsertOutcome::kInserted:
            ++counts.insert;
            break;
          case UpsertOutcome::kReset:
            ++counts.update;
            break;
          case UpsertOutcome::kSkippedDeleted:
            ++skipped_deleted;
            KBSYNC_LOG_DEBUG("path belongs to a deleted record", {StringField("path", path)});
            break;
          case UpsertOutcome::kUnchanged:
          case UpsertOutcome::kDeferredProcessing:
            break;
        }
      } catch (const util::LedgerUnavailable&) {
        throw;
      } catch (const std::exception& e) {
        KBSYNC_LOG_ERROR("failed to record new file", {StringField("path", path), StringField("error", e.what())});
      }
    }

    for (const auto& path : diff.changed) {
      try {
        if (ApplyChanged(path, scan.files.at(path), active.at(path))) ++counts.update;
      } catch (const util::LedgerUnavailable&) {
        throw;
      } catch (const std::exception& e) {
        KBSYNC_LOG_ERROR("failed to reset changed file", {StringField("path", path), StringField("error", e.what())});
      }
    }

    for (const auto& path : diff.removed) {
      try {
        if (ApplyRemoved(active.at(path))) ++counts.remove;
      } catch (const util::LedgerUnavailable&) {
        throw;
      } catch (const std::exception& e) {
        KBSYNC_LOG_ERROR("failed to remove record", {StringField("path", path), StringField("error", e.what())});
      }
    }

    if (skipped_deleted > 0) {
      KBSYNC_LOG_INFO("files on disk belong to deleted records and stay untracked", {IntField("count", skipped_deleted)});
    }

    counts.process = counts.insert + counts.update + counts.remove;

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordTransition(Name(), "inserted", static_cast<uint64_t>(counts.insert));
    metrics.RecordTransition(Name(), "reset", static_cast<uint64_t>(counts.update));
    metrics.RecordTransition(Name(), "deleted", static_cast<uint64_t>(counts.remove));
  });
}

bool DiscoveryScanner::ApplyChanged(const std::string& path, const FileInfo& info, const db::model::DocumentRecord& record) {
  if (record.status == DocumentStatus::kProcessing) {
    KBSYNC_LOG_INFO("changed file is processing, reset deferred", {StringField("path", path), IntField("id", record.id)});
    return false;
  }

  if (options_.purge_remote_on_change && record.knowledge_id) {
    auto result = client_->DeleteKnowledge(*record.knowledge_id);
    if (result.status != ingest::ApiStatus::kOk && result.status != ingest::ApiStatus::kNotFound) {
      KBSYNC_LOG_ERROR("remote delete of stale version failed, reset deferred",
                       {StringField("path", path), StringField("knowledge_id", *record.knowledge_id), StringField("error", result.message)});
      return false;
    }
  }

  const auto outcome = ledger_->UpsertDiscovered(path, info.size, info.mtime);
  if (outcome == UpsertOutcome::kReset) {
    KBSYNC_LOG_INFO("changed file queued for resubmission", {StringField("path", path), IntField("id", record.id)});
    return true;
  }
  if (outcome == UpsertOutcome::kDeferredProcessing) {
    KBSYNC_LOG_INFO("changed file is processing, reset deferred", {StringField("path", path), IntField("id", record.id)});
  }
  return false;
}

bool DiscoveryScanner::ApplyRemoved(const db::model::DocumentRecord& record) {
  if (record.knowledge_id) {
    auto result = client_->DeleteKnowledge(*record.knowledge_id);
    if (result.status != ingest::ApiStatus::kOk && result.status != ingest::ApiStatus::kNotFound) {
      KBSYNC_LOG_ERROR("remote delete failed, record kept",
                       {StringField("path", record.filepath), StringField("knowledge_id", *record.knowledge_id), StringField("error", result.message)});
      return false;
    }
  }

  if (!ledger_->MarkDeleted(record.filepath, record.knowledge_id)) return false;
  KBSYNC_LOG_INFO("removed file marked deleted", {StringField("path", record.filepath), IntField("id", record.id)});
  return true;
}

} // namespace kbsync::discovery
