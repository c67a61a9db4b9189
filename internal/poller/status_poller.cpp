#include "status_poller.hpp"

#include <thread>
#include <utility>

#include "internal/ingest/ingestion_client.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/model/document_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/run_recorder.hpp"
#include "internal/util/errors.hpp"

namespace kbsync::poller {

using kbsync::model::DocumentStatus;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kUnknownError  = "unknown error";
constexpr const char* kRemoteMissing = "external record not found";
constexpr const char* kNoKnowledgeId = "in-flight document has no knowledge id";

} // namespace

StatusPoller::StatusPoller(std::shared_ptr<ledger::LedgerStore> ledger, std::shared_ptr<ingest::IngestionClient> client, PollerOptions options)
    : ledger_(std::move(ledger)), client_(std::move(client)), options_(options) {
}

db::model::ScriptRunRecord StatusPoller::Run() {
  return pipeline::RecordStageRun(*ledger_, Name(), [this](pipeline::StageCounts& counts) {
    const auto in_flight = ledger_->ListInFlight(options_.batch_size);
    if (in_flight.empty()) {
      KBSYNC_LOG_DEBUG("nothing in flight");
      return;
    }

    int64_t completed = 0;
    int64_t failed    = 0;
    bool    first     = true;
    for (const auto& record : in_flight) {
      if (!first && options_.request_delay.count() > 0) {
        std::this_thread::sleep_for(options_.request_delay);
      }
      first = false;

      ++counts.process;
      Outcome outcome = Outcome::kUnchanged;
      try {
        outcome = PollOne(record);
      } catch (const util::LedgerUnavailable&) {
        throw;
      } catch (const std::exception& e) {
        // NotFound / InvalidState: the row moved on since it was listed
        KBSYNC_LOG_WARN("poll result not applied", {IntField("id", record.id), StringField("path", record.filepath), StringField("error", e.what())});
        continue;
      }

      switch (outcome) {
        case Outcome::kUnchanged:
          break;
        case Outcome::kUpdated:
          ++counts.update;
          break;
        case Outcome::kCompleted:
          ++counts.update;
          ++completed;
          break;
        case Outcome::kFailed:
          ++counts.update;
          ++failed;
          break;
      }
    }

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordTransition(Name(), "completed", static_cast<uint64_t>(completed));
    metrics.RecordTransition(Name(), "failed", static_cast<uint64_t>(failed));
    metrics.RecordTransition(Name(), "updated", static_cast<uint64_t>(counts.update - completed - failed));
  });
}

StatusPoller::Outcome StatusPoller::PollOne(const db::model::DocumentRecord& record) {
  if (!record.knowledge_id || record.knowledge_id->empty()) {
    KBSYNC_LOG_ERROR(kNoKnowledgeId, {IntField("id", record.id), StringField("path", record.filepath)});
    ledger_->Finalize(record.id, DocumentStatus::kFailed, std::string(kNoKnowledgeId), record.knowledge_id);
    return Outcome::kFailed;
  }

  const std::string& knowledge_id = *record.knowledge_id;
  auto               result       = client_->GetKnowledge(knowledge_id);

  switch (result.status) {
    case ingest::ApiStatus::kOk:
      break;
    case ingest::ApiStatus::kTransient:
      KBSYNC_LOG_WARN("status query failed, retrying next cycle", {IntField("id", record.id), StringField("knowledge_id", knowledge_id),
                                                                   IntField("http_status", result.http_status), StringField("error", result.message)});
      return Outcome::kUnchanged;
    case ingest::ApiStatus::kNotFound:
      KBSYNC_LOG_WARN(kRemoteMissing, {IntField("id", record.id), StringField("knowledge_id", knowledge_id)});
      ledger_->Finalize(record.id, DocumentStatus::kFailed, std::string(kRemoteMissing), knowledge_id);
      return Outcome::kFailed;
    case ingest::ApiStatus::kRejected:
      KBSYNC_LOG_WARN("status query rejected", {IntField("id", record.id), StringField("knowledge_id", knowledge_id),
                                                IntField("http_status", result.http_status), StringField("error", result.message)});
      ledger_->Finalize(record.id, DocumentStatus::kFailed, result.message, knowledge_id);
      return Outcome::kFailed;
  }

  const auto& remote = result.knowledge.parse_status();
  auto        parsed = kbsync::model::ParseDocumentStatus(remote);
  if (!parsed) {
    KBSYNC_LOG_WARN("unrecognized remote status", {IntField("id", record.id), StringField("knowledge_id", knowledge_id), StringField("status", remote)});
    return Outcome::kUnchanged;
  }

  switch (*parsed) {
    case DocumentStatus::kCompleted:
      ledger_->Finalize(record.id, DocumentStatus::kCompleted, std::nullopt, knowledge_id);
      KBSYNC_LOG_INFO("document completed", {IntField("id", record.id), StringField("path", record.filepath)});
      return Outcome::kCompleted;
    case DocumentStatus::kFailed: {
      const auto& msg    = result.knowledge.error_message();
      std::string reason = msg.empty() ? std::string(kUnknownError) : msg;
      ledger_->Finalize(record.id, DocumentStatus::kFailed, reason, knowledge_id);
      KBSYNC_LOG_INFO("document failed remotely", {IntField("id", record.id), StringField("path", record.filepath), StringField("reason", reason)});
      return Outcome::kFailed;
    }
    case DocumentStatus::kPending:
    case DocumentStatus::kProcessing:
      return ledger_->UpdateStatus(record.id, *parsed, knowledge_id) ? Outcome::kUpdated : Outcome::kUnchanged;
    default:
      // discover, deleted, unknown are not states the service reports
      KBSYNC_LOG_WARN("unexpected remote status", {IntField("id", record.id), StringField("knowledge_id", knowledge_id), StringField("status", remote)});
      return Outcome::kUnchanged;
  }
}

} // namespace kbsync::poller
