#include "submission_worker.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/ingest/ingestion_client.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/model/document_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/run_recorder.hpp"
#include "internal/util/errors.hpp"

namespace kbsync::submission {

using kbsync::model::DocumentStatus;
using observability::IntField;
using observability::StringField;

namespace {

std::string ReadWholeFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    const int err = errno;
    throw util::FilesystemError("cannot open file: " + std::generic_category().message(err));
  }
  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    throw util::FilesystemError("cannot read file " + path);
  }
  return content.str();
}

// pending and processing are kept; anything else is left for the poller
DocumentStatus InitialStatus(const std::string& parse_status) {
  auto parsed = kbsync::model::ParseDocumentStatus(parse_status);
  if (parsed && kbsync::model::IsInFlight(*parsed)) return *parsed;
  return DocumentStatus::kProcessing;
}

} // namespace

SubmissionWorker::SubmissionWorker(std::shared_ptr<ledger::LedgerStore> ledger, std::shared_ptr<ingest::IngestionClient> client,
                                   SubmissionOptions options)
    : ledger_(std::move(ledger)), client_(std::move(client)), options_(std::move(options)), hasher_(options_.algorithm) {
}

db::model::ScriptRunRecord SubmissionWorker::Run() {
  return pipeline::RecordStageRun(*ledger_, Name(), [this](pipeline::StageCounts& counts) {
    if (options_.knowledge_base_id.empty()) {
      throw std::runtime_error("ingestion.knowledge_base_id is not configured");
    }

    const auto batch = ledger_->ListByStatus(DocumentStatus::kDiscover, options_.batch_size);
    if (batch.empty()) {
      KBSYNC_LOG_DEBUG("nothing to submit");
      return;
    }

    int64_t failed = 0;
    for (const auto& record : batch) {
      ++counts.process;
      switch (SubmitOne(record)) {
        case Outcome::kSubmitted:
          ++counts.update;
          break;
        case Outcome::kFailed:
          ++failed;
          break;
        case Outcome::kSkipped:
          break;
      }
    }

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordTransition(Name(), "submitted", static_cast<uint64_t>(counts.update));
    metrics.RecordTransition(Name(), "failed", static_cast<uint64_t>(failed));
  });
}

SubmissionWorker::Outcome SubmissionWorker::SubmitOne(const db::model::DocumentRecord& record) {
  struct stat st {};
  if (::stat(record.filepath.c_str(), &st) != 0) {
    if (errno == ENOENT) {
      KBSYNC_LOG_WARN("file vanished before submission, left for discovery", {StringField("path", record.filepath), IntField("id", record.id)});
      return Outcome::kSkipped;
    }
  } else if (!S_ISREG(st.st_mode)) {
    Fail(record, "not a regular file: " + record.filepath);
    return Outcome::kFailed;
  }

  std::string content;
  try {
    content = ReadWholeFile(record.filepath);
  } catch (const std::exception& e) {
    Fail(record, e.what());
    return Outcome::kFailed;
  }

  const std::string file_hash = hasher_.HashBytes(content);

  auto result = client_->Submit(ingest::UploadRequest{.file_name = record.filename, .content = std::move(content)});
  if (!result.ok()) {
    Fail(record, result.message);
    return Outcome::kFailed;
  }

  const auto& knowledge = result.knowledge;
  if (knowledge.id().empty()) {
    Fail(record, "upload response carries no knowledge id");
    return Outcome::kFailed;
  }

  const auto status = InitialStatus(knowledge.parse_status());
  std::optional<std::string> store_path;
  if (!knowledge.file_path().empty()) store_path = knowledge.file_path();

  try {
    ledger_->TransitionOnSubmit(record.id, status, knowledge.id(), file_hash, store_path);
  } catch (const std::exception& e) {
    // the row moved on (deleted, reset, or taken by another submitter) or
    // the ledger is down; the uploaded copy has no owner now
    KBSYNC_LOG_ERROR("submitted document could not be recorded",
                     {StringField("path", record.filepath), IntField("id", record.id), StringField("knowledge_id", knowledge.id()), StringField("error", e.what())});
    auto cleanup = client_->DeleteKnowledge(knowledge.id());
    if (!cleanup.ok() && cleanup.status != ingest::ApiStatus::kNotFound) {
      KBSYNC_LOG_ERROR("orphaned remote knowledge left behind", {StringField("knowledge_id", knowledge.id()), StringField("error", cleanup.message)});
    }
    return Outcome::kSkipped;
  }

  KBSYNC_LOG_INFO("document submitted", {StringField("path", record.filepath), IntField("id", record.id), StringField("knowledge_id", knowledge.id()),
                                         StringField("status", kbsync::model::ToString(status))});
  return Outcome::kSubmitted;
}

void SubmissionWorker::Fail(const db::model::DocumentRecord& record, const std::string& reason) {
  KBSYNC_LOG_WARN("submission failed", {StringField("path", record.filepath), IntField("id", record.id), StringField("reason", reason)});
  try {
    ledger_->MarkFailed(record.id, reason);
  } catch (const std::exception& e) {
    KBSYNC_LOG_ERROR("could not mark document failed", {IntField("id", record.id), StringField("error", e.what())});
  }
}

} // namespace kbsync::submission
