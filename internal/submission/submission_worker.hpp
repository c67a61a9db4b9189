#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "internal/db/model/document_record.hpp"
#include "internal/hash/file_hasher.hpp"
#include "internal/pipeline/stage.hpp"

namespace kbsync::ledger {
class LedgerStore;
}

namespace kbsync::ingest {
class IngestionClient;
}

namespace kbsync::submission {

struct SubmissionOptions {
  std::size_t         batch_size = 50;
  hash::HashAlgorithm algorithm  = hash::HashAlgorithm::kSha256;
  std::string         knowledge_base_id;
};

/*
  SubmissionWorker

  Drains discover rows in id order, at most batch_size per run. Each file
  is read once, hashed and uploaded; the row then moves to pending or
  processing with its knowledge_id. Any failure of that file marks the
  row failed with the concrete error and the batch continues. A file
  that vanished is left in discover for Discovery to retire.
*/
class SubmissionWorker final : public pipeline::Stage {
 public:
  SubmissionWorker(std::shared_ptr<ledger::LedgerStore> ledger, std::shared_ptr<ingest::IngestionClient> client, SubmissionOptions options);

  std::string_view Name() const override {
    return pipeline::kSubmitStage;
  }

  db::model::ScriptRunRecord Run() override;

 private:
  enum class Outcome { kSubmitted, kFailed, kSkipped };

  Outcome SubmitOne(const db::model::DocumentRecord& record);
  void    Fail(const db::model::DocumentRecord& record, const std::string& reason);

  std::shared_ptr<ledger::LedgerStore>     ledger_;
  std::shared_ptr<ingest::IngestionClient> client_;
  SubmissionOptions                        options_;
  hash::FileHasher                         hasher_;
};

} // namespace kbsync::submission
