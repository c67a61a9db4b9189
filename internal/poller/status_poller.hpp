#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "internal/db/model/document_record.hpp"
#include "internal/pipeline/stage.hpp"

namespace kbsync::ledger {
class LedgerStore;
}

namespace kbsync::ingest {
class IngestionClient;
}

namespace kbsync::poller {

struct PollerOptions {
  std::size_t               batch_size = 0; // 0 = every in-flight row
  std::chrono::milliseconds request_delay{200};
};

/*
  StatusPoller

  Reconciles pending and processing rows with the remote parse status.
  Transient failures leave the row untouched for the next cycle; every
  ledger write is conditioned on the knowledge_id the poller queried so
  a row reset by Discovery in the meantime is never overwritten.
*/
class StatusPoller final : public pipeline::Stage {
 public:
  StatusPoller(std::shared_ptr<ledger::LedgerStore> ledger, std::shared_ptr<ingest::IngestionClient> client, PollerOptions options);

  std::string_view Name() const override {
    return pipeline::kPollStage;
  }

  db::model::ScriptRunRecord Run() override;

 private:
  enum class Outcome { kUnchanged, kUpdated, kCompleted, kFailed };

  Outcome PollOne(const db::model::DocumentRecord& record);

  std::shared_ptr<ledger::LedgerStore>     ledger_;
  std::shared_ptr<ingest::IngestionClient> client_;
  PollerOptions                            options_;
};

} // namespace kbsync::poller
