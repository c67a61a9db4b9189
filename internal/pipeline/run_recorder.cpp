#include "run_recorder.hpp"

#include <chrono>
#include <exception>
#include <string>

#include "internal/ledger/ledger_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace kbsync::pipeline {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

db::model::ScriptRunRecord RecordStageRun(ledger::LedgerStore& ledger, std::string_view stage, const std::function<void(StageCounts&)>& body) {
  observability::StageSpan span(stage);

  db::model::ScriptRunRecord run;
  run.script_name       = std::string(stage);
  run.process_timestamp = util::Now();

  StageCounts counts;
  const auto  started = std::chrono::steady_clock::now();
  try {
    body(counts);
    run.status = db::model::kRunSuccess;
  } catch (const std::exception& e) {
    run.status        = db::model::kRunFail;
    run.failed_reason = e.what();
    span.MarkFailed(e.what());
  }
  run.process_duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

  run.process_count = counts.process;
  run.insert_count  = counts.insert;
  run.update_count  = counts.update;
  run.delete_count  = counts.remove;

  span.SetCounts(run.process_count, run.insert_count, run.update_count, run.delete_count);

  const bool success = run.status == db::model::kRunSuccess;
  observability::Metrics::Instance().RecordStageRun(stage, success);
  observability::Metrics::Instance().ObserveStageDurationMs(stage, run.process_duration * 1000.0);

  try {
    ledger.RecordRun(run);
  } catch (const std::exception& e) {
    KBSYNC_LOG_ERROR("failed to record stage run", {StringField("stage", stage), StringField("error", e.what())});
  }

  if (success) {
    KBSYNC_LOG_INFO("stage run finished",
                    {StringField("stage", stage), IntField("processed", run.process_count), IntField("inserted", run.insert_count),
                     IntField("updated", run.update_count), IntField("deleted", run.delete_count), DoubleField("duration_s", run.process_duration)});
  } else {
    KBSYNC_LOG_ERROR("stage run failed", {StringField("stage", stage), StringField("reason", run.failed_reason), IntField("processed", run.process_count),
                                          DoubleField("duration_s", run.process_duration)});
  }
  return run;
}

} // namespace kbsync::pipeline
