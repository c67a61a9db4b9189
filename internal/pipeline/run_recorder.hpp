#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include "internal/db/model/script_run_record.hpp"

namespace kbsync::ledger {
class LedgerStore;
}

namespace kbsync::pipeline {

struct StageCounts {
  int64_t process = 0;
  int64_t insert  = 0;
  int64_t update  = 0;
  int64_t remove  = 0;
};

/*
  Runs one stage body inside a span, times it and appends the ScriptRun.

  The run is "fail" when the body throws; the exception text becomes
  failed_reason and the counts gathered so far are kept. A failure to
  write the audit row is logged, never thrown.
*/
db::model::ScriptRunRecord RecordStageRun(ledger::LedgerStore& ledger, std::string_view stage, const std::function<void(StageCounts&)>& body);

} // namespace kbsync::pipeline
