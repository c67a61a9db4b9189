#pragma once

#include <string_view>

#include "internal/db/model/script_run_record.hpp"

namespace kbsync::pipeline {

inline constexpr std::string_view kDiscoverStage = "discover";
inline constexpr std::string_view kSubmitStage   = "submit";
inline constexpr std::string_view kPollStage     = "poll";

/*
  One pipeline stage: an idempotent, re-entrant pass over the ledger.

  Run() never throws. Whatever happens is summarized in the returned
  ScriptRun, which has already been appended to the audit log when the
  ledger was reachable.
*/
class Stage {
 public:
  virtual ~Stage() = default;

  virtual std::string_view Name() const = 0;

  virtual db::model::ScriptRunRecord Run() = 0;
};

} // namespace kbsync::pipeline
