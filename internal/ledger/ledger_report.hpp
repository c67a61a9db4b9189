#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/script_run_record.hpp"
#include "internal/model/document_status.hpp"

namespace kbsync::ledger {

struct StatusSummary {
  // every known status, zero when absent; rows with an unrecognized
  // status text are counted under "unknown"
  std::map<std::string, int64_t>          counts;
  int64_t                                 total = 0;
  std::vector<db::model::DocumentRecord>  recent_failures;
  std::vector<db::model::ScriptRunRecord> recent_runs;
};

struct DocumentPage {
  std::vector<db::model::DocumentRecord> rows;
  int64_t                                total = 0;
  std::size_t                            page  = 1; // 1-based
  std::size_t                            pages = 0;
};

/*
  Read-only views of the ledger for operators. Each call runs in one read
  transaction; backend failures throw util::LedgerUnavailable.
*/
class LedgerReport {
 public:
  static constexpr std::size_t kRecentCount    = 5;
  static constexpr std::size_t kPageSize       = 20;
  static constexpr std::size_t kDefaultRunList = 50;

  explicit LedgerReport(std::shared_ptr<db::Repository> repository);

  StatusSummary Summary();

  // newest first; page < 1 is treated as 1
  DocumentPage Documents(std::optional<kbsync::model::DocumentStatus> status, std::size_t page);

  std::vector<db::model::ScriptRunRecord> Runs(std::size_t limit = kDefaultRunList);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace kbsync::ledger
