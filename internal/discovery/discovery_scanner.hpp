#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/model/document_record.hpp"
#include "internal/discovery/file_scanner.hpp"
#include "internal/pipeline/stage.hpp"

namespace kbsync::ledger {
class LedgerStore;
}

namespace kbsync::ingest {
class IngestionClient;
}

namespace kbsync::discovery {

struct DiscoveryOptions {
  ScanOptions scan;
  // delete the remote entity of a changed file before resetting its row
  bool purge_remote_on_change = true;
};

/*
  Result of diffing one filesystem enumeration against one ledger read.
  All three lists are in path order.
*/
struct Classification {
  std::vector<std::string> inserted; // on disk, not in the ledger
  std::vector<std::string> changed;  // in both, size or mtime differ
  std::vector<std::string> removed;  // in the ledger, gone from disk
  std::size_t              unchanged = 0;
};

/*
  DiscoveryScanner

  Reconciles the configured roots with the ledger:
    new files       -> discover rows
    changed files   -> rows reset to discover (processing rows wait)
    removed files   -> remote entity deleted, then row marked deleted

  A root or ledger failure fails the whole run before or during
  reconciliation; a failure on one record is logged and the run goes on.
*/
class DiscoveryScanner final : public pipeline::Stage {
 public:
  DiscoveryScanner(std::shared_ptr<ledger::LedgerStore> ledger, std::shared_ptr<ingest::IngestionClient> client, DiscoveryOptions options);

  std::string_view Name() const override {
    return pipeline::kDiscoverStage;
  }

  db::model::ScriptRunRecord Run() override;

  static Classification Classify(const std::map<std::string, FileInfo>& current, const std::map<std::string, db::model::DocumentRecord>& ledger,
                                 const std::set<std::string>& unobserved);

 private:
  bool ApplyChanged(const std::string& path, const FileInfo& info, const db::model::DocumentRecord& record);
  bool ApplyRemoved(const db::model::DocumentRecord& record);

  std::shared_ptr<ledger::LedgerStore>     ledger_;
  std::shared_ptr<ingest::IngestionClient> client_;
  DiscoveryOptions                         options_;
};

} // namespace kbsync::discovery
