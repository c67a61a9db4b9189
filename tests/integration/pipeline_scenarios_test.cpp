#include <sys/stat.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/discovery/discovery_scanner.hpp"
#include "internal/factory.hpp"
#include "internal/ledger/ledger_report.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/poller/status_poller.hpp"
#include "internal/submission/submission_worker.hpp"
#include "tests/support/fake_ingestion_client.hpp"
#include "tests/support/temp_tree.hpp"

namespace {

using kbsync::discovery::DiscoveryScanner;
using kbsync::ingest::ApiStatus;
using kbsync::ledger::LedgerStore;
using kbsync::model::DocumentStatus;
using kbsync::poller::StatusPoller;
using kbsync::submission::SubmissionWorker;
using kbsync::testing::FakeIngestionClient;
using kbsync::testing::TempTree;

/*
  Three stages over one ledger, wired the way the factory wires them.
*/
struct Pipeline {
  explicit Pipeline(const std::string& name, const std::string& backend = "memory: {}") : tree(name) {
    std::filesystem::create_directories(tree.Path("erp"));
    config = kbsync::config::ConfigLoader::LoadFromString("database:\n  " + backend + "\ndiscovery:\n  roots: [\"" + tree.Path("erp") +
                                                          "\"]\ningestion:\n  knowledge_base_id: kb-1\npoller:\n  request_delay_ms: 0\n");

    auto repository = kbsync::factory::BuildRepository(config);
    ledger          = std::make_shared<LedgerStore>(repository);
    report          = std::make_shared<kbsync::ledger::LedgerReport>(repository);
    discovery       = std::make_shared<DiscoveryScanner>(ledger, client, kbsync::factory::BuildDiscoveryOptions(config));
    submission      = std::make_shared<SubmissionWorker>(ledger, client, kbsync::factory::BuildSubmissionOptions(config));
    poller          = std::make_shared<StatusPoller>(ledger, client, kbsync::factory::BuildPollerOptions(config));
  }

  TempTree                                      tree;
  kbsync::runtime::config::RuntimeConfig        config;
  std::shared_ptr<FakeIngestionClient>          client = std::make_shared<FakeIngestionClient>();
  std::shared_ptr<LedgerStore>                  ledger;
  std::shared_ptr<kbsync::ledger::LedgerReport> report;
  std::shared_ptr<DiscoveryScanner>             discovery;
  std::shared_ptr<SubmissionWorker>             submission;
  std::shared_ptr<StatusPoller>                 poller;
};

// A: a new 2 KB report.pdf is picked up with its metadata and no hash.
void TestNewFileIsDiscovered() {
  Pipeline   p("scenario_a");
  const auto path = p.tree.Write("erp/report.pdf", 2048);

  auto run = p.discovery->Run();
  assert(run.status == kbsync::db::model::kRunSuccess);
  assert(run.insert_count == 1);

  auto row = p.ledger->FindByPath(path);
  assert(row.has_value());
  assert(row->status == DocumentStatus::kDiscover);
  assert(row->filename == "report.pdf");
  assert(row->file_size == 2048);

  struct stat st {};
  assert(::stat(path.c_str(), &st) == 0);
  assert(row->last_modified_time == static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9);
  assert(!row->file_hash.has_value());
}

// B: an edited completed file goes back to discover without its remote identity.
void TestEditedCompletedFileIsReset() {
  Pipeline   p("scenario_b");
  const auto path = p.tree.Write("erp/contract.docx", 4096);

  p.discovery->Run();
  p.submission->Run();
  auto id = p.ledger->FindByPath(path)->id;
  auto kid = *p.ledger->Find(id)->knowledge_id;
  p.client->SetRemoteStatus(kid, "completed");
  p.poller->Run();
  assert(p.ledger->Find(id)->status == DocumentStatus::kCompleted);
  assert(p.ledger->Find(id)->file_hash.has_value());

  p.tree.Write("erp/contract.docx", 5000);
  p.tree.Touch("erp/contract.docx", 10);
  auto run = p.discovery->Run();
  assert(run.update_count == 1);

  auto row = p.ledger->Find(id);
  assert(row->status == DocumentStatus::kDiscover);
  assert(!row->knowledge_id.has_value());
  assert(!row->file_hash.has_value());
  assert(row->file_size == 5000);
}

// C: a pending record whose remote copy is gone is failed.
void TestRemoteNotFoundFailsRecord() {
  Pipeline   p("scenario_c");
  const auto path = p.tree.Write("erp/invoice.xlsx", 2048);

  p.discovery->Run();
  p.submission->Run();
  auto id = p.ledger->FindByPath(path)->id;
  assert(p.ledger->Find(id)->status == DocumentStatus::kPending);

  p.client->remote.clear();
  p.poller->Run();

  auto row = p.ledger->Find(id);
  assert(row->status == DocumentStatus::kFailed);
  assert(row->failed_msg == "external record not found");
  assert(row->finish_at.has_value());
}

// D: one timeout in a batch of ten fails only that record.
void TestTimeoutFailsOnlyItsRecord() {
  Pipeline p("scenario_d");
  for (int i = 1; i <= 10; ++i) {
    p.tree.Write("erp/doc" + std::string(i < 10 ? "0" : "") + std::to_string(i) + ".pdf", 2048);
  }
  p.discovery->Run();

  // discovery inserts in path order, so ids follow the file numbers
  for (int i = 1; i <= 10; ++i) {
    if (i == 4) {
      p.client->submit_script.push_back(
          FakeIngestionClient::Failure(ApiStatus::kTransient, 0, "Operation timed out after 60000 milliseconds with 0 bytes received"));
    } else {
      p.client->submit_script.push_back(FakeIngestionClient::Accepted("k-" + std::to_string(i), "pending"));
    }
  }

  auto run = p.submission->Run();
  assert(run.status == kbsync::db::model::kRunSuccess);
  assert(run.process_count == 10);
  assert(run.update_count == 9);

  for (int64_t id = 1; id <= 10; ++id) {
    auto row = p.ledger->Find(id);
    if (id == 4) {
      assert(row->status == DocumentStatus::kFailed);
      assert(row->failed_msg == "Operation timed out after 60000 milliseconds with 0 bytes received");
    } else {
      assert(row->status == DocumentStatus::kPending);
      assert(row->knowledge_id == "k-" + std::to_string(id));
    }
  }
}

// E: a processing file removed from disk is deleted only after the remote delete succeeds.
void TestRemovedProcessingFileWaitsForRemoteDelete() {
  Pipeline   p("scenario_e");
  const auto path = p.tree.Write("erp/drawing.png", 8192);
  p.client->initial_status = "processing";

  p.discovery->Run();
  p.submission->Run();
  auto id  = p.ledger->FindByPath(path)->id;
  auto kid = *p.ledger->Find(id)->knowledge_id;
  assert(p.ledger->Find(id)->status == DocumentStatus::kProcessing);

  p.tree.Remove("erp/drawing.png");
  p.client->delete_script.push_back(FakeIngestionClient::Failure(ApiStatus::kTransient, 502, "HTTP 502"));

  auto run = p.discovery->Run();
  assert(run.delete_count == 0);
  auto kept = p.ledger->Find(id);
  assert(kept->status == DocumentStatus::kProcessing);
  assert(kept->knowledge_id == kid);

  run = p.discovery->Run();
  assert(run.delete_count == 1);
  auto row = p.ledger->Find(id);
  assert(row->status == DocumentStatus::kDeleted);
  assert(!row->knowledge_id.has_value());
  assert(p.client->deleted.size() == 2);
  assert(p.client->deleted[1] == kid);

  // a remote copy already gone counts as deleted too
  const auto other = p.tree.Write("erp/memo.txt", 2048);
  p.discovery->Run();
  p.submission->Run();
  p.client->remote.clear();
  p.tree.Remove("erp/memo.txt");
  run = p.discovery->Run();
  assert(run.delete_count == 1);
  assert(p.ledger->FindByPath(other)->status == DocumentStatus::kDeleted);
}

// Full cycle on the sqlite ledger, including the audit trail.
void TestFullCycleOnSqlite() {
  TempTree db_dir("pipeline_sqlite_db");
  Pipeline p("pipeline_sqlite", "sqlite:\n    path: \"" + db_dir.Path("ledger.db") + "\"");
  for (int i = 0; i < 3; ++i) p.tree.Write("erp/sub/file" + std::to_string(i) + ".md", 1500);
  p.tree.Write("erp/small.md", 10);

  assert(p.discovery->Run().insert_count == 3);
  assert(p.submission->Run().update_count == 3);

  p.client->SetRemoteStatus("k-1", "completed");
  p.client->SetRemoteStatus("k-2", "failed", "unsupported encoding");
  p.client->SetRemoteStatus("k-3", "processing");
  auto poll = p.poller->Run();
  assert(poll.process_count == 3 && poll.update_count == 3);

  auto summary = p.report->Summary();
  assert(summary.total == 3);
  assert(summary.counts.at("completed") == 1);
  assert(summary.counts.at("failed") == 1);
  assert(summary.counts.at("processing") == 1);
  assert(summary.recent_failures.size() == 1);
  assert(summary.recent_failures[0].failed_msg == "unsupported encoding");

  auto runs = p.report->Runs();
  assert(runs.size() == 3);
  assert(runs[0].script_name == "poll");
  assert(runs[1].script_name == "submit");
  assert(runs[2].script_name == "discover");

  // nothing changed on disk: a second discovery is a no-op
  auto again = p.discovery->Run();
  assert(again.process_count == 0);
}

} // namespace

int main() {
  TestNewFileIsDiscovered();
  TestEditedCompletedFileIsReset();
  TestRemoteNotFoundFailsRecord();
  TestTimeoutFailsOnlyItsRecord();
  TestRemovedProcessingFileWaitsForRemoteDelete();
#if KBSYNC_DB_SQLITE
  TestFullCycleOnSqlite();
#endif

  std::cout << "kbsync_integration_pipeline_scenarios: pass\n";
  return 0;
}
