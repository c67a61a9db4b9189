#include "internal/discovery/discovery_scanner.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "tests/support/fake_ingestion_client.hpp"
#include "tests/support/temp_tree.hpp"

namespace {

using kbsync::discovery::DiscoveryOptions;
using kbsync::discovery::DiscoveryScanner;
using kbsync::discovery::FileInfo;
using kbsync::discovery::FileScanner;
using kbsync::discovery::ScanOptions;
using kbsync::ingest::ApiStatus;
using kbsync::ledger::LedgerStore;
using kbsync::model::DocumentStatus;
using kbsync::testing::FakeIngestionClient;
using kbsync::testing::TempTree;

struct Fixture {
  explicit Fixture(const std::string& name) : tree(name) {
    options.scan.roots = {tree.Root().string()};
  }

  DiscoveryScanner Scanner() {
    return DiscoveryScanner(ledger, client, options);
  }

  TempTree                             tree;
  std::shared_ptr<LedgerStore>         ledger = std::make_shared<LedgerStore>(std::make_shared<kbsync::db::memory::MemoryRepository>());
  std::shared_ptr<FakeIngestionClient> client = std::make_shared<FakeIngestionClient>();
  DiscoveryOptions                     options;
};

kbsync::db::model::DocumentRecord Row(const std::string& path, int64_t size, double mtime) {
  kbsync::db::model::DocumentRecord record;
  record.filepath           = path;
  record.file_size          = size;
  record.last_modified_time = mtime;
  return record;
}

void TestClassifySinglePass() {
  std::map<std::string, FileInfo> current = {
      {"/r/a.pdf", {2048, 1.0}},
      {"/r/b.pdf", {2048, 2.0}},
      {"/r/c.pdf", {4096, 3.0}},
      {"/r/e.pdf", {2048, 5.0}},
  };
  std::map<std::string, kbsync::db::model::DocumentRecord> ledger = {
      {"/r/b.pdf", Row("/r/b.pdf", 2048, 2.0)},
      {"/r/c.pdf", Row("/r/c.pdf", 2048, 3.0)},
      {"/r/d.pdf", Row("/r/d.pdf", 2048, 4.0)},
      {"/r/f.pdf", Row("/r/f.pdf", 2048, 6.0)},
  };

  auto diff = DiscoveryScanner::Classify(current, ledger, {"/r/f.pdf"});
  assert((diff.inserted == std::vector<std::string>{"/r/a.pdf", "/r/e.pdf"}));
  assert((diff.changed == std::vector<std::string>{"/r/c.pdf"}));
  assert((diff.removed == std::vector<std::string>{"/r/d.pdf"}));
  assert(diff.unchanged == 1);
}

void TestNewFileIsInsertedOnce() {
  Fixture f("discovery_new");
  const auto path = f.tree.Write("orders/report.pdf", 2048);
  f.tree.Write("orders/tiny.pdf", 100);
  f.tree.Write("orders/archive.zip", 4096);

  auto scanner = f.Scanner();
  auto run     = scanner.Run();
  assert(run.status == kbsync::db::model::kRunSuccess);
  assert(run.script_name == "discover");
  assert(run.insert_count == 1 && run.update_count == 0 && run.delete_count == 0);
  assert(run.process_count == 1);

  auto row = f.ledger->FindByPath(path);
  assert(row.has_value());
  assert(row->status == DocumentStatus::kDiscover);
  assert(row->file_size == 2048);
  assert(row->last_modified_time > 0);
  assert(!row->file_hash.has_value());

  // second pass with no change: nothing to do
  auto again = scanner.Run();
  assert(again.insert_count == 0 && again.update_count == 0 && again.delete_count == 0);
  assert(f.ledger->ListByStatus(DocumentStatus::kDiscover, 0).size() == 1);
}

void TestExtensionsAreCaseInsensitive() {
  Fixture f("discovery_case");
  f.tree.Write("SCAN.PDF", 2048);
  f.tree.Write("notes.Md", 2048);

  auto run = f.Scanner().Run();
  assert(run.insert_count == 2);
}

void TestChangedFilePurgesRemoteAndResets() {
  Fixture f("discovery_changed");
  const auto path = f.tree.Write("a.docx", 2048);
  f.Scanner().Run();

  auto id = f.ledger->FindByPath(path)->id;
  f.ledger->TransitionOnSubmit(id, DocumentStatus::kPending, "k-1", "h", std::nullopt);
  f.client->SetRemoteStatus("k-1", "completed");
  f.ledger->Finalize(id, DocumentStatus::kCompleted);

  f.tree.Write("a.docx", 3000);
  f.tree.Touch("a.docx", 5);

  auto run = f.Scanner().Run();
  assert(run.update_count == 1);
  assert((f.client->deleted == std::vector<std::string>{"k-1"}));

  auto row = f.ledger->Find(id);
  assert(row->status == DocumentStatus::kDiscover);
  assert(!row->knowledge_id.has_value());
  assert(row->file_size == 3000);
}

void TestFailedPurgeDefersReset() {
  Fixture f("discovery_purge_fail");
  const auto path = f.tree.Write("a.pdf", 2048);
  f.Scanner().Run();
  auto id = f.ledger->FindByPath(path)->id;
  f.ledger->TransitionOnSubmit(id, DocumentStatus::kPending, "k-1", "h", std::nullopt);
  f.ledger->Finalize(id, DocumentStatus::kFailed, std::string("bad"));

  f.tree.Touch("a.pdf", 5);
  f.client->delete_script.push_back(FakeIngestionClient::Failure(ApiStatus::kTransient, 503, "HTTP 503"));

  auto run = f.Scanner().Run();
  assert(run.update_count == 0);
  assert(f.ledger->Find(id)->status == DocumentStatus::kFailed);

  // next run succeeds
  f.client->SetRemoteStatus("k-1", "failed");
  run = f.Scanner().Run();
  assert(run.update_count == 1);
  assert(f.ledger->Find(id)->status == DocumentStatus::kDiscover);
}

void TestProcessingRowIsNotReset() {
  Fixture f("discovery_processing");
  const auto path = f.tree.Write("a.pdf", 2048);
  f.Scanner().Run();
  auto id = f.ledger->FindByPath(path)->id;
  f.ledger->TransitionOnSubmit(id, DocumentStatus::kProcessing, "k-1", "h", std::nullopt);

  f.tree.Write("a.pdf", 5000);
  auto run = f.Scanner().Run();
  assert(run.update_count == 0);
  assert(f.client->deleted.empty());

  auto row = f.ledger->Find(id);
  assert(row->status == DocumentStatus::kProcessing);
  assert(row->knowledge_id == "k-1");
}

void TestRemovedFileWithoutRemoteCopy() {
  Fixture f("discovery_removed");
  f.tree.Write("a.pdf", 2048);
  const auto path = f.tree.Write("b.pdf", 2048);
  f.Scanner().Run();

  f.tree.Remove("b.pdf");
  auto run = f.Scanner().Run();
  assert(run.delete_count == 1);
  assert(f.client->deleted.empty());
  assert(f.ledger->FindByPath(path)->status == DocumentStatus::kDeleted);

  // the deleted row is never revived
  f.tree.Write("b.pdf", 4096);
  run = f.Scanner().Run();
  assert(run.insert_count == 0 && run.update_count == 0);
  assert(f.ledger->FindByPath(path)->status == DocumentStatus::kDeleted);
}

void TestMissingRootFailsRun() {
  Fixture f("discovery_missing_root");
  f.tree.Write("a.pdf", 2048);
  f.options.scan.roots.push_back(f.tree.Path("does-not-exist"));

  auto run = f.Scanner().Run();
  assert(run.status == kbsync::db::model::kRunFail);
  assert(!run.failed_reason.empty());
  assert(f.ledger->LoadActive().empty());
}

void TestNoRootsFailsRun() {
  Fixture f("discovery_no_roots");
  f.options.scan.roots.clear();
  auto run = f.Scanner().Run();
  assert(run.status == kbsync::db::model::kRunFail);
}

void TestSymlinksAreSkippedByDefault() {
  TempTree   tree("scanner_symlink_default");
  const auto target = tree.Write("docs/target.pdf", 2048);
  std::filesystem::create_symlink(target, tree.Path("link.pdf"));
  std::filesystem::create_directory_symlink(tree.Path("docs"), tree.Path("docs-alias"));

  ScanOptions options;
  options.roots = {tree.Root().string()};
  auto result   = FileScanner(options).Scan();

  assert(result.files.size() == 1);
  assert(result.files.contains(target));
  assert(result.unobserved.empty());
}

void TestDanglingSymlinkIsUnobserved() {
  TempTree   tree("scanner_symlink_dangling");
  const auto target = tree.Write("target.pdf", 2048);
  const auto link   = tree.Path("link.pdf");
  std::filesystem::create_symlink(target, link);

  ScanOptions options;
  options.roots           = {tree.Root().string()};
  options.follow_symlinks = true;

  auto before = FileScanner(options).Scan();
  assert(before.files.size() == 2);
  assert(before.files.at(link).size == 2048);

  tree.Remove("target.pdf");
  auto after = FileScanner(options).Scan();
  assert(after.files.empty());
  assert(after.unobserved.size() == 1);
  assert(after.unobserved.contains(link));
}

// A link whose target vanished is not evidence that the link itself is gone.
void TestDanglingSymlinkKeepsItsRecord() {
  Fixture f("discovery_symlink_dangling");
  f.options.scan.follow_symlinks = true;
  const auto target = f.tree.Write("target.pdf", 2048);
  const auto link   = f.tree.Path("link.pdf");
  std::filesystem::create_symlink(target, link);

  assert(f.Scanner().Run().insert_count == 2);

  f.tree.Remove("target.pdf");
  auto run = f.Scanner().Run();
  assert(run.status == kbsync::db::model::kRunSuccess);
  assert(run.delete_count == 1);
  assert(f.ledger->FindByPath(target)->status == DocumentStatus::kDeleted);
  assert(f.ledger->FindByPath(link)->status == DocumentStatus::kDiscover);
}

} // namespace

int main() {
  TestClassifySinglePass();
  TestNewFileIsInsertedOnce();
  TestExtensionsAreCaseInsensitive();
  TestChangedFilePurgesRemoteAndResets();
  TestFailedPurgeDefersReset();
  TestProcessingRowIsNotReset();
  TestRemovedFileWithoutRemoteCopy();
  TestMissingRootFailsRun();
  TestNoRootsFailsRun();
  TestSymlinksAreSkippedByDefault();
  TestDanglingSymlinkIsUnobserved();
  TestDanglingSymlinkKeepsItsRecord();

  std::cout << "kbsync_unit_discovery_scanner: pass\n";
  return 0;
}
