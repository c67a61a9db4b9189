#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/model/script_run_record.hpp"
#include "internal/factory.hpp"
#include "internal/ledger/ledger_report.hpp"
#include "internal/model/document_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

using kbsync::db::model::DocumentRecord;
using kbsync::db::model::ScriptRunRecord;

static void Usage() {
  std::cout << "Usage:\n"
            << "  kbsyncctl --config <config.yaml> discover\n"
            << "  kbsyncctl --config <config.yaml> submit\n"
            << "  kbsyncctl --config <config.yaml> poll\n"
            << "  kbsyncctl --config <config.yaml> stats\n"
            << "  kbsyncctl --config <config.yaml> documents [status] [page]\n"
            << "  kbsyncctl --config <config.yaml> runs [limit]\n";
}

static std::optional<std::size_t> ParseCount(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

static std::string Stamp(const std::optional<kbsync::util::TimePoint>& tp) {
  return tp ? kbsync::util::FormatTimestamp(*tp) : "-";
}

static void PrintDocument(const DocumentRecord& doc) {
  std::cout << doc.id << "  " << std::left << std::setw(10) << kbsync::model::ToString(doc.status) << std::right << "  " << doc.filepath
            << "  size=" << doc.file_size << "  created=" << kbsync::util::FormatTimestamp(doc.created_at) << "  finished=" << Stamp(doc.finish_at);
  if (doc.knowledge_id) std::cout << "  knowledge_id=" << *doc.knowledge_id;
  if (doc.failed_msg) std::cout << "  error=" << *doc.failed_msg;
  std::cout << "\n";
}

static void PrintRun(const ScriptRunRecord& run) {
  std::cout << run.id << "  " << std::left << std::setw(8) << run.script_name << std::right << "  " << run.status << "  "
            << kbsync::util::FormatTimestamp(run.process_timestamp) << "  duration=" << std::fixed << std::setprecision(3) << run.process_duration
            << "s  processed=" << run.process_count << " inserted=" << run.insert_count << " updated=" << run.update_count
            << " deleted=" << run.delete_count;
  if (!run.failed_reason.empty()) std::cout << "  reason=" << run.failed_reason;
  std::cout << "\n";
}

static int RunStage(kbsync::pipeline::Stage& stage) {
  auto run = stage.Run();
  PrintRun(run);
  return run.status == kbsync::db::model::kRunSuccess ? 0 : 3;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  std::string config_path = argv[2];
  std::string cmd         = argv[3];

  kbsync::runtime::config::RuntimeConfig config;
  try {
    config = kbsync::config::ConfigLoader::LoadFromYaml(config_path);
    if (cmd == "discover") kbsync::config::ConfigLoader::RequireDiscoveryRoots(config);
  } catch (const std::exception& e) {
    std::cerr << "kbsyncctl: " << e.what() << "\n";
    return 1;
  }

  try {
    kbsync::observability::InitializeTracing(config);
    kbsync::observability::InitializeMetrics(config);
    kbsync::observability::InitializeLogging(config);

    int rc = -1;

    // ------------------------------------------------------------

    if (cmd == "discover" || cmd == "submit" || cmd == "poll") {
      auto app = kbsync::factory::Build(config);
      if (cmd == "discover") rc = RunStage(*app.discovery);
      if (cmd == "submit") rc = RunStage(*app.submission);
      if (cmd == "poll") rc = RunStage(*app.poller);
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      kbsync::ledger::LedgerReport report(kbsync::factory::BuildRepository(config));
      auto                         summary = report.Summary();

      for (const auto& [status, count] : summary.counts) {
        std::cout << status << "=" << count << "\n";
      }
      std::cout << "total=" << summary.total << "\n";

      std::cout << "\nrecent failures:\n";
      for (const auto& doc : summary.recent_failures) PrintDocument(doc);
      std::cout << "\nrecent runs:\n";
      for (const auto& run : summary.recent_runs) PrintRun(run);
      rc = 0;
    }

    // ------------------------------------------------------------

    if (cmd == "documents") {
      std::optional<kbsync::model::DocumentStatus> status;
      std::size_t                                  page = 1;

      for (int i = 4; i < argc; ++i) {
        std::string arg = argv[i];
        if (auto n = ParseCount(arg)) {
          page = *n;
        } else if (auto parsed = kbsync::model::ParseDocumentStatus(arg); parsed && *parsed != kbsync::model::DocumentStatus::kUnknown) {
          status = *parsed;
        } else {
          std::cerr << "unsupported status: " << arg << "\n";
          rc = 1;
          break;
        }
      }

      if (rc != 1) {
        kbsync::ledger::LedgerReport report(kbsync::factory::BuildRepository(config));
        auto                         result = report.Documents(status, page);
        for (const auto& doc : result.rows) PrintDocument(doc);
        std::cout << "page " << result.page << "/" << result.pages << "  total=" << result.total << "\n";
        rc = 0;
      }
    }

    // ------------------------------------------------------------

    if (cmd == "runs") {
      std::size_t limit = kbsync::ledger::LedgerReport::kDefaultRunList;
      if (argc >= 5) {
        auto n = ParseCount(argv[4]);
        if (!n) {
          std::cerr << "invalid limit: " << argv[4] << "\n";
          rc = 1;
        } else {
          limit = *n;
        }
      }

      if (rc != 1) {
        kbsync::ledger::LedgerReport report(kbsync::factory::BuildRepository(config));
        for (const auto& run : report.Runs(limit)) PrintRun(run);
        rc = 0;
      }
    }

    if (rc < 0) {
      Usage();
      rc = 1;
    }

    kbsync::observability::ShutdownLogging();
    kbsync::observability::ShutdownMetrics();
    kbsync::observability::ShutdownTracing();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "kbsyncctl: " << e.what() << "\n";
    kbsync::observability::ShutdownLogging();
    kbsync::observability::ShutdownMetrics();
    kbsync::observability::ShutdownTracing();
    return 2;
  }
}
