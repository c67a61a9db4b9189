#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/hash/file_hasher.hpp"
#include "internal/ingest/http_ingestion_client.hpp"
#include "internal/observability/logging.hpp"
#if KBSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace kbsync::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const kbsync::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if KBSYNC_DB_SQLITE
    const auto& sqlite  = database.sqlite();
    const int   timeout = sqlite.busy_timeout_ms() > 0 ? static_cast<int>(sqlite.busy_timeout_ms()) : db::sqlite::SqliteDB::kDefaultBusyTimeoutMs;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), timeout);
    db::sql::RunMigrations(*sqlite_db, db::sql::LedgerSchema());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<ingest::IngestionClient> BuildIngestionClient(const kbsync::runtime::config::RuntimeConfig& config) {
  return std::make_shared<ingest::HttpIngestionClient>(ingest::HttpClientOptions::FromConfig(config.ingestion()));
}

discovery::DiscoveryOptions BuildDiscoveryOptions(const kbsync::runtime::config::RuntimeConfig& config) {
  const auto& cfg = config.discovery();

  discovery::DiscoveryOptions options;
  options.scan.roots               = config::ConfigLoader::ExpandRoots(cfg);
  options.scan.min_file_size_bytes = cfg.has_min_file_size_bytes() ? cfg.min_file_size_bytes() : config::defaults::kMinFileSizeBytes;
  options.scan.follow_symlinks     = cfg.follow_symlinks();
  if (cfg.extensions().empty()) {
    options.scan.extensions = discovery::DefaultExtensions();
  } else {
    for (const auto& ext : cfg.extensions()) {
      // ".PDF" and "pdf" name the same extension
      options.scan.extensions.insert(discovery::LowerExtension("x." + (ext.starts_with(".") ? ext.substr(1) : ext)));
    }
  }
  options.purge_remote_on_change = !cfg.has_purge_remote_on_change() || cfg.purge_remote_on_change();
  return options;
}

submission::SubmissionOptions BuildSubmissionOptions(const kbsync::runtime::config::RuntimeConfig& config) {
  const auto& cfg = config.submission();
  return submission::SubmissionOptions{
      .batch_size        = cfg.batch_size() > 0 ? cfg.batch_size() : config::defaults::kSubmitBatchSize,
      .algorithm         = hash::ParseHashAlgorithm(cfg.hash_algorithm().empty() ? config::defaults::kHashAlgorithm : cfg.hash_algorithm()),
      .knowledge_base_id = config.ingestion().knowledge_base_id(),
  };
}

poller::PollerOptions BuildPollerOptions(const kbsync::runtime::config::RuntimeConfig& config) {
  const auto& cfg = config.poller();
  return poller::PollerOptions{
      .batch_size    = cfg.batch_size(),
      .request_delay = std::chrono::milliseconds(cfg.has_request_delay_ms() ? cfg.request_delay_ms() : config::defaults::kPollRequestDelayMs),
  };
}

/*
    Build full application dependency graph
*/
Application Build(const kbsync::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------------
  auto shared = BuildRepository(config);
  auto ledger_for = [&](bool first) {
    if (first || !config.database().has_sqlite()) return std::make_shared<ledger::LedgerStore>(shared);
    return std::make_shared<ledger::LedgerStore>(BuildRepository(config));
  };

  // ------------------------------------------------------------------
  // Remote
  // ------------------------------------------------------------------
  auto client = BuildIngestionClient(config);

  // ------------------------------------------------------------------
  // Stages
  // ------------------------------------------------------------------
  auto discovery_options = BuildDiscoveryOptions(config);
  const auto root_count  = static_cast<int64_t>(discovery_options.scan.roots.size());

  app.discovery  = std::make_shared<discovery::DiscoveryScanner>(ledger_for(true), client, std::move(discovery_options));
  app.submission = std::make_shared<submission::SubmissionWorker>(ledger_for(false), client, BuildSubmissionOptions(config));
  app.poller     = std::make_shared<poller::StatusPoller>(ledger_for(false), client, BuildPollerOptions(config));
  app.report     = std::make_shared<ledger::LedgerReport>(config.database().has_sqlite() ? BuildRepository(config) : shared);

  KBSYNC_LOG_INFO("application built", {StringField("backend", config.database().has_sqlite() ? "sqlite" : "memory"),
                                        StringField("ingestion", config.ingestion().base_url()),
                                        IntField("roots", root_count)});
  return app;
}

} // namespace kbsync::factory
