#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/discovery/discovery_scanner.hpp"
#include "internal/ingest/ingestion_client.hpp"
#include "internal/ledger/ledger_report.hpp"
#include "internal/ledger/ledger_store.hpp"
#include "internal/poller/status_poller.hpp"
#include "internal/submission/submission_worker.hpp"

namespace kbsync::factory {

/*
  Application

  Owns one instance of every pipeline stage plus the read-only report.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<discovery::DiscoveryScanner>  discovery;
  std::shared_ptr<submission::SubmissionWorker> submission;
  std::shared_ptr<poller::StatusPoller>         poller;
  std::shared_ptr<ledger::LedgerReport>         report;
};

/*
  BuildRepository

  Opens the configured ledger backend and applies the schema.

  NOTE:
  This is the ONLY place allowed to know concrete DB types. Each call
  against a sqlite ledger opens a fresh connection.
*/
std::shared_ptr<db::Repository> BuildRepository(const kbsync::runtime::config::RuntimeConfig& config);

std::shared_ptr<ingest::IngestionClient> BuildIngestionClient(const kbsync::runtime::config::RuntimeConfig& config);

discovery::DiscoveryOptions   BuildDiscoveryOptions(const kbsync::runtime::config::RuntimeConfig& config);
submission::SubmissionOptions BuildSubmissionOptions(const kbsync::runtime::config::RuntimeConfig& config);
poller::PollerOptions         BuildPollerOptions(const kbsync::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. Every stage gets its own ledger connection, exactly
  what independent processes sharing the ledger file would have; the
  memory backend is shared since it lives in this process only.
*/
Application Build(const kbsync::runtime::config::RuntimeConfig& config);

} // namespace kbsync::factory
