#include "internal/observability/telemetry_settings.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"

namespace {

using kbsync::config::ConfigLoader;
using kbsync::observability::OtlpTransport;
using kbsync::observability::ResolveTelemetry;
using kbsync::observability::TelemetrySignal;

void ClearEnvironment() {
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  ::unsetenv("KBSYNC_DB_PATH");
  ::unsetenv("KBSYNC_KNOWLEDGE_BASE_ID");
  ::unsetenv("KBSYNC_API_URL");
}

void TestDefaultsDescribeSqliteInstance() {
  auto config   = ConfigLoader::LoadFromString("discovery:\n  roots: [\"/srv/erp\"]\n");
  auto settings = ResolveTelemetry(config, TelemetrySignal::kTraces);

  assert(!settings.enabled);
  assert(settings.transport == OtlpTransport::kGrpc);
  assert(settings.endpoint == "localhost:4317");
  assert(settings.insecure);

  const auto& resource = settings.resource;
  assert(resource.at("service.name") == "kbsync");
  assert(resource.at("service.version") == kbsync::observability::kServiceVersion);
  assert(resource.at("kbsync.ledger.backend") == "sqlite");
  assert(resource.at("kbsync.ledger.path") == "kbsync.db");
  assert(resource.at("kbsync.ingestion.base_url") == "http://localhost:8000");
  assert(resource.at("kbsync.discovery.root_count") == "1");
  assert(!resource.contains("kbsync.knowledge_base_id"));
}

void TestConfiguredHttpCollector() {
  auto config = ConfigLoader::LoadFromString(R"(observability:
  tracing_enabled: true
  metrics_enabled: true
  otlp_endpoint: "https://collector.internal:4318/"
  transport: OTLP_TRANSPORT_HTTP
  service_name: kbsync-plant-a
  metrics_export_interval_ms: 5000
database:
  memory: {}
discovery:
  roots: ["/srv/erp/manuals"]
  root_groups:
    - prefix: /srv/erp/plants
      midfixes: [a, b]
ingestion:
  knowledge_base_id: kb-7
)");

  auto traces  = ResolveTelemetry(config, TelemetrySignal::kTraces);
  auto metrics = ResolveTelemetry(config, TelemetrySignal::kMetrics);

  assert(traces.enabled && metrics.enabled);
  assert(traces.transport == OtlpTransport::kHttpProtobuf);
  assert(traces.endpoint == "https://collector.internal:4318/v1/traces");
  assert(metrics.endpoint == "https://collector.internal:4318/v1/metrics");
  assert(!traces.insecure);
  assert(metrics.export_interval.count() == 5000);

  assert(traces.resource.at("service.name") == "kbsync-plant-a");
  assert(traces.resource.at("kbsync.ledger.backend") == "memory");
  assert(!traces.resource.contains("kbsync.ledger.path"));
  assert(traces.resource.at("kbsync.knowledge_base_id") == "kb-7");
  assert(traces.resource.at("kbsync.discovery.root_count") == "3");
}

void TestEnvironmentEndpoints() {
  ::setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://traces:4318/custom", 1);
  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://otel:4318", 1);

  auto config = ConfigLoader::LoadFromString("observability:\n  transport: OTLP_TRANSPORT_HTTP\n");

  // the signal variable is a full URL; the generic one is a base
  assert(ResolveTelemetry(config, TelemetrySignal::kTraces).endpoint == "http://traces:4318/custom");
  assert(ResolveTelemetry(config, TelemetrySignal::kMetrics).endpoint == "http://otel:4318/v1/metrics");

  // a configured endpoint wins over both
  auto pinned = ConfigLoader::LoadFromString("observability:\n  otlp_endpoint: \"collector:4317\"\n");
  assert(ResolveTelemetry(pinned, TelemetrySignal::kTraces).endpoint == "collector:4317");

  ClearEnvironment();
  assert(ResolveTelemetry(config, TelemetrySignal::kTraces).endpoint == "http://localhost:4318/v1/traces");
}

void TestStageSpanNames() {
  assert(kbsync::observability::StageSpanName("discover") == "kbsync.discover");
  assert(kbsync::observability::StageSpanName("poll") == "kbsync.poll");
}

} // namespace

int main() {
  ClearEnvironment();

  TestDefaultsDescribeSqliteInstance();
  TestConfiguredHttpCollector();
  TestEnvironmentEndpoints();
  TestStageSpanNames();

  std::cout << "kbsync_unit_telemetry_settings: pass\n";
  return 0;
}
