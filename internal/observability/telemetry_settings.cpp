#include "telemetry_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"

namespace kbsync::observability {

namespace {

const char* SignalPath(TelemetrySignal signal) {
  return signal == TelemetrySignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

const char* SignalEnv(TelemetrySignal signal) {
  return signal == TelemetrySignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string ResolveEndpoint(const std::string& configured, OtlpTransport transport, TelemetrySignal signal) {
  if (configured.empty()) {
    // signal-specific variables are complete URLs and used verbatim
    if (const char* endpoint = std::getenv(SignalEnv(signal))) return endpoint;
  }

  std::string endpoint = configured;
  if (endpoint.empty()) {
    if (const char* base = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) endpoint = base;
  }
  if (endpoint.empty()) {
    return transport == OtlpTransport::kHttpProtobuf ? std::string("http://localhost:4318") + SignalPath(signal) : "localhost:4317";
  }

  if (transport == OtlpTransport::kHttpProtobuf && endpoint.find("/v1/") == std::string::npos) {
    while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
    endpoint += SignalPath(signal);
  }
  return endpoint;
}

} // namespace

TelemetrySettings ResolveTelemetry(const kbsync::runtime::config::RuntimeConfig& config, TelemetrySignal signal) {
  const auto& observability = config.observability();

  TelemetrySettings settings;
  settings.enabled   = signal == TelemetrySignal::kTraces ? observability.tracing_enabled() : observability.metrics_enabled();
  settings.transport = observability.transport() == kbsync::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  settings.endpoint  = ResolveEndpoint(observability.otlp_endpoint(), settings.transport, signal);
  settings.insecure  = settings.endpoint.rfind("https://", 0) != 0;
  if (observability.metrics_export_interval_ms() > 0) {
    settings.export_interval = std::chrono::milliseconds(observability.metrics_export_interval_ms());
  }

  auto& resource                    = settings.resource;
  resource["service.name"]          = observability.service_name().empty() ? "kbsync" : observability.service_name();
  resource["service.version"]       = kServiceVersion;
  resource["kbsync.ledger.backend"] = config.database().has_memory() ? "memory" : "sqlite";
  if (config.database().has_sqlite()) resource["kbsync.ledger.path"] = config.database().sqlite().path();
  resource["kbsync.ingestion.base_url"] = config.ingestion().base_url();
  if (!config.ingestion().knowledge_base_id().empty()) {
    resource["kbsync.knowledge_base_id"] = config.ingestion().knowledge_base_id();
  }
  resource["kbsync.discovery.root_count"] = std::to_string(config::ConfigLoader::ExpandRoots(config.discovery()).size());
  return settings;
}

std::string StageSpanName(std::string_view stage) {
  return "kbsync." + std::string(stage);
}

} // namespace kbsync::observability
