#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace kbsync::runtime::config {
class RuntimeConfig;
}

namespace kbsync::observability {

inline constexpr const char* kServiceVersion = "0.1.0";

enum class TelemetrySignal {
  kTraces,
  kMetrics,
};

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

/*
  TelemetrySettings

  Exporter settings for one signal, resolved from the observability
  section. Endpoint precedence:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    collector default for the transport
  Over HTTP a base endpoint (no /v1/ path) gets the signal path appended.

  The resource describes this sync instance: which ledger, which ingestion
  API and knowledge base, and how many discovery roots it watches.
*/
struct TelemetrySettings {
  bool                               enabled = false;
  std::string                        endpoint;
  OtlpTransport                      transport = OtlpTransport::kGrpc;
  bool                               insecure  = true;
  std::chrono::milliseconds          export_interval{1000};
  std::map<std::string, std::string> resource;
};

TelemetrySettings ResolveTelemetry(const kbsync::runtime::config::RuntimeConfig& config, TelemetrySignal signal);

// kbsync.<stage>
std::string StageSpanName(std::string_view stage);

} // namespace kbsync::observability
