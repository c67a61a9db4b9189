#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <utility>

#include "internal/observability/telemetry_settings.hpp"

namespace kbsync::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using Labels = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const TelemetrySettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// AddMetricReader took a unique_ptr before SDK 1.10 and a shared_ptr after.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

// Counter::Add and Histogram::Record only accept an explicit context on
// some API versions; pass one whenever the overload exists.
template <typename Instrument, typename Value>
void Emit(Instrument& instrument, Value value, Labels labels) {
  if constexpr (requires { instrument.Record(value, labels, opentelemetry::context::Context{}); }) {
    instrument.Record(value, labels, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument.Record(value, labels); }) {
    instrument.Record(value, labels);
  } else if constexpr (requires { instrument.Add(value, labels, opentelemetry::context::Context{}); }) {
    instrument.Add(value, labels, opentelemetry::context::Context{});
  } else {
    instrument.Add(value, labels);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> runs;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transitions;
};

bool InitializeMetrics(const kbsync::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveTelemetry(config, TelemetrySignal::kMetrics);
  if (!settings.enabled) {
    ShutdownMetrics();
    return false;
  }

  resource::ResourceAttributes attributes;
  for (const auto& [key, value] : settings.resource) attributes.SetAttribute(key, opentelemetry::nostd::string_view(value));

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = settings.export_interval;

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attributes));
  AttachReader(*g_provider, sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is installed on first use, so
// InitializeMetrics must run before the first stage.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("kbsync.pipeline", kServiceVersion);

  impl_->runs        = meter->CreateUInt64Counter("kbsync.stage.runs", "Completed stage runs", "1");
  impl_->duration_ms = meter->CreateDoubleHistogram("kbsync.stage.duration_ms", "Stage run duration in milliseconds", "ms");
  impl_->transitions = meter->CreateUInt64Counter("kbsync.document.transitions", "Ledger mutations applied by a stage", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordStageRun(std::string_view stage, bool success) {
  const std::string stage_label(stage);
  Emit(*impl_->runs, std::uint64_t{1}, {{"stage", stage_label}, {"success", success}});
}

void Metrics::ObserveStageDurationMs(std::string_view stage, double duration_ms) {
  const std::string stage_label(stage);
  Emit(*impl_->duration_ms, duration_ms, {{"stage", stage_label}});
}

void Metrics::RecordTransition(std::string_view stage, std::string_view outcome, std::uint64_t count) {
  if (count == 0) return;
  const std::string stage_label(stage);
  const std::string outcome_label(outcome);
  Emit(*impl_->transitions, count, {{"stage", stage_label}, {"outcome", outcome_label}});
}

} // namespace kbsync::observability

#endif
