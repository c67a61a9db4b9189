#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "internal/observability/telemetry_settings.hpp"

namespace kbsync::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const TelemetrySettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const kbsync::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveTelemetry(config, TelemetrySignal::kTraces);
  if (!settings.enabled) {
    ShutdownTracing();
    return false;
  }

  resource::ResourceAttributes attributes;
  for (const auto& [key, value] : settings.resource) attributes.SetAttribute(key, opentelemetry::nostd::string_view(value));

  // stage runs are seconds apart; the default batch options flush them promptly
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  g_provider     = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer("kbsync.pipeline", kServiceVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct StageSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

StageSpan::StageSpan(std::string_view stage) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) return;

  const std::string           stage_name(stage);
  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kInternal;
  impl_->span  = g_tracer->StartSpan(StageSpanName(stage), {{"kbsync.stage", stage_name}, {"kbsync.run.status", "success"}}, options);
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

StageSpan::~StageSpan() {
  if (impl_->span) impl_->span->End();
}

void StageSpan::SetCounts(std::int64_t processed, std::int64_t inserted, std::int64_t updated, std::int64_t deleted) {
  if (!impl_->span) return;
  impl_->span->SetAttribute("kbsync.run.processed", processed);
  impl_->span->SetAttribute("kbsync.run.inserted", inserted);
  impl_->span->SetAttribute("kbsync.run.updated", updated);
  impl_->span->SetAttribute("kbsync.run.deleted", deleted);
}

void StageSpan::MarkFailed(std::string_view reason) {
  if (!impl_->span) return;
  impl_->span->SetAttribute("kbsync.run.status", "fail");
  impl_->span->AddEvent("exception", {{"exception.message", std::string(reason)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(reason));
}

} // namespace kbsync::observability

#endif
