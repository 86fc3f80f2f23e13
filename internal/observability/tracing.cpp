#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace mlmeta::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
constexpr const char* kTracerName     = "mlmeta";
constexpr const char* kServiceVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

// Config first, then the standard OTEL_* variables.
std::string ExporterEndpoint(const mlmeta::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name)) {
      return endpoint;
    }
  }
  return "localhost:4317";
}

resource::Resource ServiceResource(const mlmeta::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  resource::ResourceAttributes attrs = {
      {"service.name", observability.service_name().empty() ? std::string(kTracerName) : observability.service_name()},
      {"service.version", std::string(kServiceVersion)},
      {"mlmeta.store.backend", std::string(config.store().has_sqlite() ? "sqlite" : "memory")},
      {"mlmeta.bind_address", config.server().bind_address()},
  };
  return resource::Resource::Create(attrs);
}

} // namespace

bool InitializeTracing(const mlmeta::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = ExporterEndpoint(config.observability());
  auto exporter    = otlp::OtlpGrpcExporterFactory::Create(options);

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), ServiceResource(config));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kServiceVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct RequestSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
  bool                                              finished = false;
};

RequestSpan::RequestSpan(std::string_view route, std::string_view project) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kServer;

  impl_->span = g_tracer->StartSpan(std::string(route), options);
  impl_->span->SetAttribute("mlmeta.project", std::string(project));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

RequestSpan::~RequestSpan() {
  if (impl_ && impl_->span && !impl_->finished) {
    Finish(RequestOutcome::kInternal, "request ended without an outcome");
  }
}

RequestSpan::RequestSpan(RequestSpan&&) noexcept            = default;
RequestSpan& RequestSpan::operator=(RequestSpan&&) noexcept = default;

void RequestSpan::SetPath(std::string_view path) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute("mlmeta.path", std::string(path));
  }
}

void RequestSpan::SetDocumentCount(std::int64_t count) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute("mlmeta.documents", count);
  }
}

void RequestSpan::SetDeleteCounts(std::int64_t deleted, std::int64_t failed) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute("mlmeta.deleted", deleted);
    impl_->span->SetAttribute("mlmeta.delete_failures", failed);
  }
}

void RequestSpan::Finish(RequestOutcome outcome, std::string_view error) {
  if (!impl_ || !impl_->span || impl_->finished) {
    return;
  }
  impl_->finished = true;

  impl_->span->SetAttribute("mlmeta.outcome", std::string(OutcomeName(outcome)));
  if (outcome != RequestOutcome::kOk) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(error)}});
  }
  // Only server-side failures mark the span as an error.
  if (outcome == RequestOutcome::kBackendError || outcome == RequestOutcome::kInternal) {
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(error));
  }
  impl_->scope.reset();
  impl_->span->End();
}

} // namespace mlmeta::observability

#endif
