#include "internal/observability/spans.hpp"

#include "internal/util/errors.hpp"

namespace migrate::observability {

OtlpConfig ToOtlpConfig(const config::TracingConfig& tracing) {
  OtlpConfig out;
  if (!tracing.service_name().empty()) {
    out.service_name = tracing.service_name();
  }
  out.endpoint = tracing.endpoint();
  out.insecure = !tracing.use_tls();

  if (tracing.transport() == "http") {
    out.transport = OtlpTransport::kHttpProtobuf;
  } else if (!tracing.transport().empty() && tracing.transport() != "grpc") {
    throw util::ConfigError("unknown tracing transport: " + tracing.transport());
  }

  if (tracing.processor() == "simple") {
    out.processor = SpanProcessorKind::kSimple;
  } else if (!tracing.processor().empty() && tracing.processor() != "batch") {
    throw util::ConfigError("unknown span processor: " + tracing.processor());
  }

  if (tracing.sampler() == "always") {
    out.sampler = TraceSampler::kAlwaysOn;
  } else if (tracing.sampler() == "never") {
    out.sampler = TraceSampler::kAlwaysOff;
  } else if (!tracing.sampler().empty() && tracing.sampler() != "parent") {
    throw util::ConfigError("unknown trace sampler: " + tracing.sampler());
  }
  return out;
}

} // namespace migrate::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <utility>

#include "internal/observability/logging.hpp"

namespace migrate::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "migrate-mongodb";
constexpr const char* kTracerVersion = "0.1.0";

std::mutex                                          g_init_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  for (const char* variable : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(variable)) {
      return endpoint;
    }
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const OtlpConfig& config) {
  if (config.processor == SpanProcessorKind::kSimple) {
    return sdktrace::SimpleSpanProcessorFactory::Create(MakeExporter(config));
  }
  return sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  std::lock_guard lock(g_init_mutex);
  if (g_sdk_provider) {
    return true;
  }

  auto service = resource::Resource::Create(resource::ResourceAttributes{{"service.name", config.service_name}});

  std::unique_ptr<sdktrace::TracerProvider> provider;
  switch (config.sampler) {
    case TraceSampler::kAlwaysOn:
      provider = sdktrace::TracerProviderFactory::Create(MakeProcessor(config), service, sdktrace::AlwaysOnSamplerFactory::Create());
      break;
    case TraceSampler::kAlwaysOff:
      provider = sdktrace::TracerProviderFactory::Create(MakeProcessor(config), service, sdktrace::AlwaysOffSamplerFactory::Create());
      break;
    case TraceSampler::kParentBased:
      // the SDK default sampler
      provider = sdktrace::TracerProviderFactory::Create(MakeProcessor(config), service);
      break;
  }

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  MIGRATE_LOG_INFO("tracing initialized", {StringField("service", config.service_name), StringField("endpoint", ResolveEndpoint(config))});
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const config::TracingConfig& tracing) {
  if (!tracing.enabled()) {
    return false;
  }
  return InitializeTracing(ToOtlpConfig(tracing));
}

void ShutdownTracing() {
  std::lock_guard lock(g_init_mutex);
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }

  if (!g_tracer) {
    return;
  }

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace migrate::observability

#endif
