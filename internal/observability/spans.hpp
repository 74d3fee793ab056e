#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace migrate::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class SpanProcessorKind {
  kBatch,
  kSimple,
};

enum class TraceSampler {
  kParentBased,
  kAlwaysOn,
  kAlwaysOff,
};

struct OtlpConfig {
  std::string       service_name{"migrate-mongodb"};
  std::string       endpoint{};
  OtlpTransport     transport{OtlpTransport::kGrpc};
  bool              insecure{true};
  SpanProcessorKind processor{SpanProcessorKind::kBatch};
  TraceSampler      sampler{TraceSampler::kParentBased};
};

// Throws util::ConfigError on an unknown transport, processor or sampler.
OtlpConfig ToOtlpConfig(const config::TracingConfig& tracing);

// Installs the global tracer provider once per process; later calls keep the
// first provider and return true. Without ENABLE_OTEL these return false.
bool InitializeTracing(const OtlpConfig& config = {});

// Called by Driver when tracing.enabled is set. Returns false when disabled.
bool InitializeTracing(const config::TracingConfig& tracing);

void ShutdownTracing();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const config::TracingConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace migrate::observability
