#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "migrate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database_name: "inventory"
migrations_collection: "inventory_migrations"
transaction_mode: true
locking:
  enabled: false
  collection: "inventory_lock"
  timeout_seconds: 30
logging:
  level: "debug"
  pattern: "[%l] %v"
)");

  auto config = migrate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database_name() == "inventory");
  assert(config.migrations_collection() == "inventory_migrations");
  assert(config.transaction_mode());
  assert(!migrate::config::LockingEnabled(config));
  assert(config.locking().collection() == "inventory_lock");
  assert(config.locking().timeout_seconds() == 30);
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
}

void TestDefaultsAreApplied() {
  const auto yaml_path = WriteYaml("defaults", R"(database_name: "app"
)");

  auto config = migrate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.migrations_collection() == "schema_migrations");
  assert(!config.transaction_mode());
  assert(migrate::config::LockingEnabled(config));
  assert(config.locking().collection() == "migrate_advisory_lock");
  assert(migrate::config::LockTimeout(config) == std::chrono::seconds(15));
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database_name: "app"
migrations_collection: "C:\\migrations\\\"quoted\""
)");

  auto config = migrate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.migrations_collection() == "C:\\migrations\\\"quoted\"");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database_name: "app"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)migrate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const migrate::util::ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingDatabaseIsRejected() {
  const auto yaml_path = WriteYaml("missing_database",
                                   R"(locking:
  enabled: true
)");

  bool threw = false;
  try {
    (void)migrate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const migrate::util::ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must require a database name.");
}

void TestMissingFileIsConfigError() {
  bool threw = false;
  try {
    (void)migrate::config::ConfigLoader::LoadFromYaml("/nonexistent/migrate/config.yaml");
  } catch (const migrate::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

void TestTracingSectionIsLoaded() {
  const auto yaml_path = WriteYaml("tracing",
                                   R"(database_name: "app"
tracing:
  enabled: true
  endpoint: "http://collector:4318/v1/traces"
  transport: "http"
  service_name: "inventory-migrator"
  processor: "simple"
  sampler: "always"
)");

  auto config = migrate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.tracing().enabled());

  auto otlp = migrate::observability::ToOtlpConfig(config.tracing());
  assert(otlp.endpoint == "http://collector:4318/v1/traces");
  assert(otlp.transport == migrate::observability::OtlpTransport::kHttpProtobuf);
  assert(otlp.service_name == "inventory-migrator");
  assert(otlp.processor == migrate::observability::SpanProcessorKind::kSimple);
  assert(otlp.sampler == migrate::observability::TraceSampler::kAlwaysOn);
  assert(otlp.insecure);
}

void TestTracingDefaults() {
  migrate::config::TracingConfig tracing;
  tracing.set_enabled(true);
  tracing.set_use_tls(true);

  auto otlp = migrate::observability::ToOtlpConfig(tracing);
  assert(otlp.service_name == "migrate-mongodb");
  assert(otlp.endpoint.empty());
  assert(otlp.transport == migrate::observability::OtlpTransport::kGrpc);
  assert(!otlp.insecure);
  assert(otlp.processor == migrate::observability::SpanProcessorKind::kBatch);
  assert(otlp.sampler == migrate::observability::TraceSampler::kParentBased);

  // disabled tracing never installs a provider
  tracing.set_enabled(false);
  assert(!migrate::observability::InitializeTracing(tracing));
}

void TestUnknownTracingTransportIsRejected() {
  const auto yaml_path = WriteYaml("tracing_transport",
                                   R"(database_name: "app"
tracing:
  enabled: true
  transport: "udp"
)");

  bool threw = false;
  try {
    (void)migrate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const migrate::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsAreApplied();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingDatabaseIsRejected();
  TestMissingFileIsConfigError();
  TestTracingSectionIsLoaded();
  TestTracingDefaults();
  TestUnknownTracingTransportIsRejected();

  std::cout << "migrate_unit_config_loader: pass\n";
  return 0;
}
