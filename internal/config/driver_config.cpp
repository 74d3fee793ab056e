#include "internal/config/driver_config.hpp"

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace migrate::config {

void ApplyDefaults(DriverConfig& config) {
  if (config.migrations_collection().empty()) {
    config.set_migrations_collection(kDefaultMigrationsCollection);
  }

  auto* locking = config.mutable_locking();
  if (!locking->has_enabled()) {
    locking->set_enabled(true);
  }
  if (locking->collection().empty()) {
    locking->set_collection(kDefaultLockCollection);
  }
  if (locking->timeout_seconds() == 0) {
    locking->set_timeout_seconds(kDefaultLockTimeoutSeconds);
  }
}

void Validate(const DriverConfig& config) {
  if (config.database_name().empty()) {
    throw util::ConfigError("database name is required");
  }
  if (config.migrations_collection().empty()) {
    throw util::ConfigError("migrations collection name must not be empty");
  }
  if (config.migrations_collection() == config.locking().collection()) {
    throw util::ConfigError("migrations and lock collections must differ: " + config.migrations_collection());
  }
  if (config.tracing().enabled()) {
    // rejects unknown transport, processor and sampler names
    observability::ToOtlpConfig(config.tracing());
  }
}

} // namespace migrate::config
