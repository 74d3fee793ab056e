#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace migrate::config {

inline constexpr const char* kDefaultMigrationsCollection = "schema_migrations";
inline constexpr const char* kDefaultLockCollection       = "migrate_advisory_lock";
inline constexpr std::uint32_t kDefaultLockTimeoutSeconds = 15;

// Fills unset fields with their defaults. Idempotent.
void ApplyDefaults(DriverConfig& config);

// Throws util::ConfigError when a required field is missing.
void Validate(const DriverConfig& config);

inline bool LockingEnabled(const DriverConfig& config) {
  return !config.locking().has_enabled() || config.locking().enabled();
}

inline std::chrono::seconds LockTimeout(const DriverConfig& config) {
  return std::chrono::seconds(config.locking().timeout_seconds());
}

} // namespace migrate::config
