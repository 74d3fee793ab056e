#include "internal/driver/mongo_driver.hpp"

#include "internal/codec/command_codec.hpp"
#include "internal/config/driver_config.hpp"
#include "internal/config/uri_options.hpp"
#include "internal/engine/capabilities.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace migrate::mongodb {

std::unique_ptr<Driver> Driver::Open(const std::string& uri) {
  return Open(uri, connection::MongoClientFactory());
}

std::unique_ptr<Driver> Driver::Open(const std::string& uri, const connection::ClientFactory& factory) {
  auto parsed     = config::ParseConnectionUri(uri);
  auto connection = connection::ConnectionManager::Open(parsed.driver_uri, parsed.config.database_name(), factory);
  return std::unique_ptr<Driver>(new Driver(std::move(connection), std::move(parsed.config)));
}

std::unique_ptr<Driver> Driver::WithInstance(std::shared_ptr<db::Client> client, config::DriverConfig config) {
  config::ApplyDefaults(config);
  config::Validate(config);
  auto connection = connection::ConnectionManager::Adopt(std::move(client), config.database_name());
  return std::unique_ptr<Driver>(new Driver(std::move(connection), std::move(config)));
}

Driver::Driver(std::unique_ptr<connection::ConnectionManager> connection, config::DriverConfig config)
    : config_(std::move(config)), connection_(std::move(connection)) {
  observability::InitializeLogging(config_.logging());
  observability::InitializeTracing(config_.tracing());

  auto& database = connection_->Database();
  if (config_.transaction_mode()) {
    auto caps = engine::DetectCapabilities(database);
    if (!caps.transactions) {
      throw util::ConfigError("transaction mode needs a replica set (wire version 7+) or a sharded cluster (wire version 8+); server reports wire version " +
                              std::to_string(caps.max_wire_version));
    }
  }

  versions_ = std::make_unique<version::VersionStore>(database, config_.migrations_collection());
  lock_     = std::make_unique<lock::AdvisoryLock>(database, lock::LockOptions{.enabled    = config::LockingEnabled(config_),
                                                                               .collection = config_.locking().collection(),
                                                                               .lease      = config::LockTimeout(config_)});
  engine_   = std::make_unique<engine::ExecutionEngine>(database, *versions_, *lock_, config_.transaction_mode());

  MIGRATE_LOG_INFO("driver ready", {observability::StringField("database", config_.database_name()),
                                    observability::StringField("migrations_collection", config_.migrations_collection()),
                                    observability::BoolField("transaction_mode", config_.transaction_mode()),
                                    observability::BoolField("locking", lock_->Options().enabled)});
}

Driver::~Driver() {
  try {
    Close();
  } catch (const util::MigrateError& e) {
    MIGRATE_LOG_ERROR("close failed", {observability::StringField("error", e.what())});
  }
}

void Driver::RequireOpen() const {
  if (connection_->IsClosed()) {
    throw util::ConnectionError("driver is closed");
  }
}

void Driver::RunLocked(std::istream& script, std::optional<std::int64_t> version, const RunOptions& options) {
  std::scoped_lock lock(mutex_);
  RequireOpen();
  auto commands = codec::CommandCodec::Decode(script);
  engine_->Run(commands, version, options);
}

void Driver::Run(std::istream& script, const RunOptions& options) {
  RunLocked(script, std::nullopt, options);
}

void Driver::Run(std::istream& script, std::int64_t version, const RunOptions& options) {
  RunLocked(script, version, options);
}

VersionRecord Driver::Version() {
  std::scoped_lock lock(mutex_);
  RequireOpen();
  return versions_->Current();
}

void Driver::SetVersion(std::int64_t version, bool dirty) {
  std::scoped_lock lock(mutex_);
  RequireOpen();
  versions_->Set(version, dirty);
  MIGRATE_LOG_INFO("version forced", {observability::IntField("version", version), observability::BoolField("dirty", dirty)});
}

std::vector<std::string> Driver::Drop() {
  std::scoped_lock lock(mutex_);
  RequireOpen();
  return versions_->DropAll();
}

void Driver::Lock() {
  std::scoped_lock lock(mutex_);
  RequireOpen();
  lock_->Acquire();
}

void Driver::Unlock() {
  std::scoped_lock lock(mutex_);
  RequireOpen();
  lock_->Release();
}

void Driver::Close() {
  std::scoped_lock lock(mutex_);
  if (connection_->IsClosed()) {
    return;
  }

  if (lock_ && lock_->Held() && lock_->Options().enabled) {
    try {
      lock_->Release();
    } catch (const util::MigrateError& e) {
      // lease expiry reclaims it
      MIGRATE_LOG_WARN("advisory lock not released on close", {observability::StringField("error", e.what())});
    }
  }

  engine_.reset();
  lock_.reset();
  versions_.reset();
  connection_->Close();
}

} // namespace migrate::mongodb
