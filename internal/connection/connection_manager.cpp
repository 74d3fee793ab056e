#include "internal/connection/connection_manager.hpp"

#include "internal/db/api/result.hpp"
#include "internal/db/mongo/mongo_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace migrate::connection {

namespace {

[[noreturn]] void RethrowConnectFailure(const db::DatabaseException& e) {
  switch (e.Code()) {
    case db::ErrorCode::InvalidArgument:
      throw util::ConfigError(std::string("invalid connection URI: ") + e.what());
    case db::ErrorCode::Unauthenticated:
      throw util::AuthenticationError(e.what());
    default:
      throw util::ConnectionError(e.what());
  }
}

} // namespace

ClientFactory MongoClientFactory() {
  return [](const std::string& driver_uri) -> std::shared_ptr<db::Client> { return std::make_shared<db::mongo::MongoClient>(driver_uri); };
}

std::unique_ptr<ConnectionManager> ConnectionManager::Open(const std::string& driver_uri, const std::string& database_name,
                                                           const ClientFactory& factory) {
  std::shared_ptr<db::Client> client;
  try {
    client = factory(driver_uri);
    if (!client) {
      throw util::ConfigError("client factory returned no client");
    }
    client->CheckReachable();
  } catch (const db::DatabaseException& e) {
    MIGRATE_LOG_ERROR("connect failed", {observability::StringField("database", database_name),
                                         observability::StringField("code", db::ToString(e.Code()))});
    RethrowConnectFailure(e);
  }
  return std::make_unique<ConnectionManager>(std::move(client), Ownership::kOwned, database_name);
}

std::unique_ptr<ConnectionManager> ConnectionManager::Adopt(std::shared_ptr<db::Client> client, const std::string& database_name) {
  if (!client) {
    throw util::ConfigError("client handle must not be null");
  }
  if (!client->IsConnected()) {
    throw util::ConnectionError("client handle is disconnected");
  }
  return std::make_unique<ConnectionManager>(std::move(client), Ownership::kBorrowed, database_name);
}

ConnectionManager::ConnectionManager(std::shared_ptr<db::Client> client, Ownership ownership, std::string database_name)
    : client_(std::move(client)), ownership_(ownership), database_name_(std::move(database_name)) {
  if (database_name_.empty()) {
    throw util::ConfigError("database name is required");
  }
  try {
    database_ = client_->GetDatabase(database_name_);
  } catch (const db::DatabaseException& e) {
    RethrowConnectFailure(e);
  }
}

ConnectionManager::~ConnectionManager() {
  Close();
}

db::Database& ConnectionManager::Database() {
  if (closed_) {
    throw util::ConnectionError("driver is closed");
  }
  return *database_;
}

void ConnectionManager::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  database_.reset();
  if (ownership_ == Ownership::kOwned) {
    client_->Disconnect();
  }
  client_.reset();
  MIGRATE_LOG_DEBUG("connection closed", {observability::StringField("database", database_name_),
                                          observability::BoolField("owned", ownership_ == Ownership::kOwned)});
}

} // namespace migrate::connection
