#include "internal/db/mongo/mongo_client.hpp"

#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/uri.hpp>

#include "internal/db/mongo/mongo_database.hpp"
#include "internal/db/mongo/mongo_error.hpp"

namespace migrate::db::mongo {

MongoClient::MongoClient(const std::string& uri) {
  mongocxx::instance::current();
  try {
    owned_ = std::make_unique<mongocxx::pool>(mongocxx::uri{uri});
  } catch (const mongocxx::exception& e) {
    throw Translate(e);
  }
  pool_ = owned_.get();
}

MongoClient::MongoClient(mongocxx::pool& pool) : pool_(&pool) {
}

mongocxx::pool& MongoClient::Native() {
  if (pool_ == nullptr) {
    throw DatabaseException(ErrorCode::IOError, "mongodb client is disconnected");
  }
  return *pool_;
}

std::unique_ptr<Database> MongoClient::GetDatabase(const std::string& name) {
  return std::make_unique<MongoDatabase>(Native(), name);
}

void MongoClient::CheckReachable() {
  // Starting a session forces server selection (hello handshake only).
  // Credentials are checked later, on the first authenticated command.
  try {
    auto client  = Native().acquire();
    auto session = client->start_session();
    (void)session;
  } catch (const mongocxx::exception& e) {
    auto translated = Translate(e);
    if (translated.Code() == ErrorCode::Unauthenticated) {
      throw translated;
    }
    throw DatabaseException(ErrorCode::IOError, translated.what(), translated.ServerCode());
  }
}

void MongoClient::Disconnect() {
  pool_ = nullptr;
  owned_.reset();
}

} // namespace migrate::db::mongo
