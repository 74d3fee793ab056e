#include "internal/db/mongo/mongo_database.hpp"

#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/exception/exception.hpp>

#include <utility>

#include "internal/db/mongo/mongo_error.hpp"
#include "internal/db/mongo/mongo_session.hpp"

namespace migrate::db::mongo {

MongoDatabase::MongoDatabase(mongocxx::pool& pool, std::string name) : pool_(pool), name_(std::move(name)) {
}

bsoncxx::document::value MongoDatabase::RunCommand(bsoncxx::document::view command, Session* session) {
  try {
    if (session != nullptr) {
      auto& mongo_session = static_cast<MongoSession&>(*session);
      auto  reply         = mongo_session.Client()[name_].run_command(mongo_session.Native(), command);
      ThrowIfError(InspectReply(reply.view()));
      return reply;
    }

    auto client = pool_.acquire();
    auto reply  = (*client)[name_].run_command(command);
    ThrowIfError(InspectReply(reply.view()));
    return reply;
  } catch (const mongocxx::exception& e) {
    throw Translate(e);
  }
}

std::unique_ptr<Session> MongoDatabase::StartSession() {
  try {
    auto client  = pool_.acquire();
    auto session = client->start_session();
    return std::make_unique<MongoSession>(std::move(client), std::move(session));
  } catch (const mongocxx::exception& e) {
    throw Translate(e);
  }
}

std::vector<std::string> MongoDatabase::ListCollectionNames() {
  try {
    auto client = pool_.acquire();
    return (*client)[name_].list_collection_names();
  } catch (const mongocxx::exception& e) {
    throw Translate(e);
  }
}

} // namespace migrate::db::mongo
