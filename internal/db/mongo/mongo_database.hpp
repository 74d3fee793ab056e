#pragma once

#include <mongocxx/pool.hpp>

#include <string>

#include "internal/db/api/database.hpp"

namespace migrate::db::mongo {

/*
  Database backed by a mongocxx pool.

  Commands without a session acquire a pooled client for their duration;
  commands with a session run on the client that session was started on.
  Holds a reference to the pool; the Connection Manager destroys every
  MongoDatabase before disconnecting it.
*/
class MongoDatabase final : public db::Database {
 public:
  MongoDatabase(mongocxx::pool& pool, std::string name);

  const std::string& Name() const override {
    return name_;
  }

  bsoncxx::document::value RunCommand(bsoncxx::document::view command, Session* session) override;

  std::unique_ptr<Session> StartSession() override;

  std::vector<std::string> ListCollectionNames() override;

 private:
  mongocxx::pool& pool_;
  std::string     name_;
};

} // namespace migrate::db::mongo
