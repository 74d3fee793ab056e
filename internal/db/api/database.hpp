#pragma once

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/session.hpp"

namespace migrate::db {

/*
  A logical database on a document store.

  Everything the driver does is expressed as database commands, so the
  backend surface stays small:

  - RunCommand() sends one command document and returns the reply.
    Failures (ok:0, writeErrors, writeConcernError, transport) throw
    DatabaseException.
  - With a session inside a transaction the command joins it.
*/
class Database {
 public:
  virtual ~Database() = default;

  virtual const std::string& Name() const = 0;

  virtual bsoncxx::document::value RunCommand(bsoncxx::document::view command, Session* session = nullptr) = 0;

  virtual std::unique_ptr<Session> StartSession() = 0;

  // Names of every collection, including system collections.
  virtual std::vector<std::string> ListCollectionNames() = 0;
};

} // namespace migrate::db
