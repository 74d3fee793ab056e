#include "internal/db/mongo/mongo_session.hpp"

#include <mongocxx/exception/exception.hpp>

#include <utility>

#include "internal/db/mongo/mongo_error.hpp"

namespace migrate::db::mongo {

MongoSession::MongoSession(mongocxx::pool::entry client, mongocxx::client_session session)
    : client_(std::move(client)), session_(std::move(session)) {
}

void MongoSession::StartTransaction() {
  try {
    session_.start_transaction();
  } catch (const mongocxx::exception& e) {
    throw Translate(e);
  }
  in_transaction_ = true;
}

void MongoSession::CommitTransaction() {
  try {
    session_.commit_transaction();
  } catch (const mongocxx::exception& e) {
    // a failed commit leaves the transaction open for an explicit abort
    throw Translate(e);
  }
  in_transaction_ = false;
}

void MongoSession::AbortTransaction() {
  in_transaction_ = false;
  try {
    session_.abort_transaction();
  } catch (const mongocxx::exception& e) {
    throw Translate(e);
  }
}

} // namespace migrate::db::mongo
