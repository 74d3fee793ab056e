#pragma once

#include <mongocxx/client.hpp>
#include <mongocxx/client_session.hpp>
#include <mongocxx/pool.hpp>

#include "internal/db/api/session.hpp"

namespace migrate::db::mongo {

/*
  mongocxx::client_session wrapper.

  Keeps the pooled client the session was started on; the session is
  destroyed first. libmongoc aborts an in-progress transaction when the
  session is destroyed, which satisfies the Session destructor contract.
*/
class MongoSession final : public db::Session {
 public:
  MongoSession(mongocxx::pool::entry client, mongocxx::client_session session);

  void StartTransaction() override;
  void CommitTransaction() override;
  void AbortTransaction() override;
  bool InTransaction() const override {
    return in_transaction_;
  }

  mongocxx::client_session& Native() {
    return session_;
  }

  mongocxx::client& Client() {
    return *client_;
  }

 private:
  mongocxx::pool::entry    client_;
  mongocxx::client_session session_;
  bool                     in_transaction_ = false;
};

} // namespace migrate::db::mongo
