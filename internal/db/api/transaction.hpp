#pragma once

#include <exception>

#include "internal/db/api/session.hpp"
#include "internal/observability/logging.hpp"

namespace migrate::db {

/*
  RAII scope for one transaction on a session.

  Aborts on destruction unless Commit() succeeded. Abort failures during
  unwinding are only logged: the server aborts an abandoned transaction when
  the session ends.
*/
class TransactionScope {
 public:
  explicit TransactionScope(Session& session) : session_(session) {
    session_.StartTransaction();
  }

  ~TransactionScope() {
    if (!finished_ && session_.InTransaction()) {
      try {
        session_.AbortTransaction();
      } catch (const std::exception& e) {
        MIGRATE_LOG_WARN("abort on scope exit failed", {observability::StringField("error", e.what())});
      }
    }
  }

  TransactionScope(const TransactionScope&)            = delete;
  TransactionScope& operator=(const TransactionScope&) = delete;

  void Commit() {
    session_.CommitTransaction();
    finished_ = true;
  }

  void Abort() {
    finished_ = true;
    session_.AbortTransaction();
  }

 private:
  Session& session_;
  bool     finished_ = false;
};

} // namespace migrate::db
