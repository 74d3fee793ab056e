#pragma once

namespace migrate::db {

/*
  Abstract client session.

  Semantics guaranteed for ALL backends:

  - Commands issued with a session inside a transaction are invisible to
    other sessions until CommitTransaction()
  - AbortTransaction() discards every write of the transaction
  - A failed command inside a transaction may abort it server side; a later
    AbortTransaction() is still allowed
  - Destructor MUST abort a transaction that was neither committed nor
    aborted

  MongoDB: mongocxx::client_session
  Memory: snapshot copy of the database state
*/

class Session {
 public:
  virtual ~Session() = default;

  virtual void StartTransaction() = 0;

  // commit changes atomically
  virtual void CommitTransaction() = 0;

  // explicit rollback
  virtual void AbortTransaction() = 0;

  virtual bool InTransaction() const = 0;
};

} // namespace migrate::db
