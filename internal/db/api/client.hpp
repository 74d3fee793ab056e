#pragma once

#include <memory>
#include <string>

#include "internal/db/api/database.hpp"

namespace migrate::db {

/*
  Connection handle to a document store deployment.

  A Client may be shared by several drivers and by code outside this
  library. Disconnect() releases the underlying connections; the caller that
  owns the client decides when to call it.
*/
class Client {
 public:
  virtual ~Client() = default;

  virtual std::unique_ptr<Database> GetDatabase(const std::string& name) = 0;

  // Selects a server without running an authenticated command. Transport,
  // DNS and topology failures throw DatabaseException(IOError).
  virtual void CheckReachable() = 0;

  virtual void Disconnect() = 0;

  virtual bool IsConnected() const = 0;
};

} // namespace migrate::db
