#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/db/api/client.hpp"
#include "internal/db/api/database.hpp"

namespace migrate::connection {

enum class Ownership {
  kOwned,    // opened from a URI; disconnected on Close()
  kBorrowed, // adopted from the caller; never disconnected here
};

// Builds the client Open() connects with, from the URI left after the x-
// options were stripped.
using ClientFactory = std::function<std::shared_ptr<db::Client>(const std::string& driver_uri)>;

// mongocxx pool per URI.
ClientFactory MongoClientFactory();

/*
  Holds the client handle and the target database for one driver.

  Ownership is decided once, at construction. Close() is idempotent and
  afterwards every accessor throws util::ConnectionError.
*/
class ConnectionManager {
 public:
  // Connects to MongoDB and selects a server. No authenticated command is
  // sent, so bad credentials surface on first use.
  static std::unique_ptr<ConnectionManager> Open(const std::string& driver_uri, const std::string& database_name,
                                                 const ClientFactory& factory = MongoClientFactory());

  static std::unique_ptr<ConnectionManager> Adopt(std::shared_ptr<db::Client> client, const std::string& database_name);

  ConnectionManager(std::shared_ptr<db::Client> client, Ownership ownership, std::string database_name);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&)            = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  db::Database& Database();

  const std::string& DatabaseName() const {
    return database_name_;
  }

  Ownership GetOwnership() const {
    return ownership_;
  }

  bool IsClosed() const {
    return closed_;
  }

  void Close();

 private:
  std::shared_ptr<db::Client>   client_;
  Ownership                     ownership_;
  std::string                   database_name_;
  std::unique_ptr<db::Database> database_;
  bool                          closed_ = false;
};

} // namespace migrate::connection
