#pragma once

#include <mongocxx/pool.hpp>

#include <memory>
#include <string>

#include "internal/db/api/client.hpp"

namespace migrate::db::mongo {

/*
  db::Client over a mongocxx::pool.

  Two constructions:
    MongoClient(uri)    creates and owns a pool
    MongoClient(pool&)  borrows a caller's pool; Disconnect() only detaches

  A mongocxx::client is not thread-safe, a pool is: every command acquires
  its own client, so the caller may keep using the pool concurrently and the
  advisory lock heartbeat may run beside a migration.

  The process-wide mongocxx::instance is created on first use.
*/
class MongoClient final : public db::Client {
 public:
  explicit MongoClient(const std::string& uri);
  explicit MongoClient(mongocxx::pool& pool);

  std::unique_ptr<Database> GetDatabase(const std::string& name) override;

  void CheckReachable() override;
  void Disconnect() override;
  bool IsConnected() const override {
    return pool_ != nullptr;
  }

 private:
  mongocxx::pool& Native();

  std::unique_ptr<mongocxx::pool> owned_;
  mongocxx::pool*                 pool_ = nullptr;
};

} // namespace migrate::db::mongo
