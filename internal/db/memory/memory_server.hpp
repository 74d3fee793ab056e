#pragma once

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_store.hpp"

namespace migrate::db::memory {

struct Credentials {
  std::string username;
  std::string password;
};

struct MemoryServerOptions {
  // Replica set members report setName and support transactions.
  bool         replica_set      = true;
  std::int32_t max_wire_version = 17;

  // When set, every command must present matching credentials.
  std::optional<Credentials> required_credentials;
};

/*
  In-process document store shared by any number of MemoryClient handles.

  Committed state is guarded by one mutex. Every committed write stamps the
  collections it changed with a server-wide counter; a transaction fails
  its commit with WriteConflict when a collection it wrote was stamped after
  its snapshot was taken.
*/
class MemoryServer {
 public:
  using CommandHook = std::function<void(const std::string& database, bsoncxx::document::view command)>;

  explicit MemoryServer(MemoryServerOptions options = {});

  const MemoryServerOptions& Options() const {
    return options_;
  }

  // Runs one command outside any transaction.
  bsoncxx::document::value Execute(const std::string& database, bsoncxx::document::view command, const std::optional<Credentials>& presented);

  // Throws when the server is unreachable or the credentials do not match.
  void CheckAccess(const std::optional<Credentials>& presented) const;

  std::pair<DatabaseState, std::uint64_t> Snapshot(const std::string& database);

  // Publishes the `touched` collections of a transaction's working copy.
  // Throws WriteConflict (112) when one of them changed after `snapshot`.
  void Commit(const std::string& database, DatabaseState state, const std::set<std::string>& touched, std::uint64_t snapshot);

  std::vector<std::string> ListCollectionNames(const std::string& database);

  void NotifyCommand(const std::string& database, bsoncxx::document::view command) const;

  // test helpers
  void SetReachable(bool reachable);
  bool Reachable() const;
  void SetCommandHook(CommandHook hook);

  bool                                  HasCollection(const std::string& database, const std::string& collection) const;
  bool                                  HasIndex(const std::string& database, const std::string& collection, const std::string& index) const;
  std::int64_t                          CountDocuments(const std::string& database, const std::string& collection) const;
  std::vector<bsoncxx::document::value> Documents(const std::string& database, const std::string& collection) const;

 private:
  const CollectionState* FindCollection(const std::string& database, const std::string& collection) const;

  MemoryServerOptions options_;

  mutable std::mutex                                          mutex_;
  std::map<std::string, DatabaseState>                        databases_;
  std::map<std::string, std::map<std::string, std::uint64_t>> written_; // collection -> last write stamp
  std::uint64_t                                               clock_     = 0;
  bool                                                        reachable_ = true;
  CommandHook                                                 hook_;
};

} // namespace migrate::db::memory
