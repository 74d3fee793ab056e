#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/connection/connection_manager.hpp"
#include "internal/db/api/client.hpp"
#include "internal/engine/execution_engine.hpp"
#include "internal/lock/advisory_lock.hpp"
#include "internal/version/version_store.hpp"

namespace migrate::mongodb {

using engine::RunOptions;
using version::kNilVersion;
using version::VersionRecord;

/*
  Migration driver for one MongoDB database.

  Public operations are serialized by a mutex; one Driver may be shared
  between threads. Every failure is a util::MigrateError.
*/
class Driver {
 public:
  // mongodb://[user:pass@]host[:port]/database[?options][&x-...]
  static std::unique_ptr<Driver> Open(const std::string& uri);

  // Same, with the client built by `factory` instead of a mongocxx pool.
  static std::unique_ptr<Driver> Open(const std::string& uri, const connection::ClientFactory& factory);

  // Adopts a connected client. The caller keeps ownership: Close() never
  // disconnects it.
  static std::unique_ptr<Driver> WithInstance(std::shared_ptr<db::Client> client, config::DriverConfig config);

  ~Driver();

  Driver(const Driver&)            = delete;
  Driver& operator=(const Driver&) = delete;

  // Applies a script without touching the version number.
  void Run(std::istream& script, const RunOptions& options = {});

  // Applies a script and records `version` on success.
  void Run(std::istream& script, std::int64_t version, const RunOptions& options = {});

  VersionRecord Version();

  // Overwrites the record; SetVersion(v, false) clears a dirty state.
  void SetVersion(std::int64_t version, bool dirty);

  // Drops every collection of the database. Returns the dropped names.
  std::vector<std::string> Drop();

  void Lock();
  void Unlock();

  // Idempotent.
  void Close();

  const config::DriverConfig& Config() const {
    return config_;
  }

 private:
  Driver(std::unique_ptr<connection::ConnectionManager> connection, config::DriverConfig config);

  void RunLocked(std::istream& script, std::optional<std::int64_t> version, const RunOptions& options);
  void RequireOpen() const;

  mutable std::mutex                             mutex_;
  config::DriverConfig                           config_;
  std::unique_ptr<connection::ConnectionManager> connection_;
  std::unique_ptr<version::VersionStore>         versions_;
  std::unique_ptr<lock::AdvisoryLock>            lock_;
  std::unique_ptr<engine::ExecutionEngine>       engine_;
};

} // namespace migrate::mongodb
