#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/database.hpp"
#include "internal/db/api/session.hpp"

namespace migrate::version {

// No migration has ever been recorded.
inline constexpr std::int64_t kNilVersion = -1;

struct VersionRecord {
  std::int64_t version = kNilVersion;
  bool         dirty   = false;

  bool operator==(const VersionRecord& other) const {
    return version == other.version && dirty == other.dirty;
  }
};

/*
  Version + dirty flag, stored as the only document of the migrations
  collection. Backend failures are rethrown as util::MigrateError.
*/
class VersionStore {
 public:
  VersionStore(db::Database& database, std::string collection);

  // Creates the migrations collection if it does not exist yet, so that
  // writes inside a transaction never need to create it implicitly.
  void Ensure();

  VersionRecord Current();

  // Replaces the record. With a session inside a transaction the write is
  // part of that transaction.
  void Set(std::int64_t version, bool dirty, db::Session* session = nullptr);

  // Drops every non-system collection of the database, this one included.
  // Throws util::DropError naming what was and was not dropped.
  std::vector<std::string> DropAll();

  const std::string& Collection() const {
    return collection_;
  }

 private:
  db::Database& database_;
  std::string   collection_;
};

} // namespace migrate::version
