#pragma once

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>

#include <cstdint>
#include <set>
#include <string>

#include "internal/db/memory/memory_store.hpp"

namespace migrate::db::memory {

/*
  Interpreter for the command subset the driver and its tests rely on.

    ping, hello/isMaster, create, createIndexes, dropIndexes, insert,
    find, count, update, delete, drop, dropDatabase

  Mirrors server behaviour where it matters to migrations:
    - command failures throw DatabaseException with the server code
    - write failures are reported as writeErrors in an ok:1 reply
    - collection/index creation and drops are rejected inside transactions
      (OperationNotSupportedInTransaction), as are inserts into collections
      that do not exist yet
    - unknown commands fail with CommandNotFound

  Filters match top-level fields by equality or with $eq/$ne/$lt/$lte/
  $gt/$gte/$exists.
*/

struct ExecutionContext {
  bool         in_transaction   = false;
  bool         replica_set      = false;
  std::int32_t max_wire_version = 17;
};

bsoncxx::document::value ExecuteCommand(DatabaseState& state, bsoncxx::document::view command, const ExecutionContext& context);

bool Matches(bsoncxx::document::view document, bsoncxx::document::view filter);

// Everything except ping, hello/isMaster, find and count.
bool IsWriteCommand(bsoncxx::document::view command);

// Collections a write command may change in `state`: the command's target,
// or every collection for dropDatabase.
std::set<std::string> WrittenCollections(const DatabaseState& state, bsoncxx::document::view command);

} // namespace migrate::db::memory
