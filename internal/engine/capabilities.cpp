#include "internal/engine/capabilities.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace migrate::engine {

namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

constexpr std::int32_t kReplicaSetTransactionsWireVersion = 7;
constexpr std::int32_t kShardedTransactionsWireVersion    = 8;

bsoncxx::document::value Hello(db::Database& database) {
  try {
    return database.RunCommand(make_document(kvp("hello", 1)));
  } catch (const db::DatabaseException& e) {
    if (e.Code() != db::ErrorCode::Unsupported) {
      throw;
    }
  }
  return database.RunCommand(make_document(kvp("isMaster", 1)));
}

} // namespace

Capabilities DetectCapabilities(db::Database& database) {
  Capabilities caps;
  try {
    auto reply = Hello(database);
    auto view  = reply.view();

    if (auto wire = view["maxWireVersion"]; wire && wire.type() == bsoncxx::type::k_int32) {
      caps.max_wire_version = wire.get_int32().value;
    } else if (wire && wire.type() == bsoncxx::type::k_int64) {
      caps.max_wire_version = static_cast<std::int32_t>(wire.get_int64().value);
    }
    if (auto msg = view["msg"]; msg && msg.type() == bsoncxx::type::k_string && msg.get_string().value == "isdbgrid") {
      caps.topology     = Topology::kSharded;
      caps.transactions = caps.max_wire_version >= kShardedTransactionsWireVersion;
    } else if (view["setName"]) {
      caps.topology     = Topology::kReplicaSet;
      caps.transactions = caps.max_wire_version >= kReplicaSetTransactionsWireVersion;
    }
  } catch (const db::DatabaseException& e) {
    util::RethrowAsMigrateError(e, "detect server capabilities");
  }

  MIGRATE_LOG_DEBUG("server capabilities", {observability::IntField("max_wire_version", caps.max_wire_version),
                                            observability::BoolField("transactions", caps.transactions)});
  return caps;
}

} // namespace migrate::engine
