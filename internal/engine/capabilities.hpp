#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/database.hpp"

namespace migrate::engine {

enum class Topology {
  kStandalone,
  kReplicaSet,
  kSharded,
};

struct Capabilities {
  Topology     topology         = Topology::kStandalone;
  std::int32_t max_wire_version = 0;

  // Multi-document transactions: replica sets from wire version 7 (4.0),
  // sharded clusters from wire version 8 (4.2).
  bool transactions = false;
};

// Asks the server with hello (isMaster on servers that predate it).
Capabilities DetectCapabilities(db::Database& database);

} // namespace migrate::engine
