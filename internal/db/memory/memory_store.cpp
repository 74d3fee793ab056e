#include "internal/db/memory/memory_store.hpp"

namespace migrate::db::memory {

// Every collection starts with the implicit unique index on _id.
CollectionState::CollectionState() : indexes{IndexSpec{"_id_", {"_id"}, true}} {
}

} // namespace migrate::db::memory
