#include "internal/db/memory/memory_server.hpp"

#include <algorithm>
#include <set>

#include "internal/db/api/result.hpp"
#include "internal/db/memory/memory_commands.hpp"

namespace migrate::db::memory {

namespace {

constexpr std::int32_t kAuthenticationFailed = 18;
constexpr std::int32_t kWriteConflict        = 112;

} // namespace

MemoryServer::MemoryServer(MemoryServerOptions options) : options_(std::move(options)) {
}

void MemoryServer::CheckAccess(const std::optional<Credentials>& presented) const {
  if (!Reachable()) {
    throw DatabaseException(ErrorCode::IOError, "No suitable servers found: server is unreachable");
  }
  if (!options_.required_credentials) {
    return;
  }
  const auto& required = *options_.required_credentials;
  if (!presented || presented->username != required.username || presented->password != required.password) {
    throw DatabaseException(ErrorCode::Unauthenticated, "Authentication failed.", kAuthenticationFailed);
  }
}

void MemoryServer::NotifyCommand(const std::string& database, bsoncxx::document::view command) const {
  CommandHook hook;
  {
    std::scoped_lock lock(mutex_);
    hook = hook_;
  }
  // outside the lock: a hook may inspect the server
  if (hook) {
    hook(database, command);
  }
}

bsoncxx::document::value MemoryServer::Execute(const std::string& database, bsoncxx::document::view command,
                                               const std::optional<Credentials>& presented) {
  CheckAccess(presented);
  NotifyCommand(database, command);

  std::scoped_lock lock(mutex_);
  ExecutionContext context{.in_transaction = false, .replica_set = options_.replica_set, .max_wire_version = options_.max_wire_version};
  auto&            state   = databases_[database];
  const auto       written = WrittenCollections(state, command);
  auto             reply   = ExecuteCommand(state, command, context);
  if (!written.empty()) {
    const auto stamp = ++clock_;
    for (const auto& name : written) {
      written_[database][name] = stamp;
    }
  }
  return reply;
}

std::pair<DatabaseState, std::uint64_t> MemoryServer::Snapshot(const std::string& database) {
  std::scoped_lock lock(mutex_);
  return {databases_[database], clock_};
}

void MemoryServer::Commit(const std::string& database, DatabaseState state, const std::set<std::string>& touched, std::uint64_t snapshot) {
  std::scoped_lock lock(mutex_);
  auto&            stamps = written_[database];
  for (const auto& name : touched) {
    if (auto it = stamps.find(name); it != stamps.end() && it->second > snapshot) {
      throw DatabaseException(ErrorCode::Conflict, "WriteConflict: " + name + " was modified by a concurrent operation", kWriteConflict);
    }
  }

  // only the collections the transaction wrote are published
  auto&      live  = databases_[database];
  const auto stamp = ++clock_;
  for (const auto& name : touched) {
    if (auto it = state.collections.find(name); it != state.collections.end()) {
      live.collections[name] = std::move(it->second);
    } else {
      live.collections.erase(name);
    }
    stamps[name] = stamp;
  }
}

std::vector<std::string> MemoryServer::ListCollectionNames(const std::string& database) {
  std::scoped_lock         lock(mutex_);
  std::vector<std::string> names;
  if (auto it = databases_.find(database); it != databases_.end()) {
    for (const auto& [name, collection] : it->second.collections) {
      names.push_back(name);
    }
  }
  return names;
}

void MemoryServer::SetReachable(bool reachable) {
  std::scoped_lock lock(mutex_);
  reachable_ = reachable;
}

bool MemoryServer::Reachable() const {
  std::scoped_lock lock(mutex_);
  return reachable_;
}

void MemoryServer::SetCommandHook(CommandHook hook) {
  std::scoped_lock lock(mutex_);
  hook_ = std::move(hook);
}

const CollectionState* MemoryServer::FindCollection(const std::string& database, const std::string& collection) const {
  auto db = databases_.find(database);
  if (db == databases_.end()) {
    return nullptr;
  }
  auto it = db->second.collections.find(collection);
  return it == db->second.collections.end() ? nullptr : &it->second;
}

bool MemoryServer::HasCollection(const std::string& database, const std::string& collection) const {
  std::scoped_lock lock(mutex_);
  return FindCollection(database, collection) != nullptr;
}

bool MemoryServer::HasIndex(const std::string& database, const std::string& collection, const std::string& index) const {
  std::scoped_lock lock(mutex_);
  const auto*      state = FindCollection(database, collection);
  if (state == nullptr) {
    return false;
  }
  return std::any_of(state->indexes.begin(), state->indexes.end(), [&](const IndexSpec& spec) { return spec.name == index; });
}

std::int64_t MemoryServer::CountDocuments(const std::string& database, const std::string& collection) const {
  std::scoped_lock lock(mutex_);
  const auto*      state = FindCollection(database, collection);
  return state == nullptr ? 0 : static_cast<std::int64_t>(state->documents.size());
}

std::vector<bsoncxx::document::value> MemoryServer::Documents(const std::string& database, const std::string& collection) const {
  std::scoped_lock lock(mutex_);
  const auto*      state = FindCollection(database, collection);
  return state == nullptr ? std::vector<bsoncxx::document::value>{} : state->documents;
}

} // namespace migrate::db::memory
