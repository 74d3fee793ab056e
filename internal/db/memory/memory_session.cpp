#include "internal/db/memory/memory_session.hpp"

#include "internal/db/api/result.hpp"
#include "internal/db/memory/memory_commands.hpp"

namespace migrate::db::memory {

namespace {

constexpr std::int32_t kIllegalOperation  = 20;
constexpr std::int32_t kNoSuchTransaction = 251;

} // namespace

MemorySession::MemorySession(std::shared_ptr<MemoryServer> server, std::string database, std::optional<Credentials> credentials)
    : server_(std::move(server)), database_(std::move(database)), credentials_(std::move(credentials)) {
}

void MemorySession::StartTransaction() {
  if (!server_->Options().replica_set) {
    throw DatabaseException(ErrorCode::Unsupported, "Transaction numbers are only allowed on a replica set member or mongos",
                            kIllegalOperation);
  }
  if (in_transaction_) {
    throw DatabaseException(ErrorCode::InvalidArgument, "transaction already in progress");
  }
  server_->CheckAccess(credentials_);

  auto [state, version] = server_->Snapshot(database_);
  working_              = std::move(state); // snapshot copy
  snapshot_version_     = version;
  touched_.clear();
  in_transaction_       = true;
  server_aborted_       = false;
}

bsoncxx::document::value MemorySession::Execute(bsoncxx::document::view command) {
  if (!in_transaction_) {
    throw DatabaseException(ErrorCode::InvalidArgument, "no transaction in progress");
  }
  server_->CheckAccess(credentials_);
  server_->NotifyCommand(database_, command);
  if (server_aborted_) {
    throw DatabaseException(ErrorCode::Conflict, "Transaction has been aborted.", kNoSuchTransaction);
  }

  ExecutionContext context{.in_transaction = true, .replica_set = true, .max_wire_version = server_->Options().max_wire_version};
  try {
    touched_.merge(WrittenCollections(working_, command));
    auto reply = ExecuteCommand(working_, command, context);
    if (!InspectReply(reply.view())) {
      server_aborted_ = true;
    }
    return reply;
  } catch (const DatabaseException&) {
    server_aborted_ = true;
    throw;
  }
}

void MemorySession::CommitTransaction() {
  if (!in_transaction_) {
    throw DatabaseException(ErrorCode::InvalidArgument, "no transaction in progress");
  }
  in_transaction_ = false;
  if (server_aborted_) {
    working_ = {};
    throw DatabaseException(ErrorCode::Conflict, "Transaction has been aborted.", kNoSuchTransaction);
  }
  server_->CheckAccess(credentials_);
  server_->Commit(database_, std::move(working_), touched_, snapshot_version_);
  working_ = {};
  touched_.clear();
}

void MemorySession::AbortTransaction() {
  if (!in_transaction_) {
    throw DatabaseException(ErrorCode::InvalidArgument, "no transaction in progress");
  }
  in_transaction_ = false;
  server_aborted_ = false;
  working_        = {};
  touched_.clear();
}

} // namespace migrate::db::memory
