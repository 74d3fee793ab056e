#include "internal/db/memory/memory_client.hpp"

#include "internal/db/api/result.hpp"
#include "internal/db/memory/memory_session.hpp"

namespace migrate::db::memory {

MemoryDatabase::MemoryDatabase(std::shared_ptr<MemoryServer> server, std::string name, std::optional<Credentials> credentials)
    : server_(std::move(server)), name_(std::move(name)), credentials_(std::move(credentials)) {
}

bsoncxx::document::value MemoryDatabase::RunCommand(bsoncxx::document::view command, Session* session) {
  if (session != nullptr && session->InTransaction()) {
    auto* memory_session = dynamic_cast<MemorySession*>(session);
    if (memory_session == nullptr || memory_session->Database() != name_) {
      throw DatabaseException(ErrorCode::InvalidArgument, "session does not belong to database " + name_);
    }
    auto reply = memory_session->Execute(command);
    ThrowIfError(InspectReply(reply.view()));
    return reply;
  }

  auto reply = server_->Execute(name_, command, credentials_);
  ThrowIfError(InspectReply(reply.view()));
  return reply;
}

std::unique_ptr<Session> MemoryDatabase::StartSession() {
  return std::make_unique<MemorySession>(server_, name_, credentials_);
}

std::vector<std::string> MemoryDatabase::ListCollectionNames() {
  server_->CheckAccess(credentials_);
  return server_->ListCollectionNames(name_);
}

MemoryClient::MemoryClient(std::shared_ptr<MemoryServer> server, std::optional<Credentials> credentials)
    : server_(std::move(server)), credentials_(std::move(credentials)) {
}

std::unique_ptr<Database> MemoryClient::GetDatabase(const std::string& name) {
  if (!connected_) {
    throw DatabaseException(ErrorCode::IOError, "client is disconnected");
  }
  return std::make_unique<MemoryDatabase>(server_, name, credentials_);
}

void MemoryClient::CheckReachable() {
  if (!connected_ || !server_->Reachable()) {
    throw DatabaseException(ErrorCode::IOError, "No suitable servers found: server selection timeout");
  }
}

void MemoryClient::Disconnect() {
  connected_ = false;
}

} // namespace migrate::db::memory
