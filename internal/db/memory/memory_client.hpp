#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/client.hpp"
#include "internal/db/api/database.hpp"
#include "internal/db/memory/memory_server.hpp"

namespace migrate::db::memory {

class MemoryDatabase final : public db::Database {
 public:
  MemoryDatabase(std::shared_ptr<MemoryServer> server, std::string name, std::optional<Credentials> credentials);

  const std::string& Name() const override {
    return name_;
  }

  bsoncxx::document::value RunCommand(bsoncxx::document::view command, Session* session = nullptr) override;

  std::unique_ptr<Session> StartSession() override;

  std::vector<std::string> ListCollectionNames() override;

 private:
  std::shared_ptr<MemoryServer> server_;
  std::string                   name_;
  std::optional<Credentials>    credentials_;
};

/*
  Client handle onto a MemoryServer.

  Credentials are presented with every command; the server only checks them
  then, never at connect time.
*/
class MemoryClient final : public db::Client {
 public:
  explicit MemoryClient(std::shared_ptr<MemoryServer> server, std::optional<Credentials> credentials = std::nullopt);

  std::unique_ptr<Database> GetDatabase(const std::string& name) override;

  void CheckReachable() override;

  void Disconnect() override;

  bool IsConnected() const override {
    return connected_;
  }

 private:
  std::shared_ptr<MemoryServer> server_;
  std::optional<Credentials>    credentials_;
  bool                          connected_ = true;
};

} // namespace migrate::db::memory
