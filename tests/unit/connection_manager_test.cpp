#include "internal/connection/connection_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/memory/memory_client.hpp"
#include "internal/db/memory/memory_server.hpp"
#include "internal/util/errors.hpp"

namespace {

using migrate::connection::ConnectionManager;
using migrate::connection::Ownership;
using migrate::db::memory::MemoryClient;
using migrate::db::memory::MemoryServer;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestAdoptedClientSurvivesClose() {
  auto client     = std::make_shared<MemoryClient>(std::make_shared<MemoryServer>());
  auto connection = ConnectionManager::Adopt(client, "app");
  assert(connection->GetOwnership() == Ownership::kBorrowed);
  assert(connection->Database().Name() == "app");

  connection->Close();
  connection->Close();
  assert(connection->IsClosed());
  assert(client->IsConnected());
  assert(Throws<migrate::util::ConnectionError>([&] { connection->Database(); }));
}

void TestOwnedClientIsDisconnected() {
  auto client = std::make_shared<MemoryClient>(std::make_shared<MemoryServer>());
  {
    ConnectionManager connection(client, Ownership::kOwned, "app");
    connection.Close();
    assert(!client->IsConnected());
  }

  // destruction closes as well
  auto other = std::make_shared<MemoryClient>(std::make_shared<MemoryServer>());
  { ConnectionManager connection(other, Ownership::kOwned, "app"); }
  assert(!other->IsConnected());
}

void TestAdoptRejectsUnusableHandles() {
  assert(Throws<migrate::util::ConfigError>([] { ConnectionManager::Adopt(nullptr, "app"); }));

  auto client = std::make_shared<MemoryClient>(std::make_shared<MemoryServer>());
  assert(Throws<migrate::util::ConfigError>([&] { ConnectionManager::Adopt(client, ""); }));

  client->Disconnect();
  assert(Throws<migrate::util::ConnectionError>([&] { ConnectionManager::Adopt(client, "app"); }));
}

void TestOpenChecksReachability() {
  auto                          server = std::make_shared<MemoryServer>();
  std::shared_ptr<MemoryClient> client;
  auto factory = [&](const std::string&) -> std::shared_ptr<migrate::db::Client> {
    client = std::make_shared<MemoryClient>(server);
    return client;
  };

  auto connection = ConnectionManager::Open("mongodb://localhost:27017", "app", factory);
  assert(connection->GetOwnership() == Ownership::kOwned);
  connection->Close();
  assert(!client->IsConnected());

  server->SetReachable(false);
  assert(Throws<migrate::util::ConnectionError>([&] { ConnectionManager::Open("mongodb://localhost:27017", "app", factory); }));
}

void TestOpenMapsFactoryFailures() {
  auto invalid = [](const std::string&) -> std::shared_ptr<migrate::db::Client> {
    throw migrate::db::DatabaseException(migrate::db::ErrorCode::InvalidArgument, "an invalid MongoDB URI was provided");
  };
  assert(Throws<migrate::util::ConfigError>([&] { ConnectionManager::Open("mongodb://", "app", invalid); }));

  auto none = [](const std::string&) -> std::shared_ptr<migrate::db::Client> { return nullptr; };
  assert(Throws<migrate::util::ConfigError>([&] { ConnectionManager::Open("mongodb://localhost", "app", none); }));
}

} // namespace

int main() {
  TestAdoptedClientSurvivesClose();
  TestOwnedClientIsDisconnected();
  TestAdoptRejectsUnusableHandles();
  TestOpenChecksReachability();
  TestOpenMapsFactoryFailures();

  std::cout << "migrate_unit_connection_manager: pass\n";
  return 0;
}
