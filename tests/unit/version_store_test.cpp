#include "internal/version/version_store.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/json.hpp>

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/memory/memory_client.hpp"
#include "internal/db/memory/memory_server.hpp"
#include "internal/util/errors.hpp"

namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using migrate::db::memory::MemoryClient;
using migrate::db::memory::MemoryServer;
using migrate::version::kNilVersion;
using migrate::version::VersionRecord;
using migrate::version::VersionStore;

// Answers every command with the same reply.
class CannedDatabase final : public migrate::db::Database {
 public:
  explicit CannedDatabase(const std::string& reply_json) : reply_(bsoncxx::from_json(reply_json)) {
  }

  const std::string& Name() const override {
    return name_;
  }

  bsoncxx::document::value RunCommand(bsoncxx::document::view, migrate::db::Session*) override {
    return reply_;
  }

  std::unique_ptr<migrate::db::Session> StartSession() override {
    throw migrate::db::DatabaseException(migrate::db::ErrorCode::Unsupported, "no sessions");
  }

  std::vector<std::string> ListCollectionNames() override {
    return {};
  }

 private:
  std::string              name_ = "app";
  bsoncxx::document::value reply_;
};

bool CurrentFailsAsInternal(const std::string& reply_json) {
  CannedDatabase db(reply_json);
  VersionStore   store(db, "schema_migrations");
  try {
    (void)store.Current();
  } catch (const migrate::util::DatabaseError& e) {
    return e.Cause() == migrate::db::ErrorCode::InternalError;
  }
  return false;
}

void TestNoVersionInitially() {
  auto         server = std::make_shared<MemoryServer>();
  auto         db     = MemoryClient(server).GetDatabase("app");
  VersionStore store(*db, "schema_migrations");

  auto current = store.Current();
  assert(current.version == kNilVersion);
  assert(!current.dirty);
}

void TestVersionRoundTrip() {
  auto         server = std::make_shared<MemoryServer>();
  auto         db     = MemoryClient(server).GetDatabase("app");
  VersionStore store(*db, "schema_migrations");

  const std::vector<std::pair<std::int64_t, bool>> cases = {
      {1, false}, {1, true}, {0, false}, {kNilVersion, false}, {20240101120000, true}, {std::numeric_limits<std::int64_t>::max(), false},
  };
  for (const auto& [version, dirty] : cases) {
    store.Set(version, dirty);
    assert((store.Current() == VersionRecord{version, dirty}));
    assert(server->CountDocuments("app", "schema_migrations") == 1);
  }
}

void TestEnsureIsIdempotent() {
  auto         server = std::make_shared<MemoryServer>();
  auto         db     = MemoryClient(server).GetDatabase("app");
  VersionStore store(*db, "custom_migrations");

  store.Ensure();
  store.Ensure();
  assert(server->HasCollection("app", "custom_migrations"));
  assert(store.Current().version == kNilVersion);
}

void TestSetJoinsTransaction() {
  auto         server = std::make_shared<MemoryServer>();
  auto         db     = MemoryClient(server).GetDatabase("app");
  VersionStore store(*db, "schema_migrations");
  store.Ensure();
  store.Set(1, false);

  auto session = db->StartSession();
  session->StartTransaction();
  store.Set(2, false, session.get());
  assert(store.Current().version == 1);
  session->AbortTransaction();
  assert(store.Current().version == 1);

  session->StartTransaction();
  store.Set(3, false, session.get());
  session->CommitTransaction();
  assert(store.Current().version == 3);
}

void TestSetInTransactionNeedsCollection() {
  auto         server = std::make_shared<MemoryServer>();
  auto         db     = MemoryClient(server).GetDatabase("app");
  VersionStore store(*db, "schema_migrations");

  auto session = db->StartSession();
  session->StartTransaction();
  bool threw = false;
  try {
    store.Set(1, false, session.get());
  } catch (const migrate::util::DatabaseError& e) {
    threw = e.Cause() == migrate::db::ErrorCode::Unsupported;
  }
  assert(threw);
  session->AbortTransaction();
}

void TestDropAllSkipsSystemCollections() {
  auto         server = std::make_shared<MemoryServer>();
  auto         db     = MemoryClient(server).GetDatabase("app");
  VersionStore store(*db, "schema_migrations");

  store.Set(4, false);
  db->RunCommand(make_document(kvp("create", "users")));
  db->RunCommand(make_document(kvp("create", "system.views")));

  auto dropped = store.DropAll();
  std::sort(dropped.begin(), dropped.end());
  assert((dropped == std::vector<std::string>{"schema_migrations", "users"}));
  assert(server->HasCollection("app", "system.views"));
  assert(!server->HasCollection("app", "users"));
  assert(store.Current().version == kNilVersion);
}

void TestDropReportsFailures() {
  auto         server = std::make_shared<MemoryServer>();
  auto         db     = MemoryClient(server).GetDatabase("app");
  VersionStore store(*db, "schema_migrations");

  db->RunCommand(make_document(kvp("create", "a")));
  db->RunCommand(make_document(kvp("create", "protected")));
  server->SetCommandHook([](const std::string&, bsoncxx::document::view command) {
    if (command["drop"] && command["drop"].get_string().value == "protected") {
      throw migrate::db::DatabaseException(migrate::db::ErrorCode::Unauthorized, "not authorized on app to execute command", 13);
    }
  });

  bool threw = false;
  try {
    store.DropAll();
  } catch (const migrate::util::DropError& e) {
    threw = true;
    assert((e.Dropped() == std::vector<std::string>{"a"}));
    assert((e.Failed() == std::vector<std::string>{"protected"}));
  }
  assert(threw);
  assert(!server->HasCollection("app", "a"));
  assert(server->HasCollection("app", "protected"));
}

void TestMalformedFindReplyIsDatabaseError() {
  assert(CurrentFailsAsInternal(R"({"ok": 1})"));
  assert(CurrentFailsAsInternal(R"({"ok": 1, "cursor": 7})"));
  assert(CurrentFailsAsInternal(R"({"ok": 1, "cursor": {"id": 0}})"));
  assert(CurrentFailsAsInternal(R"({"ok": 1, "cursor": {"firstBatch": {"version": 3}}})"));
  assert(CurrentFailsAsInternal(R"({"ok": 1, "cursor": {"firstBatch": [3]}})"));

  CannedDatabase empty(R"({"ok": 1, "cursor": {"id": 0, "firstBatch": []}})");
  assert(VersionStore(empty, "schema_migrations").Current().version == kNilVersion);

  CannedDatabase record(R"({"ok": 1, "cursor": {"id": 0, "firstBatch": [{"version": 3, "dirty": true}]}})");
  auto           current = VersionStore(record, "schema_migrations").Current();
  assert(current.version == 3);
  assert(current.dirty);
}

} // namespace

int main() {
  TestNoVersionInitially();
  TestVersionRoundTrip();
  TestEnsureIsIdempotent();
  TestSetJoinsTransaction();
  TestSetInTransactionNeedsCollection();
  TestDropAllSkipsSystemCollections();
  TestDropReportsFailures();
  TestMalformedFindReplyIsDatabaseError();

  std::cout << "migrate_unit_version_store: pass\n";
  return 0;
}
