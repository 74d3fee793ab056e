#include "internal/engine/execution_engine.hpp"

#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>

#include <atomic>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "internal/codec/command_codec.hpp"
#include "internal/db/memory/memory_client.hpp"
#include "internal/db/memory/memory_server.hpp"
#include "internal/lock/advisory_lock.hpp"
#include "internal/model/run_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/version/version_store.hpp"

namespace {

using migrate::codec::CommandCodec;
using migrate::db::ErrorCode;
using migrate::db::memory::MemoryClient;
using migrate::db::memory::MemoryServer;
using migrate::engine::ExecutionEngine;
using migrate::engine::RunOptions;
using migrate::lock::AdvisoryLock;
using migrate::lock::LockOptions;
using migrate::model::RunOutcome;
using migrate::model::RunState;
using migrate::version::kNilVersion;
using migrate::version::VersionRecord;
using migrate::version::VersionStore;

constexpr const char* kLockCollection = "migrate_advisory_lock";

// One database with the components wired the way the driver wires them.
struct Fixture {
  explicit Fixture(bool transaction_mode, std::shared_ptr<MemoryServer> shared = std::make_shared<MemoryServer>(),
                   std::chrono::seconds lease = std::chrono::seconds(15))
      : server(std::move(shared)),
        database(MemoryClient(server).GetDatabase("app")),
        versions(*database, "schema_migrations"),
        lock(*database, LockOptions{.enabled = true, .collection = kLockCollection, .lease = lease}),
        engine(*database, versions, lock, transaction_mode) {
  }

  void Run(const std::string& script, std::optional<std::int64_t> target, const RunOptions& options = {}) {
    engine.Run(CommandCodec::Decode(script), target, options);
  }

  std::shared_ptr<MemoryServer>         server;
  std::unique_ptr<migrate::db::Database> database;
  VersionStore                          versions;
  AdvisoryLock                          lock;
  ExecutionEngine                       engine;
};

const char* kSetupScript = R"([
  {"create": "hello"},
  {"createIndexes": "hello", "indexes": [{"key": {"wild": 1}, "name": "wild_1", "unique": true}]},
  {"insert": "hello", "documents": [{"wild": "flower"}, {"wild": "cat"}, {"wild": "mouse"}]}
])";

void TestDirectRunRecordsVersion() {
  Fixture f(false);
  f.Run(kSetupScript, 1);

  assert(f.server->CountDocuments("app", "hello") == 3);
  assert((f.versions.Current() == VersionRecord{1, false}));
  assert(f.engine.State() == RunState::kLockReleased);
  assert(!f.lock.Held());
  assert(f.server->CountDocuments("app", kLockCollection) == 0);
}

void TestRunWithoutTargetKeepsVersion() {
  Fixture f(false);
  f.Run(kSetupScript, 3);
  f.Run(R"([{"insert": "hello", "documents": [{"wild": "dog"}]}])", std::nullopt);
  assert((f.versions.Current() == VersionRecord{3, false}));
  assert(f.server->CountDocuments("app", "hello") == 4);
}

void TestEmptyScriptStillSetsVersion() {
  Fixture f(false);
  f.Run("[]", 7);
  assert((f.versions.Current() == VersionRecord{7, false}));
}

void TestDirectFailureLeavesDirtyPartialState() {
  Fixture f(false);
  f.Run(kSetupScript, 1);

  bool threw = false;
  try {
    f.Run(R"([
      {"insert": "hello", "documents": [{"wild": "dog"}]},
      {"insert": "hello", "documents": [{"wild": "cat"}]},
      {"insert": "hello", "documents": [{"wild": "bird"}]}
    ])",
          2);
  } catch (const migrate::util::CommandError& e) {
    threw = true;
    assert(e.Index() == 1);
    assert(e.Command() == "insert");
    assert(e.Cause() == ErrorCode::ConstraintViolation);
    assert(e.Outcome() == RunOutcome::kPartiallyApplied);
  }
  assert(threw);
  assert(f.server->CountDocuments("app", "hello") == 4);
  assert((f.versions.Current() == VersionRecord{2, true}));
  assert(f.server->CountDocuments("app", kLockCollection) == 0);
}

void TestDirtyVersionBlocksRun() {
  Fixture f(false);
  f.versions.Set(5, true);

  bool threw = false;
  try {
    f.Run(R"([{"create": "never"}])", 6);
  } catch (const migrate::util::DirtyVersion& e) {
    threw = e.Version() == 5;
  }
  assert(threw);
  assert(!f.server->HasCollection("app", "never"));
  assert((f.versions.Current() == VersionRecord{5, true}));
  assert(f.server->CountDocuments("app", kLockCollection) == 0);
}

void TestTransactionalFailureIsAtomic() {
  Fixture f(true);
  f.Run(kSetupScript, 1);
  assert(f.server->CountDocuments("app", "hello") == 3);

  bool threw = false;
  try {
    f.Run(R"([
      {"insert": "hello", "documents": [{"wild": "dog"}]},
      {"insert": "hello", "documents": [{"wild": "cat"}]}
    ])",
          2);
  } catch (const migrate::util::CommandError& e) {
    threw = true;
    assert(e.Index() == 1);
    assert(e.Cause() == ErrorCode::ConstraintViolation);
    assert(e.Outcome() == RunOutcome::kAborted);
  }
  assert(threw);
  assert(f.server->CountDocuments("app", "hello") == 3);
  assert((f.versions.Current() == VersionRecord{1, false}));
  assert(f.engine.State() == RunState::kLockReleased);
}

void TestTransactionalSuccessCommitsVersionWithData() {
  Fixture f(true);
  f.Run(kSetupScript, 1);
  f.Run(R"([{"insert": "hello", "documents": [{"wild": "dog"}]}, {"delete": "hello", "deletes": [{"q": {"wild": "mouse"}, "limit": 1}]}])", 2);
  assert(f.server->CountDocuments("app", "hello") == 3);
  assert((f.versions.Current() == VersionRecord{2, false}));
}

void TestStructuralAfterDataIsRejectedUpFront() {
  Fixture f(true);

  bool threw = false;
  try {
    f.Run(R"([{"insert": "a", "documents": [{}]}, {"create": "b"}])", 1);
  } catch (const migrate::util::MalformedScript&) {
    threw = true;
  }
  assert(threw);
  assert(!f.server->HasCollection("app", "a"));
  assert(!f.server->HasCollection("app", "b"));
  assert(!f.server->HasCollection("app", kLockCollection));
  assert(f.versions.Current().version == kNilVersion);
}

void TestStructuralPrefixFailureMarksDirty() {
  Fixture f(true);

  bool threw = false;
  try {
    f.Run(R"([{"create": "a"}, {"create": "a"}])", 1);
  } catch (const migrate::util::CommandError& e) {
    threw = true;
    assert(e.Index() == 1);
    assert(e.Cause() == ErrorCode::AlreadyExists);
    assert(e.Outcome() == RunOutcome::kPartiallyApplied);
  }
  assert(threw);
  assert((f.versions.Current() == VersionRecord{1, true}));
}

void TestCancelledBeforeStartChangesNothing() {
  Fixture          f(false);
  std::stop_source stop;
  stop.request_stop();

  bool threw = false;
  try {
    f.Run(R"([{"create": "a"}])", 1, RunOptions{.stop_token = stop.get_token()});
  } catch (const migrate::util::Cancelled& e) {
    threw = e.Outcome() == RunOutcome::kNotStarted;
  }
  assert(threw);
  assert(!f.server->HasCollection("app", "a"));
  assert(f.versions.Current().version == kNilVersion);
}

void TestCancelledMidRunIsPartial() {
  Fixture          f(false);
  std::stop_source stop;
  f.server->SetCommandHook([&stop](const std::string&, bsoncxx::document::view command) {
    if (command["create"] && command["create"].get_string().value == "first") {
      stop.request_stop();
    }
  });

  bool threw = false;
  try {
    f.Run(R"([{"create": "first"}, {"create": "second"}])", 1, RunOptions{.stop_token = stop.get_token()});
  } catch (const migrate::util::Cancelled& e) {
    threw = e.Outcome() == RunOutcome::kPartiallyApplied;
  }
  assert(threw);
  assert(f.server->HasCollection("app", "first"));
  assert(!f.server->HasCollection("app", "second"));
  assert((f.versions.Current() == VersionRecord{1, true}));
  assert(f.server->CountDocuments("app", kLockCollection) == 0);
}

void TestCancelledInsideTransactionAborts() {
  Fixture f(true);
  f.Run(kSetupScript, 1);

  std::stop_source stop;
  f.server->SetCommandHook([&stop](const std::string&, bsoncxx::document::view command) {
    if (command["insert"] && command["insert"].get_string().value == "hello") {
      stop.request_stop();
    }
  });

  bool threw = false;
  try {
    f.Run(R"([{"insert": "hello", "documents": [{"wild": "dog"}]}, {"insert": "hello", "documents": [{"wild": "fox"}]}])", 2,
          RunOptions{.stop_token = stop.get_token()});
  } catch (const migrate::util::Cancelled& e) {
    threw = e.Outcome() == RunOutcome::kAborted;
  }
  assert(threw);
  assert(f.server->CountDocuments("app", "hello") == 3);
  assert((f.versions.Current() == VersionRecord{1, false}));
}

void TestDeadlineIsForwardedAsMaxTime() {
  Fixture                  f(false);
  std::vector<std::string> with_max_time;
  f.server->SetCommandHook([&with_max_time](const std::string&, bsoncxx::document::view command) {
    if (auto max_time = command["maxTimeMS"]) {
      assert(max_time.get_int64().value > 0);
      with_max_time.emplace_back(command.begin()->key());
    }
  });

  f.Run(R"([{"create": "a"}, {"insert": "a", "documents": [{}]}])", 1, RunOptions{.timeout = std::chrono::minutes(1)});
  assert((with_max_time == std::vector<std::string>{"create", "insert"}));
}

void TestLockHeldElsewhereStopsRun() {
  auto    server = std::make_shared<MemoryServer>();
  Fixture holder(false, server);
  Fixture runner(false, server);

  holder.lock.Acquire();
  bool threw = false;
  try {
    runner.Run(R"([{"create": "a"}])", 1);
  } catch (const migrate::util::LockHeld&) {
    threw = true;
  }
  assert(threw);
  assert(!server->HasCollection("app", "a"));

  // the holder runs under its own lock and keeps it
  holder.Run(R"([{"create": "a"}])", 1);
  assert(holder.lock.Held());
  holder.lock.Release();
  runner.Run(R"([{"create": "b"}])", 2);
}

void TestRunLongerThanLeaseKeepsLock() {
  for (bool transaction_mode : {false, true}) {
    auto    server = std::make_shared<MemoryServer>();
    Fixture runner(transaction_mode, server, std::chrono::seconds(1));
    Fixture rival(transaction_mode, server, std::chrono::seconds(1));
    runner.Run(R"([{"create": "slow"}])", 1);

    std::atomic<bool> armed{true};
    bool              rival_blocked = false;
    server->SetCommandHook([&](const std::string&, bsoncxx::document::view command) {
      if (!command["insert"] || command["insert"].get_string().value != "slow" || !armed.exchange(false)) {
        return;
      }
      // a command that outlasts the lease
      std::this_thread::sleep_for(std::chrono::milliseconds(2500));
      try {
        rival.lock.Acquire();
      } catch (const migrate::util::LockHeld&) {
        rival_blocked = true;
      }
    });

    runner.Run(R"([{"insert": "slow", "documents": [{"n": 1}]}, {"insert": "slow", "documents": [{"n": 2}]}])", 2);
    server->SetCommandHook(nullptr);

    assert(rival_blocked);
    assert(!rival.lock.Held());
    assert((runner.versions.Current() == VersionRecord{2, false}));
    assert(server->CountDocuments("app", "slow") == 2);
    assert(server->CountDocuments("app", kLockCollection) == 0);
  }
}

void TestLostLockStopsRun() {
  auto    server = std::make_shared<MemoryServer>();
  Fixture f(false, server);

  // the record vanishes mid run; the next renewal notices
  server->SetCommandHook([&](const std::string&, bsoncxx::document::view command) {
    if (command["create"] && command["create"].get_string().value == "first") {
      server->SetCommandHook(nullptr);
      f.database->RunCommand(bsoncxx::from_json(R"({"delete": "migrate_advisory_lock", "deletes": [{"q": {}, "limit": 0}]})").view());
      assert(!f.lock.Renew());
    }
  });

  bool threw = false;
  try {
    f.Run(R"([{"create": "first"}, {"create": "second"}])", 1);
  } catch (const migrate::util::LockHeld&) {
    threw = true;
  }
  assert(threw);
  assert(!f.server->HasCollection("app", "second"));
  assert((f.versions.Current() == VersionRecord{1, true}));
}

void TestRunStateTransitions() {
  using migrate::model::CanTransition;
  assert(CanTransition(RunState::kIdle, RunState::kLockAcquired));
  assert(!CanTransition(RunState::kIdle, RunState::kExecuting));
  assert(CanTransition(RunState::kLockAcquired, RunState::kLockReleased));
  assert(CanTransition(RunState::kExecuting, RunState::kAborted));
  assert(!CanTransition(RunState::kExecuting, RunState::kLockReleased));
  assert(CanTransition(RunState::kPartiallyApplied, RunState::kLockReleased));
  assert(!CanTransition(RunState::kLockReleased, RunState::kIdle));
}

} // namespace

int main() {
  TestDirectRunRecordsVersion();
  TestRunWithoutTargetKeepsVersion();
  TestEmptyScriptStillSetsVersion();
  TestDirectFailureLeavesDirtyPartialState();
  TestDirtyVersionBlocksRun();
  TestTransactionalFailureIsAtomic();
  TestTransactionalSuccessCommitsVersionWithData();
  TestStructuralAfterDataIsRejectedUpFront();
  TestStructuralPrefixFailureMarksDirty();
  TestCancelledBeforeStartChangesNothing();
  TestCancelledMidRunIsPartial();
  TestCancelledInsideTransactionAborts();
  TestDeadlineIsForwardedAsMaxTime();
  TestLockHeldElsewhereStopsRun();
  TestRunLongerThanLeaseKeepsLock();
  TestLostLockStopsRun();
  TestRunStateTransitions();

  std::cout << "migrate_unit_execution_engine: pass\n";
  return 0;
}
