#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>

#include "internal/codec/command.hpp"
#include "internal/db/api/database.hpp"
#include "internal/lock/advisory_lock.hpp"
#include "internal/model/run_state.hpp"
#include "internal/version/version_store.hpp"

namespace migrate::engine {

struct RunOptions {
  // Checked before every command.
  std::stop_token stop_token;

  // Whole-run deadline; zero means none. The remaining time is sent with
  // every command as maxTimeMS.
  std::chrono::milliseconds timeout{0};
};

/*
  Executes one decoded script.

  Non-transactional (default):
    version -> {target or current, dirty}, commands in order,
    version -> {target or current, clean}
    A failure at command i leaves the record dirty and throws
    CommandError{i, PartiallyApplied}.

  Transactional:
    leading structural commands outside any transaction, then every data
    command and the version update in one transaction. A failure aborts it
    and leaves the record unchanged (CommandError{Aborted}).

  The advisory lock is held for the whole run unless the caller already
  holds it. Its heartbeat keeps the lease alive; a run whose lock was lost
  stops before the next command with util::LockHeld.
*/
class ExecutionEngine {
 public:
  ExecutionEngine(db::Database& database, version::VersionStore& versions, lock::AdvisoryLock& lock, bool transaction_mode);

  void Run(const codec::Script& script, std::optional<std::int64_t> target, const RunOptions& options = {});

  model::RunState State() const {
    return state_;
  }

 private:
  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  void RunDirect(const codec::Script& script, std::optional<std::int64_t> target, const version::VersionRecord& current,
                 const RunOptions& options, Deadline deadline);
  void RunTransactional(const codec::Script& script, std::optional<std::int64_t> target, const version::VersionRecord& current,
                        const RunOptions& options, Deadline deadline);

  // Sends one script command; failures become MigrateErrors carrying `outcome`.
  void Dispatch(const codec::Command& command, std::size_t index, model::RunOutcome outcome, Deadline deadline, db::Session* session);

  void Transition(model::RunState to);
  void ReleaseAfterFailure(bool acquired);

  db::Database&          database_;
  version::VersionStore& versions_;
  lock::AdvisoryLock&    lock_;
  bool                   transaction_mode_;
  model::RunState        state_ = model::RunState::kIdle;
};

// Throws util::MalformedScript when a structural command follows a data
// command; transactional runs need the structural ones up front.
void RequireStructuralPrefix(const codec::Script& script);

} // namespace migrate::engine
