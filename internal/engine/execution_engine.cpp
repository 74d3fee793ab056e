#include "internal/engine/execution_engine.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>

#include <algorithm>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace migrate::engine {

namespace {

using bsoncxx::builder::basic::kvp;
using model::RunOutcome;
using model::RunState;
using Clock = std::chrono::steady_clock;

bool Expired(const RunOptions& options, const std::optional<Clock::time_point>& deadline) {
  return options.stop_token.stop_requested() || (deadline && Clock::now() >= *deadline);
}

std::string CancelReason(const RunOptions& options) {
  return options.stop_token.stop_requested() ? "migration cancelled" : "migration deadline exceeded";
}

// The raw command, with the time left on the deadline as maxTimeMS.
bsoncxx::document::value WithDeadline(bsoncxx::document::view command, const std::optional<Clock::time_point>& deadline) {
  if (!deadline || command["maxTimeMS"]) {
    return bsoncxx::document::value{command};
  }
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();

  bsoncxx::builder::basic::document out;
  for (auto&& element : command) {
    out.append(kvp(std::string(element.key()), element.get_value()));
  }
  out.append(kvp("maxTimeMS", static_cast<std::int64_t>(std::max<std::int64_t>(remaining, 1))));
  return out.extract();
}

} // namespace

void RequireStructuralPrefix(const codec::Script& script) {
  bool seen_data = false;
  for (std::size_t i = 0; i < script.size(); ++i) {
    if (!script[i].IsStructural()) {
      seen_data = true;
    } else if (seen_data) {
      throw util::MalformedScript("command " + std::to_string(i) + " (" + script[i].Name() +
                                  ") cannot run inside a transaction; put collection and index changes first");
    }
  }
}

ExecutionEngine::ExecutionEngine(db::Database& database, version::VersionStore& versions, lock::AdvisoryLock& lock, bool transaction_mode)
    : database_(database), versions_(versions), lock_(lock), transaction_mode_(transaction_mode) {
}

void ExecutionEngine::Transition(RunState to) {
  if (!model::CanTransition(state_, to)) {
    throw util::MigrateError("invalid run state transition " + std::string(model::ToString(state_)) + " -> " + std::string(model::ToString(to)));
  }
  state_ = to;
}

void ExecutionEngine::ReleaseAfterFailure(bool acquired) {
  if (!acquired) {
    return;
  }
  try {
    lock_.Release();
  } catch (const util::MigrateError& e) {
    // the run's own error wins; the lease expires the lock eventually
    MIGRATE_LOG_ERROR("advisory lock release failed", {observability::StringField("error", e.what())});
  }
}

void ExecutionEngine::Run(const codec::Script& script, std::optional<std::int64_t> target, const RunOptions& options) {
  observability::SpanScope span("migrate.run");
  span.SetAttribute("commands", static_cast<std::int64_t>(script.size()));
  span.SetAttribute("transactional", static_cast<std::int64_t>(transaction_mode_ ? 1 : 0));
  if (target) {
    span.SetAttribute("target_version", *target);
  }

  state_ = RunState::kIdle;
  if (transaction_mode_) {
    RequireStructuralPrefix(script);
  }

  Deadline deadline;
  if (options.timeout.count() > 0) {
    deadline = Clock::now() + options.timeout;
  }
  if (Expired(options, deadline)) {
    throw util::Cancelled(RunOutcome::kNotStarted, CancelReason(options));
  }

  const bool acquired = !lock_.Held();
  if (acquired) {
    lock_.Acquire();
  }
  Transition(RunState::kLockAcquired);

  try {
    const auto current = versions_.Current();
    if (current.dirty) {
      throw util::DirtyVersion(current.version);
    }

    Transition(RunState::kExecuting);
    MIGRATE_LOG_INFO("migration started", {observability::IntField("commands", static_cast<std::int64_t>(script.size())),
                                           observability::IntField("current_version", current.version),
                                           observability::IntField("target_version", target.value_or(current.version)),
                                           observability::BoolField("transactional", transaction_mode_)});
    if (transaction_mode_) {
      RunTransactional(script, target, current, options, deadline);
    } else {
      RunDirect(script, target, current, options, deadline);
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    MIGRATE_LOG_ERROR("migration failed", {observability::StringField("state", model::ToString(state_)),
                                           observability::StringField("error", e.what())});
    ReleaseAfterFailure(acquired);
    state_ = RunState::kLockReleased;
    throw;
  }

  if (acquired) {
    lock_.Release();
  }
  Transition(RunState::kLockReleased);
  MIGRATE_LOG_INFO("migration finished", {observability::IntField("commands", static_cast<std::int64_t>(script.size()))});
}

void ExecutionEngine::Dispatch(const codec::Command& command, std::size_t index, RunOutcome outcome, Deadline deadline, db::Session* session) {
  if (lock_.Lost()) {
    throw util::LockHeld("advisory lock was lost before command " + std::to_string(index) + " (" + command.Name() + ")");
  }
  try {
    database_.RunCommand(WithDeadline(command.Document(), deadline).view(), session);
  } catch (const db::DatabaseException& e) {
    switch (e.Code()) {
      case db::ErrorCode::Unauthenticated:
        throw util::AuthenticationError(e.what());
      case db::ErrorCode::IOError:
        throw util::ConnectionError("command " + std::to_string(index) + " (" + command.Name() + "): " + e.what());
      default:
        throw util::CommandError(index, command.Name(), e.Code(), outcome, e.what());
    }
  }
}

void ExecutionEngine::RunDirect(const codec::Script& script, std::optional<std::int64_t> target, const version::VersionRecord& current,
                                const RunOptions& options, Deadline deadline) {
  const auto version = target.value_or(current.version);

  // Marked dirty before the first command: a crash mid-script must block
  // the next run.
  versions_.Set(version, true);

  for (std::size_t i = 0; i < script.size(); ++i) {
    if (Expired(options, deadline)) {
      if (i == 0) {
        versions_.Set(current.version, current.dirty);
        Transition(RunState::kAborted);
        throw util::Cancelled(RunOutcome::kNotStarted, CancelReason(options));
      }
      Transition(RunState::kPartiallyApplied);
      throw util::Cancelled(RunOutcome::kPartiallyApplied, CancelReason(options) + " after " + std::to_string(i) + " commands");
    }

    try {
      Dispatch(script[i], i, RunOutcome::kPartiallyApplied, deadline, nullptr);
    } catch (const util::MigrateError&) {
      Transition(RunState::kPartiallyApplied);
      throw;
    }
  }

  versions_.Set(version, false);
  Transition(RunState::kCommitted);
}

void ExecutionEngine::RunTransactional(const codec::Script& script, std::optional<std::int64_t> target, const version::VersionRecord& current,
                                       const RunOptions& options, Deadline deadline) {
  const auto prefix = static_cast<std::size_t>(
      std::find_if(script.begin(), script.end(), [](const codec::Command& command) { return !command.IsStructural(); }) - script.begin());

  // Structural commands cannot join the transaction. Once one has applied,
  // a failure leaves effects behind and the record is marked dirty.
  for (std::size_t i = 0; i < prefix; ++i) {
    const auto outcome = i == 0 ? RunOutcome::kNotStarted : RunOutcome::kPartiallyApplied;
    if (Expired(options, deadline)) {
      if (i > 0) {
        versions_.Set(target.value_or(current.version), true);
        Transition(RunState::kPartiallyApplied);
      } else {
        Transition(RunState::kAborted);
      }
      throw util::Cancelled(outcome, CancelReason(options));
    }
    try {
      Dispatch(script[i], i, outcome, deadline, nullptr);
    } catch (const util::MigrateError&) {
      if (i > 0) {
        versions_.Set(target.value_or(current.version), true);
        Transition(RunState::kPartiallyApplied);
      } else {
        Transition(RunState::kAborted);
      }
      throw;
    }
  }

  if (prefix == script.size() && !target) {
    Transition(RunState::kCommitted);
    return;
  }
  if (target) {
    versions_.Ensure();
  }

  auto                 session = database_.StartSession();
  db::TransactionScope transaction(*session);

  auto abort = [&]() {
    try {
      transaction.Abort();
    } catch (const db::DatabaseException& e) {
      // the server has usually aborted already
      MIGRATE_LOG_WARN("abort transaction failed", {observability::StringField("error", e.what())});
    }
    Transition(RunState::kAborted);
  };

  for (std::size_t i = prefix; i < script.size(); ++i) {
    if (Expired(options, deadline)) {
      abort();
      throw util::Cancelled(RunOutcome::kAborted, CancelReason(options));
    }
    try {
      Dispatch(script[i], i, RunOutcome::kAborted, deadline, session.get());
    } catch (const util::MigrateError&) {
      abort();
      throw;
    }
  }

  if (target) {
    try {
      versions_.Set(*target, false, session.get());
    } catch (const util::DatabaseError& e) {
      abort();
      throw util::CommandError(script.size(), "version update", e.Cause(), RunOutcome::kAborted, e.what());
    }
  }

  try {
    transaction.Commit();
  } catch (const db::DatabaseException& e) {
    Transition(RunState::kAborted);
    if (e.Code() == db::ErrorCode::Unauthenticated) {
      throw util::AuthenticationError(e.what());
    }
    throw util::CommandError(script.size(), "commitTransaction", e.Code(), RunOutcome::kAborted, e.what());
  }
  Transition(RunState::kCommitted);
}

} // namespace migrate::engine
