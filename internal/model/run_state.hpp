#pragma once

#include <cstdint>
#include <string_view>

namespace migrate::model {

/*
  Lifecycle of a single migration run.

    Idle -> LockAcquired -> Executing -> {Committed | Aborted | PartiallyApplied} -> LockReleased

  Aborted is only reachable in transactional mode, PartiallyApplied only when
  effects landed outside a transaction.
*/
enum class RunState : std::uint8_t {
  kIdle             = 0,
  kLockAcquired     = 1,
  kExecuting        = 2,
  kCommitted        = 3,
  kAborted          = 4,
  kPartiallyApplied = 5,
  kLockReleased     = 6,
};

/*
  What a failed run left behind. Callers use this to tell "nothing happened"
  apart from "state is now dirty".
*/
enum class RunOutcome : std::uint8_t {
  kNotStarted       = 0,
  kAborted          = 1,
  kPartiallyApplied = 2,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kCommitted || state == RunState::kAborted || state == RunState::kPartiallyApplied;
}

constexpr bool CanTransition(RunState from, RunState to) {
  switch (from) {
    case RunState::kIdle:
      return to == RunState::kLockAcquired;
    case RunState::kLockAcquired:
      return to == RunState::kExecuting || to == RunState::kLockReleased;
    case RunState::kExecuting:
      return IsTerminal(to);
    case RunState::kCommitted:
    case RunState::kAborted:
    case RunState::kPartiallyApplied:
      return to == RunState::kLockReleased;
    case RunState::kLockReleased:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(RunState state) {
  switch (state) {
    case RunState::kIdle:
      return "idle";
    case RunState::kLockAcquired:
      return "lock_acquired";
    case RunState::kExecuting:
      return "executing";
    case RunState::kCommitted:
      return "committed";
    case RunState::kAborted:
      return "aborted";
    case RunState::kPartiallyApplied:
      return "partially_applied";
    case RunState::kLockReleased:
      return "lock_released";
  }
  return "unknown";
}

constexpr std::string_view ToString(RunOutcome outcome) {
  switch (outcome) {
    case RunOutcome::kNotStarted:
      return "not_started";
    case RunOutcome::kAborted:
      return "aborted";
    case RunOutcome::kPartiallyApplied:
      return "partially_applied";
  }
  return "unknown";
}

} // namespace migrate::model
