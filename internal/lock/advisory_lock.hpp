#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "internal/db/api/database.hpp"

namespace migrate::lock {

struct LockOptions {
  bool                 enabled = true;
  std::string          collection;
  std::chrono::seconds lease{15};
};

/*
  Database-resident mutual exclusion between cooperating migrators.

  The lock is a singleton record {locking_key: 0, owner, pid, hostname,
  created_at, expires_at} guarded by the unique index lock_unique_key.
  Acquire() inserts it once and fails with util::LockHeld on a duplicate
  key; a record whose expires_at has passed is reclaimed first. No retries.

  While held, a heartbeat thread pushes expires_at forward every lease/3, so
  only a holder that stopped running can be reclaimed. Renewal and release
  match on the owner token: a holder never touches a record it does not own.
  If the record disappears or changes owner, Lost() turns true.

  The database handle must tolerate use from the heartbeat thread.

  With enabled = false both operations are no-ops.
*/
class AdvisoryLock {
 public:
  static constexpr const char* kIndexName = "lock_unique_key";

  AdvisoryLock(db::Database& database, LockOptions options);
  ~AdvisoryLock();

  AdvisoryLock(const AdvisoryLock&)            = delete;
  AdvisoryLock& operator=(const AdvisoryLock&) = delete;

  void Acquire();

  // Deletes this holder's record. Releasing a lock not held is a no-op.
  void Release();

  // Extends the lease. Returns false when the record is no longer ours.
  bool Renew();

  bool Held() const {
    return held_;
  }

  bool Lost() const {
    return lost_.load();
  }

  const std::string& Owner() const {
    return owner_;
  }

  const LockOptions& Options() const {
    return options_;
  }

 private:
  void        EnsureIndex();
  void        ReclaimStale();
  std::string DescribeHolder();

  void StartHeartbeat();
  void StopHeartbeat();
  void Heartbeat();

  db::Database&     database_;
  LockOptions       options_;
  bool              held_ = false;
  std::string       owner_;
  std::atomic<bool> lost_{false};

  std::mutex              heartbeat_mutex_;
  std::condition_variable heartbeat_cv_;
  bool                    stopping_ = false;
  std::thread             heartbeat_;
};

} // namespace migrate::lock
