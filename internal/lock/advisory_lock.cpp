#include "internal/lock/advisory_lock.hpp"

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/oid.hpp>
#include <bsoncxx/types.hpp>

#include <unistd.h>

#include <algorithm>
#include <climits>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace migrate::lock {

namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_array;
using bsoncxx::builder::basic::make_document;

constexpr std::int32_t kLockingKey = 0;

constexpr std::chrono::milliseconds kMinHeartbeat{100};

std::string Hostname() {
  char buffer[HOST_NAME_MAX + 1] = {};
  if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

bsoncxx::document::value OwnedRecord(const std::string& owner) {
  return make_document(kvp("locking_key", kLockingKey), kvp("owner", owner));
}

} // namespace

AdvisoryLock::AdvisoryLock(db::Database& database, LockOptions options) : database_(database), options_(std::move(options)) {
}

AdvisoryLock::~AdvisoryLock() {
  // the record is left to Release() or to lease expiry
  StopHeartbeat();
}

void AdvisoryLock::EnsureIndex() {
  database_.RunCommand(make_document(
      kvp("createIndexes", options_.collection),
      kvp("indexes", make_array(make_document(kvp("key", make_document(kvp("locking_key", 1))), kvp("name", kIndexName), kvp("unique", true))))));
}

void AdvisoryLock::ReclaimStale() {
  auto reply = database_.RunCommand(make_document(
      kvp("delete", options_.collection),
      kvp("deletes", make_array(make_document(
                         kvp("q", make_document(kvp("locking_key", kLockingKey), kvp("expires_at", make_document(kvp("$lt", util::ToBsonDate(util::Now())))))),
                         kvp("limit", 1))))));
  if (db::ReplyCount(reply.view()) > 0) {
    MIGRATE_LOG_WARN("reclaimed expired advisory lock", {observability::StringField("collection", options_.collection)});
  }
}

std::string AdvisoryLock::DescribeHolder() {
  try {
    auto reply = database_.RunCommand(
        make_document(kvp("find", options_.collection), kvp("filter", make_document(kvp("locking_key", kLockingKey))), kvp("limit", 1),
                      kvp("singleBatch", true)));
    auto holder = db::FirstBatchDocument(reply.view());
    if (!holder) {
      return {};
    }
    std::string out;
    if (auto host = (*holder)["hostname"]; host && host.type() == bsoncxx::type::k_string) {
      out += " by " + std::string(host.get_string().value);
    }
    if (auto pid = (*holder)["pid"]; pid && pid.type() == bsoncxx::type::k_int32) {
      out += " (pid " + std::to_string(pid.get_int32().value) + ")";
    }
    return out;
  } catch (const db::DatabaseException& e) {
    // the holder is only used in the message
    MIGRATE_LOG_DEBUG("advisory lock holder lookup failed", {observability::StringField("error", e.what())});
    return {};
  }
}

void AdvisoryLock::Acquire() {
  if (!options_.enabled) {
    held_ = true;
    return;
  }

  const auto now   = util::Now();
  auto       owner = bsoncxx::oid{}.to_string();
  try {
    EnsureIndex();
    ReclaimStale();
    database_.RunCommand(make_document(kvp("insert", options_.collection),
                                       kvp("documents", make_array(make_document(kvp("locking_key", kLockingKey),
                                                                                 kvp("owner", owner),
                                                                                 kvp("pid", static_cast<std::int32_t>(::getpid())),
                                                                                 kvp("hostname", Hostname()),
                                                                                 kvp("created_at", util::ToBsonDate(now)),
                                                                                 kvp("expires_at", util::ToBsonDate(now + options_.lease)))))));
  } catch (const db::DatabaseException& e) {
    if (e.Code() == db::ErrorCode::ConstraintViolation) {
      throw util::LockHeld("advisory lock is already held" + DescribeHolder());
    }
    util::RethrowAsMigrateError(e, "acquire advisory lock");
  }

  owner_ = std::move(owner);
  held_  = true;
  lost_  = false;
  StartHeartbeat();
  MIGRATE_LOG_DEBUG("advisory lock acquired", {observability::StringField("collection", options_.collection),
                                               observability::StringField("owner", owner_)});
}

bool AdvisoryLock::Renew() {
  if (!options_.enabled || !held_) {
    return held_;
  }

  try {
    auto reply = database_.RunCommand(make_document(
        kvp("update", options_.collection),
        kvp("updates",
            make_array(make_document(
                kvp("q", OwnedRecord(owner_)),
                kvp("u", make_document(kvp("$set", make_document(kvp("expires_at", util::ToBsonDate(util::Now() + options_.lease)))))))))));
    if (db::ReplyCount(reply.view()) == 0) {
      lost_ = true;
      return false;
    }
  } catch (const db::DatabaseException& e) {
    util::RethrowAsMigrateError(e, "renew advisory lock");
  }
  return true;
}

void AdvisoryLock::Release() {
  if (!options_.enabled) {
    held_ = false;
    return;
  }

  StopHeartbeat();
  if (!held_) {
    return;
  }

  try {
    auto reply = database_.RunCommand(make_document(kvp("delete", options_.collection),
                                                    kvp("deletes", make_array(make_document(kvp("q", OwnedRecord(owner_)), kvp("limit", 1))))));
    if (db::ReplyCount(reply.view()) == 0) {
      MIGRATE_LOG_WARN("advisory lock record was gone on release", {observability::StringField("owner", owner_)});
    }
  } catch (const db::DatabaseException& e) {
    // keep held_: the heartbeat is stopped, so the lease runs out
    util::RethrowAsMigrateError(e, "release advisory lock");
  }

  held_ = false;
  lost_ = false;
  owner_.clear();
  MIGRATE_LOG_DEBUG("advisory lock released", {observability::StringField("collection", options_.collection)});
}

void AdvisoryLock::StartHeartbeat() {
  StopHeartbeat();
  {
    std::lock_guard lock(heartbeat_mutex_);
    stopping_ = false;
  }
  heartbeat_ = std::thread([this] { Heartbeat(); });
}

void AdvisoryLock::StopHeartbeat() {
  {
    std::lock_guard lock(heartbeat_mutex_);
    stopping_ = true;
  }
  heartbeat_cv_.notify_all();
  if (heartbeat_.joinable()) {
    heartbeat_.join();
  }
}

void AdvisoryLock::Heartbeat() {
  const auto interval = std::max<std::chrono::milliseconds>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.lease) / 3, kMinHeartbeat);

  std::unique_lock lock(heartbeat_mutex_);
  while (!heartbeat_cv_.wait_for(lock, interval, [&] { return stopping_; })) {
    lock.unlock();
    try {
      if (!Renew()) {
        MIGRATE_LOG_ERROR("advisory lock lost", {observability::StringField("collection", options_.collection),
                                                 observability::StringField("owner", owner_)});
        return;
      }
    } catch (const util::MigrateError& e) {
      // retried on the next beat; the lease covers two missed beats
      MIGRATE_LOG_WARN("advisory lock renewal failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace migrate::lock
