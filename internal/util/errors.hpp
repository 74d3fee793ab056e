#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/run_state.hpp"

namespace migrate::util {

/*
  Central error types.

  Everything the driver throws derives from MigrateError. Backend failures
  arrive as db::DatabaseException and are translated at the component
  boundary (see Classify* in internal/util/errors.cpp).
*/

class MigrateError : public std::runtime_error {
 public:
  explicit MigrateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public MigrateError {
 public:
  explicit ConfigError(const std::string& msg) : MigrateError("config: " + msg) {
  }
};

class ConnectionError : public MigrateError {
 public:
  explicit ConnectionError(const std::string& msg) : MigrateError("connection: " + msg) {
  }
};

class AuthenticationError : public MigrateError {
 public:
  explicit AuthenticationError(const std::string& msg) : MigrateError("authentication: " + msg) {
  }
};

class LockHeld : public MigrateError {
 public:
  explicit LockHeld(const std::string& msg) : MigrateError(msg) {
  }
};

class MalformedScript : public MigrateError {
 public:
  explicit MalformedScript(const std::string& msg) : MigrateError("malformed migration script: " + msg) {
  }
};

class DirtyVersion : public MigrateError {
 public:
  explicit DirtyVersion(std::int64_t version)
      : MigrateError("database is dirty at version " + std::to_string(version) + "; fix and force version"), version_(version) {
  }

  std::int64_t Version() const {
    return version_;
  }

 private:
  std::int64_t version_;
};

class CommandError : public MigrateError {
 public:
  CommandError(std::size_t index, std::string command, db::ErrorCode cause, model::RunOutcome outcome, const std::string& msg);

  std::size_t Index() const {
    return index_;
  }
  const std::string& Command() const {
    return command_;
  }
  db::ErrorCode Cause() const {
    return cause_;
  }
  model::RunOutcome Outcome() const {
    return outcome_;
  }

 private:
  std::size_t       index_;
  std::string       command_;
  db::ErrorCode     cause_;
  model::RunOutcome outcome_;
};

class Cancelled : public MigrateError {
 public:
  Cancelled(model::RunOutcome outcome, const std::string& msg)
      : MigrateError(msg + " (" + std::string(model::ToString(outcome)) + ")"), outcome_(outcome) {
  }

  model::RunOutcome Outcome() const {
    return outcome_;
  }

 private:
  model::RunOutcome outcome_;
};

class DropError : public MigrateError {
 public:
  DropError(std::vector<std::string> dropped, std::vector<std::string> failed, const std::string& msg);

  const std::vector<std::string>& Dropped() const {
    return dropped_;
  }
  const std::vector<std::string>& Failed() const {
    return failed_;
  }

 private:
  std::vector<std::string> dropped_;
  std::vector<std::string> failed_;
};

class DatabaseError : public MigrateError {
 public:
  DatabaseError(db::ErrorCode cause, const std::string& msg)
      : MigrateError("database: " + msg), cause_(cause) {
  }

  db::ErrorCode Cause() const {
    return cause_;
  }

 private:
  db::ErrorCode cause_;
};

// Rethrows a backend failure on metadata (version, lock, drop) as the matching
// MigrateError: auth -> AuthenticationError, transport -> ConnectionError,
// anything else -> DatabaseError.
[[noreturn]] void RethrowAsMigrateError(const db::DatabaseException& e, const std::string& context);

} // namespace migrate::util
