#pragma once

#include <bsoncxx/document/view.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace migrate::db {

/*
  Portable DB result codes.

  Backends translate their native errors (mongocxx exceptions, reply
  documents, in-memory store failures) into these. Upper layers never
  depend on driver error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  ConstraintViolation,
  InvalidArgument,

  Unauthenticated,
  Unauthorized,

  IOError,
  Timeout,

  Unsupported,
  InternalError
};

std::string_view ToString(ErrorCode code);

// Maps a server error code (the "code" field of a reply) to a portable code.
ErrorCode FromServerCode(std::int32_t server_code);

struct Result {
  ErrorCode    code        = ErrorCode::OK;
  std::int32_t server_code = 0;
  std::string  message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}, std::int32_t server = 0) {
    return {c, server, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Thrown by Database / Session implementations.
*/
class DatabaseException : public std::runtime_error {
 public:
  DatabaseException(ErrorCode code, const std::string& message, std::int32_t server_code = 0)
      : std::runtime_error(message), code_(code), server_code_(server_code) {
  }

  explicit DatabaseException(const Result& result)
      : DatabaseException(result.code, result.message, result.server_code) {
  }

  ErrorCode Code() const {
    return code_;
  }

  std::int32_t ServerCode() const {
    return server_code_;
  }

 private:
  ErrorCode    code_;
  std::int32_t server_code_;
};

/*
  Inspects a command reply.

  ok:0, writeErrors and writeConcernError all count as failures; write
  commands report per-document failures with ok:1.
*/
Result InspectReply(bsoncxx::document::view reply);

inline void ThrowIfError(const Result& result) {
  if (!result) {
    throw DatabaseException(result);
  }
}

// Reply accessors. A reply of the wrong shape throws DatabaseException
// (InternalError) instead of a bsoncxx type error.

// "n" of a write reply; 0 when absent.
std::int64_t ReplyCount(bsoncxx::document::view reply);

// First document of cursor.firstBatch; nullopt for an empty batch.
std::optional<bsoncxx::document::view> FirstBatchDocument(bsoncxx::document::view reply);

} // namespace migrate::db
