#include "internal/db/mongo/mongo_error.hpp"

#include <mongocxx/exception/logic_error.hpp>
#include <mongocxx/exception/operation_exception.hpp>

namespace migrate::db::mongo {

namespace {

// libmongoc client error codes (mongoc-error.h).
constexpr int kStreamFirst              = 1;
constexpr int kStreamLast               = 10;
constexpr int kClientAuthenticate       = 11;
constexpr int kClientNoAcceptablePeer   = 12;
constexpr int kServerSelectionFailure   = 13053;

} // namespace

ErrorCode FromClientCode(int client_code) {
  if (client_code >= kStreamFirst && client_code <= kStreamLast) {
    return ErrorCode::IOError;
  }
  switch (client_code) {
    case kClientAuthenticate:
      return ErrorCode::Unauthenticated;
    case kClientNoAcceptablePeer:
    case kServerSelectionFailure:
      return ErrorCode::IOError;
    default:
      return ErrorCode::InternalError;
  }
}

DatabaseException Translate(const mongocxx::exception& e) {
  if (dynamic_cast<const mongocxx::logic_error*>(&e) != nullptr) {
    return DatabaseException(ErrorCode::InvalidArgument, e.what(), e.code().value());
  }

  if (const auto* op = dynamic_cast<const mongocxx::operation_exception*>(&e)) {
    if (const auto& raw = op->raw_server_error()) {
      auto view = raw->view();
      if (view["code"] || view["writeErrors"] || view["writeConcernError"]) {
        auto result = InspectReply(view);
        if (!result) {
          return DatabaseException(result.code, e.what(), result.server_code);
        }
      }
    }
  }

  return DatabaseException(FromClientCode(e.code().value()), e.what(), e.code().value());
}

} // namespace migrate::db::mongo
