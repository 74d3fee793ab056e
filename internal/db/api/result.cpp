#include "internal/db/api/result.hpp"

#include <bsoncxx/array/view.hpp>
#include <bsoncxx/types.hpp>

namespace migrate::db {

namespace {

// Server error codes the driver cares about.
constexpr std::int32_t kBadValue                          = 2;
constexpr std::int32_t kFailedToParse                     = 9;
constexpr std::int32_t kUserNotFound                      = 11;
constexpr std::int32_t kUnauthorized                      = 13;
constexpr std::int32_t kTypeMismatch                      = 14;
constexpr std::int32_t kAuthenticationFailed              = 18;
constexpr std::int32_t kIllegalOperation                  = 20;
constexpr std::int32_t kNamespaceNotFound                 = 26;
constexpr std::int32_t kIndexNotFound                     = 27;
constexpr std::int32_t kNamespaceExists                   = 48;
constexpr std::int32_t kMaxTimeMSExpired                  = 50;
constexpr std::int32_t kCommandNotFound                   = 59;
constexpr std::int32_t kIndexOptionsConflict              = 85;
constexpr std::int32_t kIndexKeySpecsConflict             = 86;
constexpr std::int32_t kNetworkTimeout                    = 89;
constexpr std::int32_t kWriteConflict                     = 112;
constexpr std::int32_t kNoSuchTransaction                 = 251;
constexpr std::int32_t kOperationNotSupportedInTransaction = 263;
constexpr std::int32_t kDuplicateKey                      = 11000;
constexpr std::int32_t kDuplicateKeyLegacy                = 11001;
constexpr std::int32_t kHostUnreachable                   = 6;
constexpr std::int32_t kHostNotFound                      = 7;
constexpr std::int32_t kSocketException                   = 9001;

std::int32_t ElementAsInt(const bsoncxx::document::element& element) {
  switch (element.type()) {
    case bsoncxx::type::k_int32:
      return element.get_int32().value;
    case bsoncxx::type::k_int64:
      return static_cast<std::int32_t>(element.get_int64().value);
    case bsoncxx::type::k_double:
      return static_cast<std::int32_t>(element.get_double().value);
    default:
      return 0;
  }
}

std::string ElementAsString(const bsoncxx::document::element& element) {
  if (element && element.type() == bsoncxx::type::k_string) {
    return std::string(element.get_string().value);
  }
  return {};
}

bool IsOk(const bsoncxx::document::element& ok) {
  switch (ok.type()) {
    case bsoncxx::type::k_double:
      return ok.get_double().value == 1.0;
    case bsoncxx::type::k_int32:
      return ok.get_int32().value == 1;
    case bsoncxx::type::k_int64:
      return ok.get_int64().value == 1;
    case bsoncxx::type::k_bool:
      return ok.get_bool().value;
    default:
      return false;
  }
}

Result FromErrorDocument(bsoncxx::document::view error, const std::string& prefix) {
  std::int32_t code = 0;
  if (auto element = error["code"]) {
    code = ElementAsInt(element);
  }
  auto message = ElementAsString(error["errmsg"]);
  if (message.empty()) {
    message = "server error";
  }
  return Result::Err(FromServerCode(code), prefix + message, code);
}

} // namespace

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Unauthenticated:
      return "unauthenticated";
    case ErrorCode::Unauthorized:
      return "unauthorized";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

ErrorCode FromServerCode(std::int32_t server_code) {
  switch (server_code) {
    case kDuplicateKey:
    case kDuplicateKeyLegacy:
      return ErrorCode::ConstraintViolation;
    case kUserNotFound:
    case kAuthenticationFailed:
      return ErrorCode::Unauthenticated;
    case kUnauthorized:
      return ErrorCode::Unauthorized;
    case kNamespaceNotFound:
    case kIndexNotFound:
      return ErrorCode::NotFound;
    case kNamespaceExists:
      return ErrorCode::AlreadyExists;
    case kIndexOptionsConflict:
    case kIndexKeySpecsConflict:
    case kWriteConflict:
    case kNoSuchTransaction:
      return ErrorCode::Conflict;
    case kBadValue:
    case kFailedToParse:
    case kTypeMismatch:
      return ErrorCode::InvalidArgument;
    case kMaxTimeMSExpired:
    case kNetworkTimeout:
      return ErrorCode::Timeout;
    case kHostUnreachable:
    case kHostNotFound:
    case kSocketException:
      return ErrorCode::IOError;
    case kCommandNotFound:
    case kIllegalOperation:
    case kOperationNotSupportedInTransaction:
      return ErrorCode::Unsupported;
    default:
      return ErrorCode::InternalError;
  }
}

Result InspectReply(bsoncxx::document::view reply) {
  auto ok = reply["ok"];
  if (ok && !IsOk(ok)) {
    return FromErrorDocument(reply, "");
  }

  if (auto write_errors = reply["writeErrors"]) {
    if (write_errors.type() == bsoncxx::type::k_array) {
      auto errors = write_errors.get_array().value;
      auto first  = errors.begin();
      if (first != errors.end() && first->type() == bsoncxx::type::k_document) {
        return FromErrorDocument(first->get_document().value, "write error: ");
      }
    }
  }

  if (auto concern = reply["writeConcernError"]) {
    if (concern.type() == bsoncxx::type::k_document) {
      return FromErrorDocument(concern.get_document().value, "write concern error: ");
    }
  }

  return Result::Ok();
}

std::int64_t ReplyCount(bsoncxx::document::view reply) {
  auto n = reply["n"];
  if (!n) {
    return 0;
  }
  switch (n.type()) {
    case bsoncxx::type::k_int32:
      return n.get_int32().value;
    case bsoncxx::type::k_int64:
      return n.get_int64().value;
    case bsoncxx::type::k_double:
      return static_cast<std::int64_t>(n.get_double().value);
    default:
      throw DatabaseException(ErrorCode::InternalError, "malformed reply: n is not a number");
  }
}

std::optional<bsoncxx::document::view> FirstBatchDocument(bsoncxx::document::view reply) {
  auto cursor = reply["cursor"];
  if (!cursor || cursor.type() != bsoncxx::type::k_document) {
    throw DatabaseException(ErrorCode::InternalError, "malformed reply: missing cursor");
  }
  auto batch = cursor.get_document().value["firstBatch"];
  if (!batch || batch.type() != bsoncxx::type::k_array) {
    throw DatabaseException(ErrorCode::InternalError, "malformed reply: missing cursor.firstBatch");
  }
  auto documents = batch.get_array().value;
  auto first     = documents.begin();
  if (first == documents.end()) {
    return std::nullopt;
  }
  if (first->type() != bsoncxx::type::k_document) {
    throw DatabaseException(ErrorCode::InternalError, "malformed reply: firstBatch holds a non-document");
  }
  return first->get_document().value;
}

} // namespace migrate::db
