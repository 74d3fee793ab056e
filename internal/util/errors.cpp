#include "internal/util/errors.hpp"

#include <utility>

namespace migrate::util {

namespace {

std::string Join(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

} // namespace

CommandError::CommandError(std::size_t index, std::string command, db::ErrorCode cause, model::RunOutcome outcome, const std::string& msg)
    : MigrateError("command " + std::to_string(index) + " (" + command + ") failed [" + std::string(db::ToString(cause)) + ", " +
                   std::string(model::ToString(outcome)) + "]: " + msg),
      index_(index),
      command_(std::move(command)),
      cause_(cause),
      outcome_(outcome) {
}

DropError::DropError(std::vector<std::string> dropped, std::vector<std::string> failed, const std::string& msg)
    : MigrateError("drop failed for [" + Join(failed) + "] after dropping [" + Join(dropped) + "]: " + msg),
      dropped_(std::move(dropped)),
      failed_(std::move(failed)) {
}

void RethrowAsMigrateError(const db::DatabaseException& e, const std::string& context) {
  switch (e.Code()) {
    case db::ErrorCode::Unauthenticated:
      throw AuthenticationError(context + ": " + e.what());
    case db::ErrorCode::IOError:
      throw ConnectionError(context + ": " + e.what());
    default:
      throw DatabaseError(e.Code(), context + ": " + e.what());
  }
}

} // namespace migrate::util
