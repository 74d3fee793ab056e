#pragma once

#include <mongocxx/exception/exception.hpp>

#include "internal/db/api/result.hpp"

namespace migrate::db::mongo {

/*
  Converts mongocxx exceptions into portable DatabaseException codes.

  Server replies carry a "code" (or writeErrors) in raw_server_error().
  Client side failures (server selection, stream, authentication handshake)
  only carry a libmongoc error code, which is mapped separately.
*/

DatabaseException Translate(const mongocxx::exception& e);

ErrorCode FromClientCode(int client_code);

} // namespace migrate::db::mongo
