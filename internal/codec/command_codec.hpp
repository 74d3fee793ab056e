#pragma once

#include <istream>
#include <string_view>

#include "internal/codec/command.hpp"

namespace migrate::codec {

/*
  Decodes a migration script: a JSON / MongoDB Extended JSON array of
  command documents.

    [
      {"create": "users"},
      {"createIndexes": "users", "indexes": [{"key": {"email": 1}, "name": "email_1", "unique": true}]},
      {"insert": "users", "documents": [{"email": "a@example.com"}]}
    ]

  Structure is checked, semantics are left to the server. Any violation
  throws util::MalformedScript; an empty array yields an empty script.
*/
class CommandCodec {
 public:
  static Script Decode(std::string_view bytes);
  static Script Decode(std::istream& in);
};

} // namespace migrate::codec
