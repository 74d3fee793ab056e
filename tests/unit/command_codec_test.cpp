#include "internal/codec/command_codec.hpp"

#include <bsoncxx/types.hpp>

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>

#include "internal/util/errors.hpp"

namespace {

using migrate::codec::CommandCodec;
using migrate::util::MalformedScript;

bool RejectsScript(const std::string& script) {
  try {
    (void)CommandCodec::Decode(script);
  } catch (const MalformedScript&) {
    return true;
  }
  return false;
}

void TestDecodesKnownAndOpaqueCommandsInOrder() {
  auto script = CommandCodec::Decode(R"([
    {"create": "users"},
    {"createIndexes": "users", "indexes": [{"key": {"email": 1}, "name": "email_1", "unique": true}]},
    {"insert": "users", "documents": [{"email": "a@example.com"}]},
    {"update": "users", "updates": [{"q": {}, "u": {"$set": {"active": true}}}]},
    {"delete": "users", "deletes": [{"q": {"active": false}, "limit": 0}]},
    {"collMod": "users", "validator": {}},
    {"dropIndexes": "users", "index": "email_1"},
    {"drop": "users"}
  ])");

  assert(script.size() == 8);
  assert(script[0].Name() == "create");
  assert(script[1].Name() == "createIndexes");
  assert(script[2].Name() == "insert");
  assert(script[3].Name() == "update");
  assert(script[4].Name() == "delete");
  assert(script[5].Name() == "collMod");
  assert(script[6].Name() == "dropIndexes");
  assert(script[7].Name() == "drop");

  assert(script[2].Collection() == "users");
  assert(script[5].Collection().empty());
  assert(std::holds_alternative<migrate::codec::Opaque>(script[5].Body()));
  assert(std::holds_alternative<migrate::codec::Insert>(script[2].Body()));

  assert(script[0].IsStructural());
  assert(script[1].IsStructural());
  assert(!script[2].IsStructural());
  assert(!script[5].IsStructural());
  assert(script[6].IsStructural());
  assert(script[7].IsStructural());
}

void TestRawDocumentIsKeptVerbatim() {
  auto script = CommandCodec::Decode(
      R"([{"insert": "c", "documents": [{"_id": {"$oid": "5f1b2c3d4e5f6a7b8c9d0e1f"}, "n": {"$numberLong": "5"}}], "ordered": false}])");
  auto doc = script[0].Document();
  assert(doc["ordered"].get_bool().value == false);

  auto first = doc["documents"].get_array().value.begin()->get_document().value;
  assert(first["_id"].type() == bsoncxx::type::k_oid);
  assert(first["n"].type() == bsoncxx::type::k_int64);
  assert(first["n"].get_int64().value == 5);
}

void TestEmptyArrayIsEmptyScript() {
  assert(CommandCodec::Decode("[]").empty());
  assert(CommandCodec::Decode("  [ ]\n").empty());
}

void TestDecodesFromStream() {
  std::istringstream in(R"([{"ping": 1}, {"create": "a"}])");
  auto               script = CommandCodec::Decode(in);
  assert(script.size() == 2);
  assert(script[0].Name() == "ping");
  assert(script[1].Name() == "create");
}

void TestRejectsMalformedScripts() {
  assert(RejectsScript(""));
  assert(RejectsScript("not json"));
  assert(RejectsScript(R"({"insert": "c", "documents": []})"));
  assert(RejectsScript("42"));
  assert(RejectsScript("[1]"));
  assert(RejectsScript("[{}]"));
  assert(RejectsScript(R"([], "extra": 1)"));
  assert(RejectsScript(R"([{"insert": 5, "documents": []}])"));
  assert(RejectsScript(R"([{"insert": "c"}])"));
  assert(RejectsScript(R"([{"insert": "c", "documents": [1]}])"));
  assert(RejectsScript(R"([{"update": "c", "updates": {}}])"));
  assert(RejectsScript(R"([{"createIndexes": "c", "indexes": "x"}])"));
  assert(RejectsScript(R"([{"drop": ["c"]}])"));
}

void TestErrorNamesTheFailingElement() {
  try {
    (void)CommandCodec::Decode(R"([{"create": "a"}, {"create": "b"}, {"insert": "c"}])");
    assert(false && "decode must fail");
  } catch (const MalformedScript& e) {
    assert(std::string(e.what()).find("command 2") != std::string::npos);
  }
}

} // namespace

int main() {
  TestDecodesKnownAndOpaqueCommandsInOrder();
  TestRawDocumentIsKeptVerbatim();
  TestEmptyArrayIsEmptyScript();
  TestDecodesFromStream();
  TestRejectsMalformedScripts();
  TestErrorNamesTheFailingElement();

  std::cout << "migrate_unit_command_codec: pass\n";
  return 0;
}
