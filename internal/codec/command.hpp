#pragma once

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace migrate::codec {

/*
  One decoded script command.

  Every alternative keeps the raw command document: that document, not a
  re-encoding, is what gets sent to the server.
*/

struct CommandBody {
  explicit CommandBody(bsoncxx::document::value doc) : raw(std::move(doc)) {
  }

  bsoncxx::document::value raw;
};

// Collection-scoped commands carry the target collection name.
struct CollectionCommand : CommandBody {
  CollectionCommand(bsoncxx::document::value doc, std::string coll) : CommandBody(std::move(doc)), collection(std::move(coll)) {
  }

  std::string collection;
};

struct Insert : CollectionCommand {
  using CollectionCommand::CollectionCommand;
  static constexpr std::string_view kName = "insert";
};

struct Update : CollectionCommand {
  using CollectionCommand::CollectionCommand;
  static constexpr std::string_view kName = "update";
};

struct Delete : CollectionCommand {
  using CollectionCommand::CollectionCommand;
  static constexpr std::string_view kName = "delete";
};

struct Create : CollectionCommand {
  using CollectionCommand::CollectionCommand;
  static constexpr std::string_view kName = "create";
};

struct CreateIndexes : CollectionCommand {
  using CollectionCommand::CollectionCommand;
  static constexpr std::string_view kName = "createIndexes";
};

struct Drop : CollectionCommand {
  using CollectionCommand::CollectionCommand;
  static constexpr std::string_view kName = "drop";
};

struct DropIndexes : CollectionCommand {
  using CollectionCommand::CollectionCommand;
  static constexpr std::string_view kName = "dropIndexes";
};

// Anything else (aggregate, collMod, renameCollection, ...), forwarded as is.
struct Opaque : CommandBody {
  Opaque(bsoncxx::document::value doc, std::string command_name) : CommandBody(std::move(doc)), name(std::move(command_name)) {
  }

  std::string name;
};

using CommandVariant = std::variant<Insert, Update, Delete, Create, CreateIndexes, Drop, DropIndexes, Opaque>;

class Command {
 public:
  explicit Command(CommandVariant body) : body_(std::move(body)) {
  }

  std::string Name() const;

  // Empty for opaque commands.
  std::string Collection() const;

  // Collection and index creation or removal.
  bool IsStructural() const;

  bsoncxx::document::view Document() const;

  const CommandVariant& Body() const {
    return body_;
  }

 private:
  CommandVariant body_;
};

using Script = std::vector<Command>;

} // namespace migrate::codec
