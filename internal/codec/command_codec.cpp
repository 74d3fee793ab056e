#include "internal/codec/command_codec.hpp"

#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>

#include <iterator>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"

namespace migrate::codec {

namespace {

using bsoncxx::type;

std::string At(std::size_t index) {
  return "command " + std::to_string(index);
}

std::string CollectionName(bsoncxx::document::view doc, const std::string& name, std::size_t index) {
  auto value = doc[name];
  if (value.type() != type::k_string) {
    throw util::MalformedScript(At(index) + ": '" + name + "' must name a collection");
  }
  return std::string(value.get_string().value);
}

void RequireDocumentArray(bsoncxx::document::view doc, std::string_view field, const std::string& name, std::size_t index) {
  auto value = doc[field];
  if (!value) {
    throw util::MalformedScript(At(index) + ": '" + name + "' requires '" + std::string(field) + "'");
  }
  if (value.type() != type::k_array) {
    throw util::MalformedScript(At(index) + ": '" + std::string(field) + "' must be an array");
  }
  for (auto&& element : value.get_array().value) {
    if (element.type() != type::k_document) {
      throw util::MalformedScript(At(index) + ": '" + std::string(field) + "' must contain only documents");
    }
  }
}

// Batch argument of each known command kind, if it has one.
std::optional<std::string_view> BatchField(std::string_view name) {
  if (name == Insert::kName) return "documents";
  if (name == Update::kName) return "updates";
  if (name == Delete::kName) return "deletes";
  if (name == CreateIndexes::kName) return "indexes";
  return std::nullopt;
}

Command DecodeOne(bsoncxx::document::view doc, std::size_t index) {
  auto first = doc.begin();
  if (first == doc.end()) {
    throw util::MalformedScript(At(index) + ": empty command document");
  }

  const auto               name = std::string(first->key());
  bsoncxx::document::value raw{doc};

  auto collection_command = [&]() {
    auto collection = CollectionName(doc, name, index);
    if (auto field = BatchField(name)) {
      RequireDocumentArray(doc, *field, name, index);
    }
    return collection;
  };

  if (name == Insert::kName) return Command(Insert(std::move(raw), collection_command()));
  if (name == Update::kName) return Command(Update(std::move(raw), collection_command()));
  if (name == Delete::kName) return Command(Delete(std::move(raw), collection_command()));
  if (name == Create::kName) return Command(Create(std::move(raw), collection_command()));
  if (name == CreateIndexes::kName) return Command(CreateIndexes(std::move(raw), collection_command()));
  if (name == Drop::kName) return Command(Drop(std::move(raw), collection_command()));
  if (name == DropIndexes::kName) return Command(DropIndexes(std::move(raw), collection_command()));

  return Command(Opaque(std::move(raw), name));
}

} // namespace

Script CommandCodec::Decode(std::string_view bytes) {
  // Extended JSON parsing needs a document at the top level.
  std::string wrapped;
  wrapped.reserve(bytes.size() + 16);
  wrapped += "{\"commands\": ";
  wrapped += bytes;
  wrapped += "\n}";

  std::optional<bsoncxx::document::value> parsed;
  try {
    parsed.emplace(bsoncxx::from_json(wrapped));
  } catch (const bsoncxx::exception& e) {
    throw util::MalformedScript(std::string("invalid JSON: ") + e.what());
  }

  auto root = parsed->view();
  if (std::distance(root.begin(), root.end()) != 1) {
    throw util::MalformedScript("expected a single array of command documents");
  }
  auto commands = root["commands"];
  if (!commands || commands.type() != type::k_array) {
    throw util::MalformedScript("expected an array of command documents");
  }

  Script      script;
  std::size_t index = 0;
  for (auto&& element : commands.get_array().value) {
    if (element.type() != type::k_document) {
      throw util::MalformedScript(At(index) + ": expected a document");
    }
    script.push_back(DecodeOne(element.get_document().value, index));
    ++index;
  }
  return script;
}

Script CommandCodec::Decode(std::istream& in) {
  std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    throw util::MalformedScript("failed to read migration script");
  }
  return Decode(bytes);
}

} // namespace migrate::codec
