#include "internal/db/memory/memory_commands.hpp"

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/oid.hpp>
#include <bsoncxx/types.hpp>
#include <bsoncxx/types/bson_value/view.hpp>

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/db/api/result.hpp"

namespace migrate::db::memory {

namespace {

namespace bb = bsoncxx::builder::basic;

using bsoncxx::type;
using bsoncxx::builder::basic::kvp;
using bsoncxx::document::view;
using Value = bsoncxx::types::bson_value::view;

constexpr std::int32_t kBadValue                          = 2;
constexpr std::int32_t kFailedToParse                     = 9;
constexpr std::int32_t kTypeMismatch                      = 14;
constexpr std::int32_t kNamespaceNotFound                 = 26;
constexpr std::int32_t kIndexNotFound                     = 27;
constexpr std::int32_t kNamespaceExists                   = 48;
constexpr std::int32_t kCommandNotFound                   = 59;
constexpr std::int32_t kIndexKeySpecsConflict             = 86;
constexpr std::int32_t kOperationNotSupportedInTransaction = 263;
constexpr std::int32_t kDuplicateKey                      = 11000;

// Arguments every command accepts and the store ignores.
const std::set<std::string, std::less<>> kGenericArguments = {"maxTimeMS", "lsid", "$db", "writeConcern", "readConcern", "comment", "txnNumber", "autocommit", "startTransaction"};

[[noreturn]] void Fail(std::int32_t code, const std::string& message) {
  throw DatabaseException(FromServerCode(code), message, code);
}

bsoncxx::document::value Ok() {
  return bb::make_document(kvp("ok", 1.0));
}

std::string StringArgument(view command, std::string_view name) {
  auto element = command[name];
  if (!element || element.type() != type::k_string) {
    Fail(kTypeMismatch, "'" + std::string(name) + "' must be a string");
  }
  return std::string(element.get_string().value);
}

bsoncxx::array::view ArrayArgument(view command, std::string_view name) {
  auto element = command[name];
  if (!element || element.type() != type::k_array) {
    Fail(kTypeMismatch, "'" + std::string(name) + "' must be an array");
  }
  return element.get_array().value;
}

view DocumentArgument(view command, std::string_view name) {
  auto element = command[name];
  if (!element) {
    return {};
  }
  if (element.type() != type::k_document) {
    Fail(kTypeMismatch, "'" + std::string(name) + "' must be a document");
  }
  return element.get_document().value;
}

bool BoolArgument(view command, std::string_view name, bool fallback) {
  auto element = command[name];
  if (!element) {
    return fallback;
  }
  switch (element.type()) {
    case type::k_bool:
      return element.get_bool().value;
    case type::k_int32:
      return element.get_int32().value != 0;
    case type::k_int64:
      return element.get_int64().value != 0;
    case type::k_double:
      return element.get_double().value != 0.0;
    default:
      Fail(kTypeMismatch, "'" + std::string(name) + "' must be a boolean");
  }
}

std::int64_t IntArgument(view command, std::string_view name, std::int64_t fallback) {
  auto element = command[name];
  if (!element) {
    return fallback;
  }
  switch (element.type()) {
    case type::k_int32:
      return element.get_int32().value;
    case type::k_int64:
      return element.get_int64().value;
    case type::k_double:
      return static_cast<std::int64_t>(element.get_double().value);
    default:
      Fail(kTypeMismatch, "'" + std::string(name) + "' must be a number");
  }
}

void RejectInTransaction(const ExecutionContext& context, std::string_view command) {
  if (context.in_transaction) {
    Fail(kOperationNotSupportedInTransaction, "Cannot run '" + std::string(command) + "' in a multi-document transaction.");
  }
}

std::optional<double> Numeric(const Value& value) {
  switch (value.type()) {
    case type::k_int32:
      return value.get_int32().value;
    case type::k_int64:
      return static_cast<double>(value.get_int64().value);
    case type::k_double:
      return value.get_double().value;
    default:
      return std::nullopt;
  }
}

std::optional<int> Compare(const Value& a, const Value& b) {
  auto x = Numeric(a);
  auto y = Numeric(b);
  if (x && y) {
    return *x < *y ? -1 : (*x > *y ? 1 : 0);
  }
  if (a.type() == type::k_date && b.type() == type::k_date) {
    auto l = a.get_date().to_int64();
    auto r = b.get_date().to_int64();
    return l < r ? -1 : (l > r ? 1 : 0);
  }
  if (a.type() == type::k_string && b.type() == type::k_string) {
    auto c = a.get_string().value.compare(b.get_string().value);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  if (a.type() == type::k_bool && b.type() == type::k_bool) {
    return static_cast<int>(a.get_bool().value) - static_cast<int>(b.get_bool().value);
  }
  return std::nullopt;
}

bool Equal(const Value& a, const Value& b) {
  if (auto c = Compare(a, b)) {
    return *c == 0;
  }
  return a == b;
}

bool IsNullOrMissing(const bsoncxx::document::element& element) {
  return !element || element.type() == type::k_null;
}

bool MatchOperator(const bsoncxx::document::element& field, const bsoncxx::document::element& op) {
  const auto name = std::string_view(op.key().data(), op.key().size());
  if (name == "$exists") {
    const bool wanted = op.type() == type::k_bool ? op.get_bool().value : Numeric(op.get_value()).value_or(1.0) != 0.0;
    return static_cast<bool>(field) == wanted;
  }
  if (name == "$eq") {
    return IsNullOrMissing(field) ? op.type() == type::k_null : Equal(field.get_value(), op.get_value());
  }
  if (name == "$ne") {
    return IsNullOrMissing(field) ? op.type() != type::k_null : !Equal(field.get_value(), op.get_value());
  }

  if (!field) {
    return false;
  }
  auto order = Compare(field.get_value(), op.get_value());
  if (!order) {
    return false;
  }
  if (name == "$lt") return *order < 0;
  if (name == "$lte") return *order <= 0;
  if (name == "$gt") return *order > 0;
  if (name == "$gte") return *order >= 0;

  Fail(kBadValue, "unknown operator: " + std::string(name));
}

bool IsOperatorDocument(view document) {
  auto first = document.begin();
  return first != document.end() && !first->key().empty() && first->key()[0] == '$';
}

bool SameKey(view a, view b, const std::vector<std::string>& keys) {
  for (const auto& key : keys) {
    auto x = a[key];
    auto y = b[key];
    if (IsNullOrMissing(x) || IsNullOrMissing(y)) {
      if (IsNullOrMissing(x) != IsNullOrMissing(y)) {
        return false;
      }
      continue;
    }
    if (!Equal(x.get_value(), y.get_value())) {
      return false;
    }
  }
  return true;
}

const IndexSpec* FindViolation(const CollectionState& collection, view candidate, std::optional<std::size_t> skip) {
  for (const auto& index : collection.indexes) {
    if (!index.unique) {
      continue;
    }
    for (std::size_t i = 0; i < collection.documents.size(); ++i) {
      if (skip && *skip == i) {
        continue;
      }
      if (SameKey(collection.documents[i].view(), candidate, index.keys)) {
        return &index;
      }
    }
  }
  return nullptr;
}

std::string DuplicateKeyMessage(const std::string& collection, const IndexSpec& index) {
  return "E11000 duplicate key error collection: " + collection + " index: " + index.name;
}

bsoncxx::document::value WithId(view document) {
  if (document["_id"]) {
    return bsoncxx::document::value{document};
  }
  bb::document out;
  out.append(kvp("_id", bsoncxx::oid{}));
  for (auto&& element : document) {
    out.append(kvp(std::string(element.key()), element.get_value()));
  }
  return out.extract();
}

// Replacement keeps the original _id; $set merges fields.
bsoncxx::document::value ApplyUpdate(view original, view update) {
  bb::document out;
  if (!IsOperatorDocument(update)) {
    if (auto id = original["_id"]) {
      out.append(kvp("_id", id.get_value()));
    }
    for (auto&& element : update) {
      if (element.key() == "_id") {
        continue;
      }
      out.append(kvp(std::string(element.key()), element.get_value()));
    }
    return out.extract();
  }

  for (auto&& op : update) {
    if (op.key() != "$set" || op.type() != type::k_document) {
      Fail(kFailedToParse, "unsupported update operator: " + std::string(op.key()));
    }
  }
  auto set = update["$set"].get_document().value;
  for (auto&& element : original) {
    if (auto replacement = set[element.key()]) {
      out.append(kvp(std::string(element.key()), replacement.get_value()));
    } else {
      out.append(kvp(std::string(element.key()), element.get_value()));
    }
  }
  for (auto&& element : set) {
    if (!original[element.key()]) {
      out.append(kvp(std::string(element.key()), element.get_value()));
    }
  }
  return out.extract();
}

// Upsert seed: equality fields of the query.
bsoncxx::document::value SeedFromQuery(view query) {
  bb::document out;
  for (auto&& element : query) {
    if (element.type() == type::k_document && IsOperatorDocument(element.get_document().value)) {
      continue;
    }
    out.append(kvp(std::string(element.key()), element.get_value()));
  }
  return out.extract();
}

bsoncxx::document::value Hello(const ExecutionContext& context) {
  bb::document out;
  out.append(kvp("isWritablePrimary", true));
  out.append(kvp("ismaster", true));
  out.append(kvp("maxWireVersion", context.max_wire_version));
  if (context.replica_set) {
    out.append(kvp("setName", "rs0"));
  }
  out.append(kvp("ok", 1.0));
  return out.extract();
}

bsoncxx::document::value Create(DatabaseState& state, view command, const ExecutionContext& context) {
  const auto name = StringArgument(command, "create");
  RejectInTransaction(context, "create");
  if (state.collections.count(name) != 0) {
    Fail(kNamespaceExists, "Collection already exists. NS: " + name);
  }
  state.collections.emplace(name, CollectionState{});
  return Ok();
}

bsoncxx::document::value CreateIndexes(DatabaseState& state, view command, const ExecutionContext& context) {
  const auto name = StringArgument(command, "createIndexes");
  const auto specs = ArrayArgument(command, "indexes");
  RejectInTransaction(context, "createIndexes");

  auto&      collection = state.collections[name];
  const auto before     = static_cast<std::int32_t>(collection.indexes.size());

  for (auto&& element : specs) {
    if (element.type() != type::k_document) {
      Fail(kTypeMismatch, "index specification must be a document");
    }
    auto spec = element.get_document().value;

    IndexSpec index;
    index.name   = StringArgument(spec, "name");
    index.unique = BoolArgument(spec, "unique", false);
    for (auto&& key : DocumentArgument(spec, "key")) {
      index.keys.emplace_back(key.key());
    }
    if (index.keys.empty()) {
      Fail(kBadValue, "index key pattern must not be empty");
    }

    bool exists = false;
    for (const auto& existing : collection.indexes) {
      if (existing.name == index.name) {
        if (existing.keys != index.keys || existing.unique != index.unique) {
          Fail(kIndexKeySpecsConflict, "An existing index has the same name as the requested index: " + index.name);
        }
        exists = true;
      }
    }
    if (exists) {
      continue;
    }

    if (index.unique) {
      for (std::size_t i = 0; i < collection.documents.size(); ++i) {
        for (std::size_t j = i + 1; j < collection.documents.size(); ++j) {
          if (SameKey(collection.documents[i].view(), collection.documents[j].view(), index.keys)) {
            Fail(kDuplicateKey, DuplicateKeyMessage(name, index));
          }
        }
      }
    }
    collection.indexes.push_back(std::move(index));
  }

  return bb::make_document(kvp("numIndexesBefore", before), kvp("numIndexesAfter", static_cast<std::int32_t>(collection.indexes.size())),
                           kvp("ok", 1.0));
}

bsoncxx::document::value Insert(DatabaseState& state, view command, const ExecutionContext& context) {
  const auto name      = StringArgument(command, "insert");
  const auto documents = ArrayArgument(command, "documents");
  const bool ordered   = BoolArgument(command, "ordered", true);

  auto it = state.collections.find(name);
  if (it == state.collections.end()) {
    if (context.in_transaction) {
      Fail(kOperationNotSupportedInTransaction, "Cannot create namespace " + name + " in multi-document transaction.");
    }
    it = state.collections.emplace(name, CollectionState{}).first;
  }
  auto& collection = it->second;

  bb::array    write_errors;
  bool         failed   = false;
  std::int32_t inserted = 0;
  std::int32_t index    = 0;
  for (auto&& element : documents) {
    if (element.type() != type::k_document) {
      Fail(kTypeMismatch, "documents must contain only documents");
    }
    auto candidate = WithId(element.get_document().value);
    if (const auto* violated = FindViolation(collection, candidate.view(), std::nullopt)) {
      write_errors.append(bb::make_document(kvp("index", index), kvp("code", kDuplicateKey), kvp("errmsg", DuplicateKeyMessage(name, *violated))));
      failed = true;
      if (ordered) {
        break;
      }
    } else {
      collection.documents.push_back(std::move(candidate));
      ++inserted;
    }
    ++index;
  }

  bb::document reply;
  reply.append(kvp("n", inserted));
  if (failed) {
    reply.append(kvp("writeErrors", write_errors.view()));
  }
  reply.append(kvp("ok", 1.0));
  return reply.extract();
}

bsoncxx::document::value Find(DatabaseState& state, view command) {
  const auto name   = StringArgument(command, "find");
  const auto filter = DocumentArgument(command, "filter");
  const auto limit  = IntArgument(command, "limit", 0);

  bb::array batch;
  if (auto it = state.collections.find(name); it != state.collections.end()) {
    std::int64_t returned = 0;
    for (const auto& document : it->second.documents) {
      if (limit > 0 && returned >= limit) {
        break;
      }
      if (Matches(document.view(), filter)) {
        batch.append(document.view());
        ++returned;
      }
    }
  }

  bb::document cursor;
  cursor.append(kvp("firstBatch", batch.view()));
  cursor.append(kvp("id", std::int64_t{0}));
  cursor.append(kvp("ns", name));
  return bb::make_document(kvp("cursor", cursor.view()), kvp("ok", 1.0));
}

bsoncxx::document::value Count(DatabaseState& state, view command) {
  const auto name  = StringArgument(command, "count");
  const auto query = DocumentArgument(command, "query");

  std::int32_t n = 0;
  if (auto it = state.collections.find(name); it != state.collections.end()) {
    for (const auto& document : it->second.documents) {
      if (Matches(document.view(), query)) {
        ++n;
      }
    }
  }
  return bb::make_document(kvp("n", n), kvp("ok", 1.0));
}

bsoncxx::document::value Update(DatabaseState& state, view command, const ExecutionContext& context) {
  const auto name    = StringArgument(command, "update");
  const auto updates = ArrayArgument(command, "updates");

  bb::array    write_errors;
  bb::array    upserted;
  bool         failed      = false;
  bool         any_upsert  = false;
  std::int32_t matched     = 0;
  std::int32_t modified    = 0;
  std::int32_t index       = 0;

  for (auto&& element : updates) {
    if (element.type() != type::k_document) {
      Fail(kTypeMismatch, "updates must contain only documents");
    }
    auto       statement = element.get_document().value;
    const auto query     = DocumentArgument(statement, "q");
    const auto update    = DocumentArgument(statement, "u");
    const bool upsert    = BoolArgument(statement, "upsert", false);
    const bool multi     = BoolArgument(statement, "multi", false);

    auto it = state.collections.find(name);
    if (it == state.collections.end()) {
      if (!upsert) {
        ++index;
        continue;
      }
      if (context.in_transaction) {
        Fail(kOperationNotSupportedInTransaction, "Cannot create namespace " + name + " in multi-document transaction.");
      }
      it = state.collections.emplace(name, CollectionState{}).first;
    }
    auto& collection = it->second;

    bool hit = false;
    for (std::size_t i = 0; i < collection.documents.size(); ++i) {
      if (!Matches(collection.documents[i].view(), query)) {
        continue;
      }
      hit = true;
      ++matched;
      auto replacement = ApplyUpdate(collection.documents[i].view(), update);
      if (const auto* violated = FindViolation(collection, replacement.view(), i)) {
        write_errors.append(bb::make_document(kvp("index", index), kvp("code", kDuplicateKey), kvp("errmsg", DuplicateKeyMessage(name, *violated))));
        failed = true;
        break;
      }
      collection.documents[i] = std::move(replacement);
      ++modified;
      if (!multi) {
        break;
      }
    }

    if (!hit && upsert) {
      auto seed     = SeedFromQuery(query);
      auto document = WithId(IsOperatorDocument(update) ? ApplyUpdate(seed.view(), update).view() : update);
      if (const auto* violated = FindViolation(collection, document.view(), std::nullopt)) {
        write_errors.append(bb::make_document(kvp("index", index), kvp("code", kDuplicateKey), kvp("errmsg", DuplicateKeyMessage(name, *violated))));
        failed = true;
      } else {
        upserted.append(bb::make_document(kvp("index", index), kvp("_id", document.view()["_id"].get_value())));
        collection.documents.push_back(std::move(document));
        any_upsert = true;
      }
    }

    if (failed) {
      break;
    }
    ++index;
  }

  bb::document reply;
  reply.append(kvp("n", matched + (any_upsert ? 1 : 0)));
  reply.append(kvp("nModified", modified));
  if (any_upsert) {
    reply.append(kvp("upserted", upserted.view()));
  }
  if (failed) {
    reply.append(kvp("writeErrors", write_errors.view()));
  }
  reply.append(kvp("ok", 1.0));
  return reply.extract();
}

bsoncxx::document::value Delete(DatabaseState& state, view command) {
  const auto name    = StringArgument(command, "delete");
  const auto deletes = ArrayArgument(command, "deletes");

  std::int32_t removed = 0;
  auto         it      = state.collections.find(name);
  for (auto&& element : deletes) {
    if (element.type() != type::k_document) {
      Fail(kTypeMismatch, "deletes must contain only documents");
    }
    if (it == state.collections.end()) {
      continue;
    }
    auto       statement = element.get_document().value;
    const auto query     = DocumentArgument(statement, "q");
    const auto limit     = IntArgument(statement, "limit", 0);

    auto& documents = it->second.documents;
    for (auto doc = documents.begin(); doc != documents.end();) {
      if (Matches(doc->view(), query)) {
        doc = documents.erase(doc);
        ++removed;
        if (limit == 1) {
          break;
        }
      } else {
        ++doc;
      }
    }
  }
  return bb::make_document(kvp("n", removed), kvp("ok", 1.0));
}

bsoncxx::document::value Drop(DatabaseState& state, view command, const ExecutionContext& context) {
  const auto name = StringArgument(command, "drop");
  RejectInTransaction(context, "drop");
  if (state.collections.erase(name) == 0) {
    Fail(kNamespaceNotFound, "ns not found");
  }
  return bb::make_document(kvp("ns", name), kvp("ok", 1.0));
}

bsoncxx::document::value DropIndexes(DatabaseState& state, view command, const ExecutionContext& context) {
  const auto name = StringArgument(command, "dropIndexes");
  RejectInTransaction(context, "dropIndexes");

  auto it = state.collections.find(name);
  if (it == state.collections.end()) {
    Fail(kNamespaceNotFound, "ns not found");
  }
  auto& indexes = it->second.indexes;
  auto  target  = StringArgument(command, "index");
  if (target == "*") {
    indexes.erase(std::remove_if(indexes.begin(), indexes.end(), [](const IndexSpec& index) { return index.name != "_id_"; }), indexes.end());
    return Ok();
  }
  auto found = std::find_if(indexes.begin(), indexes.end(), [&](const IndexSpec& index) { return index.name == target; });
  if (found == indexes.end() || target == "_id_") {
    Fail(kIndexNotFound, "index not found with name [" + target + "]");
  }
  indexes.erase(found);
  return Ok();
}

} // namespace

bool Matches(view document, view filter) {
  for (auto&& condition : filter) {
    auto field = document[condition.key()];
    if (condition.type() == type::k_document && IsOperatorDocument(condition.get_document().value)) {
      for (auto&& op : condition.get_document().value) {
        if (!MatchOperator(field, op)) {
          return false;
        }
      }
      continue;
    }
    if (IsNullOrMissing(field)) {
      if (condition.type() != type::k_null) {
        return false;
      }
      continue;
    }
    if (!Equal(field.get_value(), condition.get_value())) {
      return false;
    }
  }
  return true;
}

bsoncxx::document::value ExecuteCommand(DatabaseState& state, view command, const ExecutionContext& context) {
  auto first = command.begin();
  if (first == command.end()) {
    Fail(kFailedToParse, "empty command document");
  }
  const auto name = std::string(first->key());

  if (name == "ping") return Ok();
  if (name == "hello" || name == "isMaster" || name == "ismaster") return Hello(context);
  if (name == "create") return Create(state, command, context);
  if (name == "createIndexes") return CreateIndexes(state, command, context);
  if (name == "dropIndexes") return DropIndexes(state, command, context);
  if (name == "insert") return Insert(state, command, context);
  if (name == "find") return Find(state, command);
  if (name == "count") return Count(state, command);
  if (name == "update") return Update(state, command, context);
  if (name == "delete") return Delete(state, command);
  if (name == "drop") return Drop(state, command, context);
  if (name == "dropDatabase") {
    RejectInTransaction(context, "dropDatabase");
    state.collections.clear();
    return Ok();
  }

  if (kGenericArguments.count(name) != 0) {
    Fail(kFailedToParse, "command name expected as first field, found '" + name + "'");
  }
  Fail(kCommandNotFound, "no such command: '" + name + "'");
}

bool IsWriteCommand(view command) {
  static const std::set<std::string, std::less<>> kReadOnly = {"ping", "hello", "isMaster", "ismaster", "find", "count"};

  auto first = command.begin();
  return first != command.end() && kReadOnly.count(std::string(first->key())) == 0;
}

std::set<std::string> WrittenCollections(const DatabaseState& state, view command) {
  std::set<std::string> out;
  auto                  first = command.begin();
  if (first == command.end() || !IsWriteCommand(command)) {
    return out;
  }
  if (first->key() == "dropDatabase") {
    for (const auto& [name, collection] : state.collections) {
      out.insert(name);
    }
    return out;
  }
  if (first->type() == type::k_string) {
    out.emplace(std::string(first->get_string().value));
  }
  return out;
}

} // namespace migrate::db::memory
