#include "internal/version/version_store.hpp"

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace migrate::version {

namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_array;
using bsoncxx::builder::basic::make_document;

std::int64_t AsInt64(const bsoncxx::document::element& element) {
  switch (element.type()) {
    case bsoncxx::type::k_int32:
      return element.get_int32().value;
    case bsoncxx::type::k_int64:
      return element.get_int64().value;
    case bsoncxx::type::k_double:
      return static_cast<std::int64_t>(element.get_double().value);
    default:
      throw util::DatabaseError(db::ErrorCode::InternalError, "version record has a non-numeric version");
  }
}

} // namespace

VersionStore::VersionStore(db::Database& database, std::string collection) : database_(database), collection_(std::move(collection)) {
}

void VersionStore::Ensure() {
  try {
    database_.RunCommand(make_document(kvp("create", collection_)));
  } catch (const db::DatabaseException& e) {
    if (e.Code() == db::ErrorCode::AlreadyExists) {
      return;
    }
    util::RethrowAsMigrateError(e, "create " + collection_);
  }
}

VersionRecord VersionStore::Current() {
  try {
    auto reply = database_.RunCommand(make_document(kvp("find", collection_), kvp("filter", make_document()), kvp("limit", 1),
                                                    kvp("singleBatch", true)));
    auto record = db::FirstBatchDocument(reply.view());
    if (!record) {
      return {};
    }

    VersionRecord out;
    if (auto version = (*record)["version"]) {
      out.version = AsInt64(version);
    }
    if (auto dirty = (*record)["dirty"]; dirty && dirty.type() == bsoncxx::type::k_bool) {
      out.dirty = dirty.get_bool().value;
    }
    return out;
  } catch (const db::DatabaseException& e) {
    util::RethrowAsMigrateError(e, "read version");
  }
}

void VersionStore::Set(std::int64_t version, bool dirty, db::Session* session) {
  observability::SpanScope span("migrate.version.set");
  span.SetAttribute("version", version);

  try {
    database_.RunCommand(make_document(kvp("update", collection_),
                                       kvp("updates", make_array(make_document(kvp("q", make_document()),
                                                                               kvp("u", make_document(kvp("version", version), kvp("dirty", dirty))),
                                                                               kvp("upsert", true))))),
                         session);
  } catch (const db::DatabaseException& e) {
    span.RecordException(e.what());
    util::RethrowAsMigrateError(e, "set version");
  }

  MIGRATE_LOG_DEBUG("version set", {observability::IntField("version", version), observability::BoolField("dirty", dirty)});
}

std::vector<std::string> VersionStore::DropAll() {
  observability::SpanScope span("migrate.drop");

  std::vector<std::string> names;
  try {
    names = database_.ListCollectionNames();
  } catch (const db::DatabaseException& e) {
    span.RecordException(e.what());
    util::RethrowAsMigrateError(e, "list collections");
  }

  std::vector<std::string> dropped;
  std::vector<std::string> failed;
  std::string              first_error;
  for (const auto& name : names) {
    if (name.rfind("system.", 0) == 0) {
      continue;
    }
    try {
      database_.RunCommand(make_document(kvp("drop", name)));
      dropped.push_back(name);
    } catch (const db::DatabaseException& e) {
      if (e.Code() == db::ErrorCode::NotFound) {
        // dropped concurrently
        dropped.push_back(name);
        continue;
      }
      if (e.Code() == db::ErrorCode::Unauthenticated) {
        throw util::AuthenticationError(std::string("drop ") + name + ": " + e.what());
      }
      MIGRATE_LOG_WARN("drop collection failed", {observability::StringField("collection", name), observability::StringField("error", e.what())});
      failed.push_back(name);
      if (first_error.empty()) {
        first_error = e.what();
      }
    }
  }

  span.SetAttribute("dropped", static_cast<std::int64_t>(dropped.size()));
  if (!failed.empty()) {
    span.RecordException(first_error);
    throw util::DropError(std::move(dropped), std::move(failed), first_error);
  }
  MIGRATE_LOG_INFO("database dropped", {observability::StringField("database", database_.Name()),
                                        observability::IntField("collections", static_cast<std::int64_t>(dropped.size()))});
  return dropped;
}

} // namespace migrate::version
