#pragma once

#include <bsoncxx/document/value.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace migrate::db::memory {

/*
  Plain data of the in-memory document store.

  Copyable on purpose: a transaction works on a snapshot copy and swaps it
  back on commit.
*/

struct IndexSpec {
  std::string              name;
  std::vector<std::string> keys;
  bool                     unique = false;
};

struct CollectionState {
  CollectionState();

  std::vector<bsoncxx::document::value> documents;
  std::vector<IndexSpec>                indexes;
};

struct DatabaseState {
  std::map<std::string, CollectionState> collections;
};

} // namespace migrate::db::memory
