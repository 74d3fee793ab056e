#pragma once

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "internal/db/api/session.hpp"
#include "internal/db/memory/memory_server.hpp"

namespace migrate::db::memory {

/*
  Transaction = snapshot + working copy

  StartTransaction() copies the database state; commands run against the
  copy; CommitTransaction() publishes it if nothing else committed in the
  meantime. A command failure aborts the transaction server side, like
  MongoDB does: later commands and the commit fail with NoSuchTransaction.
*/
class MemorySession final : public db::Session {
 public:
  MemorySession(std::shared_ptr<MemoryServer> server, std::string database, std::optional<Credentials> credentials);

  void StartTransaction() override;
  void CommitTransaction() override;
  void AbortTransaction() override;
  bool InTransaction() const override {
    return in_transaction_;
  }

  // Runs a command inside the active transaction.
  bsoncxx::document::value Execute(bsoncxx::document::view command);

  const std::string& Database() const {
    return database_;
  }

 private:
  std::shared_ptr<MemoryServer> server_;
  std::string                   database_;
  std::optional<Credentials>    credentials_;

  DatabaseState         working_;
  std::set<std::string> touched_;
  std::uint64_t         snapshot_version_ = 0;
  bool          in_transaction_   = false;
  bool          server_aborted_   = false;
};

} // namespace migrate::db::memory
