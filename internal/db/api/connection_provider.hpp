#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/transaction.hpp"

namespace dbmgr::db {

/*
  Opens connections and transactions for the manager.

  Both factory methods return an open, usable resource or nullptr when the
  backend refused. The provider logs the reason; callers only see the null.
*/

class ConnectionProvider {
 public:
  virtual ~ConnectionProvider() = default;

  virtual bool SupportsReadOnly() const = 0;

  virtual std::unique_ptr<Connection>  CreateConnection(bool read_only) = 0;
  virtual std::unique_ptr<Transaction> CreateTransaction(bool read_only, std::optional<IsolationLevel> isolation) = 0;

  // Short human-readable target description for logs (path, host/db).
  virtual std::string Describe() const = 0;
};

} // namespace dbmgr::db
