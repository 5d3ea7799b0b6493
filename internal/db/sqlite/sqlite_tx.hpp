#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "sqlite_connection.hpp"

namespace dbmgr::db::sqlite {

/*
  SQLite transaction wrapper.

  Writers use BEGIN IMMEDIATE:
    - grabs the write lock early
    - avoids deadlock-y lock upgrades later
  Read-only and ReadUncommitted transactions use BEGIN DEFERRED.
  SQLite is serializable, so the other levels need nothing extra.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::unique_ptr<SqliteConnection> connection, std::optional<IsolationLevel> isolation);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsActive() const override {
    return active_;
  }

  db::Connection& ConnectionHandle() override {
    return *connection_;
  }

  std::optional<IsolationLevel> Isolation() const override {
    return isolation_;
  }

 private:
  std::unique_ptr<SqliteConnection> connection_;
  std::optional<IsolationLevel>     isolation_;
  bool                              active_    = false;
  bool                              committed_ = false;
};

} // namespace dbmgr::db::sqlite
