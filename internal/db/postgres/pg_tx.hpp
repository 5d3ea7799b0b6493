#pragma once

#include <memory>
#include <optional>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_connection.hpp"

namespace dbmgr::db::postgres {

/*
  pqxx::work on an owned connection. The isolation level and read-only
  mode are set as the first statements of the transaction. Snapshot maps
  to REPEATABLE READ.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::unique_ptr<PgConnection> connection, bool read_only, std::optional<IsolationLevel> isolation);
  ~PgTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsActive() const override {
    return tx_ != nullptr;
  }

  db::Connection& ConnectionHandle() override {
    return *connection_;
  }

  std::optional<IsolationLevel> Isolation() const override {
    return isolation_;
  }

 private:
  void Finish();

  std::unique_ptr<PgConnection> connection_;
  std::unique_ptr<pqxx::work>   tx_;
  std::optional<IsolationLevel> isolation_;
  bool                          committed_ = false;
};

} // namespace dbmgr::db::postgres
