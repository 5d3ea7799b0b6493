#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/connection.hpp"

namespace dbmgr::db::postgres {

/*
  One libpqxx connection.

  Outside a transaction every script runs in a pqxx::nontransaction
  (autocommit). While a PgTransaction is open on this connection its
  pqxx::work is used instead.

  Parameters bind positionally in parameter-set order ($1, $2, ...).
  Every non-null field is returned as text.
*/
class PgConnection final : public db::Connection {
 public:
  PgConnection(std::unique_ptr<pqxx::connection> conn, bool read_only);

  bool IsReadOnly() const override {
    return read_only_;
  }

  sql::Values Execute(const std::string& script, ExecutionType type, const sql::ParameterSet& parameters) override;

  pqxx::connection& Raw() {
    return *conn_;
  }

  // Set by PgTransaction for its lifetime.
  void Attach(pqxx::transaction_base* tx) {
    active_ = tx;
  }

 private:
  std::unique_ptr<pqxx::connection> conn_;
  pqxx::transaction_base*           active_ = nullptr;
  bool                              read_only_;
};

} // namespace dbmgr::db::postgres
