#include "pg_tx.hpp"

#include "internal/util/errors.hpp"

namespace dbmgr::db::postgres {

namespace {

const char* IsolationClause(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kReadUncommitted:
      return "READ UNCOMMITTED";
    case IsolationLevel::kReadCommitted:
      return "READ COMMITTED";
    case IsolationLevel::kRepeatableRead:
    case IsolationLevel::kSnapshot:
      return "REPEATABLE READ";
    case IsolationLevel::kSerializable:
      return "SERIALIZABLE";
  }
  return "READ COMMITTED";
}

} // namespace

PgTransaction::PgTransaction(std::unique_ptr<PgConnection> connection, bool read_only, std::optional<IsolationLevel> isolation)
    : connection_(std::move(connection)), isolation_(isolation) {
  tx_ = std::make_unique<pqxx::work>(connection_->Raw());

  if (isolation_) {
    tx_->exec(std::string("SET TRANSACTION ISOLATION LEVEL ") + IsolationClause(*isolation_));
  }
  if (read_only) {
    tx_->exec("SET TRANSACTION READ ONLY");
  }

  connection_->Attach(tx_.get());
}

PgTransaction::~PgTransaction() {
  // pqxx::work aborts in its destructor when not committed
  Finish();
}

void PgTransaction::Finish() {
  connection_->Attach(nullptr);
  tx_.reset();
}

void PgTransaction::Commit() {
  if (!tx_) {
    throw util::InvalidState("postgres transaction already finished");
  }
  tx_->commit();
  committed_ = true;
  Finish();
}

void PgTransaction::Rollback() {
  if (!tx_) {
    throw util::InvalidState("postgres transaction already finished");
  }
  tx_->abort();
  Finish();
}

} // namespace dbmgr::db::postgres
