#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::db::sqlite {

SqliteTransaction::SqliteTransaction(std::unique_ptr<SqliteConnection> connection, std::optional<IsolationLevel> isolation)
    : connection_(std::move(connection)), isolation_(isolation) {
  auto& db = connection_->Database();

  if (isolation_ == IsolationLevel::kReadUncommitted) {
    db.Exec("PRAGMA read_uncommitted=1;");
    db.Exec("BEGIN DEFERRED;");
  } else if (db.IsReadOnly()) {
    db.Exec("BEGIN DEFERRED;");
  } else {
    db.Exec("BEGIN IMMEDIATE;");
  }
  active_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!active_) {
    return;
  }

  auto result = connection_->Database().TryExec("ROLLBACK;");
  if (!result) {
    DBMGR_LOG_WARN("SQLite rollback failed", {observability::StringField("error", result.message)});
  }
}

void SqliteTransaction::Commit() {
  if (!active_) {
    throw util::InvalidState("sqlite transaction already finished");
  }
  connection_->Database().Exec("COMMIT;");
  active_    = false;
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  if (!active_) {
    throw util::InvalidState("sqlite transaction already finished");
  }
  active_ = false;
  connection_->Database().Exec("ROLLBACK;");
}

} // namespace dbmgr::db::sqlite
