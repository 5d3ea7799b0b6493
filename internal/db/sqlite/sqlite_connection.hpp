#pragma once

#include <memory>

#include "internal/db/api/connection.hpp"
#include "sqlite_db.hpp"

namespace dbmgr::db::sqlite {

/*
  Runs scripts statement by statement (sqlite3_prepare_v2 tail loop).

  Parameters bind by name: ":key", "@key" and "$key" all look up "key".
  Unmatched placeholders stay NULL.
*/
class SqliteConnection final : public db::Connection {
 public:
  explicit SqliteConnection(std::shared_ptr<SqliteDB> db);

  bool IsReadOnly() const override {
    return db_->IsReadOnly();
  }

  sql::Values Execute(const std::string& script, ExecutionType type, const sql::ParameterSet& parameters) override;

  SqliteDB& Database() {
    return *db_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace dbmgr::db::sqlite
