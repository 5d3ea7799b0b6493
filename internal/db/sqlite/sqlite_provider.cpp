#include "sqlite_provider.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "sqlite_tx.hpp"

namespace dbmgr::db::sqlite {

using observability::BoolField;
using observability::StringField;

SqliteConnectionProvider::SqliteConnectionProvider(SqliteProviderOptions options) : options_(std::move(options)) {
  if (util::IsBlank(options_.path)) {
    throw util::InvalidArgument("sqlite database path is empty");
  }
}

std::shared_ptr<SqliteDB> SqliteConnectionProvider::OpenDatabase(bool read_only) const {
  SqliteOpenOptions open;
  open.read_only       = read_only;
  open.busy_timeout_ms = options_.busy_timeout_ms;
  return std::make_shared<SqliteDB>(options_.path, open);
}

std::unique_ptr<db::Connection> SqliteConnectionProvider::CreateConnection(bool read_only) {
  try {
    return std::make_unique<SqliteConnection>(OpenDatabase(read_only));
  } catch (const std::exception& e) {
    DBMGR_LOG_ERROR("SQLite connection failed", {StringField("path", options_.path), BoolField("read_only", read_only), StringField("error", e.what())});
    return nullptr;
  }
}

std::unique_ptr<db::Transaction> SqliteConnectionProvider::CreateTransaction(bool read_only, std::optional<IsolationLevel> isolation) {
  try {
    return std::make_unique<SqliteTransaction>(std::make_unique<SqliteConnection>(OpenDatabase(read_only)), isolation);
  } catch (const std::exception& e) {
    DBMGR_LOG_ERROR("SQLite transaction failed", {StringField("path", options_.path), BoolField("read_only", read_only), StringField("error", e.what())});
    return nullptr;
  }
}

} // namespace dbmgr::db::sqlite
