#include "pg_provider.hpp"

#include <pqxx/pqxx>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "pg_connection.hpp"
#include "pg_tx.hpp"

namespace dbmgr::db::postgres {

using observability::BoolField;
using observability::StringField;

PgConnectionProvider::PgConnectionProvider(std::string connection_uri) : connection_uri_(std::move(connection_uri)) {
  if (util::IsBlank(connection_uri_)) {
    throw util::InvalidArgument("postgres connection uri is empty");
  }
}

std::string PgConnectionProvider::Describe() const {
  // credentials stay out of logs
  const auto at = connection_uri_.rfind('@');
  if (at == std::string::npos) {
    return "postgres";
  }
  return "postgres:" + connection_uri_.substr(at + 1);
}

std::unique_ptr<db::Connection> PgConnectionProvider::CreateConnection(bool read_only) {
  try {
    return std::make_unique<PgConnection>(std::make_unique<pqxx::connection>(connection_uri_), read_only);
  } catch (const std::exception& e) {
    DBMGR_LOG_ERROR("Postgres connection failed", {StringField("target", Describe()), BoolField("read_only", read_only), StringField("error", e.what())});
    return nullptr;
  }
}

std::unique_ptr<db::Transaction> PgConnectionProvider::CreateTransaction(bool read_only, std::optional<IsolationLevel> isolation) {
  try {
    auto connection = std::make_unique<PgConnection>(std::make_unique<pqxx::connection>(connection_uri_), false);
    return std::make_unique<PgTransaction>(std::move(connection), read_only, isolation);
  } catch (const std::exception& e) {
    DBMGR_LOG_ERROR("Postgres transaction failed", {StringField("target", Describe()), BoolField("read_only", read_only), StringField("error", e.what())});
    return nullptr;
  }
}

} // namespace dbmgr::db::postgres
