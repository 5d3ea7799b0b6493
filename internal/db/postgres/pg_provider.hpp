#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/connection_provider.hpp"

namespace dbmgr::db::postgres {

/*
  Opens one libpqxx connection per request; nothing is pooled.
  Connection failures are logged and reported as nullptr.
*/
class PgConnectionProvider final : public db::ConnectionProvider {
 public:
  explicit PgConnectionProvider(std::string connection_uri);

  bool SupportsReadOnly() const override {
    return true;
  }

  std::unique_ptr<db::Connection>  CreateConnection(bool read_only) override;
  std::unique_ptr<db::Transaction> CreateTransaction(bool read_only, std::optional<IsolationLevel> isolation) override;

  std::string Describe() const override;

 private:
  std::string connection_uri_;
};

} // namespace dbmgr::db::postgres
