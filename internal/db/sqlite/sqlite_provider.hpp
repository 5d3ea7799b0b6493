#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/connection_provider.hpp"
#include "sqlite_connection.hpp"
#include "sqlite_db.hpp"

namespace dbmgr::db::sqlite {

struct SqliteProviderOptions {
  std::string   path;
  bool          read_only_supported = true;
  std::uint32_t busy_timeout_ms     = 5000;
};

/*
  Opens a fresh sqlite3 handle per connection or transaction.
  Open failures are logged and reported as nullptr.
*/
class SqliteConnectionProvider final : public db::ConnectionProvider {
 public:
  explicit SqliteConnectionProvider(SqliteProviderOptions options);

  bool SupportsReadOnly() const override {
    return options_.read_only_supported;
  }

  std::unique_ptr<db::Connection>  CreateConnection(bool read_only) override;
  std::unique_ptr<db::Transaction> CreateTransaction(bool read_only, std::optional<IsolationLevel> isolation) override;

  std::string Describe() const override {
    return "sqlite:" + options_.path;
  }

  // Raw handle for backup/restore. Throws when the file cannot be opened.
  std::shared_ptr<SqliteDB> OpenDatabase(bool read_only) const;

  const SqliteProviderOptions& Options() const {
    return options_;
  }

 private:
  SqliteProviderOptions options_;
};

} // namespace dbmgr::db::sqlite
