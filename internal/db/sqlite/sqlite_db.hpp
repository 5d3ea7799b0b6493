#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"

namespace dbmgr::db::sqlite {

struct SqliteOpenOptions {
  bool          read_only       = false;
  std::uint32_t busy_timeout_ms = 5000;
  // WAL, synchronous, foreign keys. Off for backup files.
  bool apply_pragmas = true;
};

/*
  Thin RAII wrapper around sqlite3*.

  Opening a read-write handle creates the file when missing.
  Throws std::runtime_error when the database cannot be opened.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOpenOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool IsReadOnly() const {
    return options_.read_only;
  }

  // Execute a SQL string (pragmas, transaction control)
  void   Exec(const std::string& sql);
  Result TryExec(const std::string& sql);

  // Maps an sqlite result code plus the handle's message to a Result.
  Result Translate(int rc, const char* what) const;

 private:
  void Configure();

  sqlite3*          db_ = nullptr;
  std::string       path_;
  SqliteOpenOptions options_;
};

// Copies every page of from.main into to.main with the online backup API.
Result CopyDatabase(SqliteDB& from, SqliteDB& to);

} // namespace dbmgr::db::sqlite
