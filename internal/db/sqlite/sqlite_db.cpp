#include "sqlite_db.hpp"

#include <stdexcept>

namespace dbmgr::db::sqlite {

namespace {

ErrorCode CodeFor(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_READONLY:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    case SQLITE_NOTFOUND:
      return ErrorCode::NotFound;
    default:
      return ErrorCode::InternalError;
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOpenOptions options) : path_(std::move(path)), options_(options) {
  const int flags = (options_.read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)) | SQLITE_OPEN_FULLMUTEX;
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

Result SqliteDB::Translate(int rc, const char* what) const {
  const auto code = CodeFor(rc);
  if (code == ErrorCode::OK) {
    return Result::Ok();
  }
  std::string msg = std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
  return Result::Err(code, std::move(msg));
}

Result SqliteDB::TryExec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    return Result::Err(CodeFor(rc), std::move(msg));
  }
  return Result::Ok();
}

void SqliteDB::Exec(const std::string& sql) {
  ThrowIfError(TryExec(sql), "sqlite exec");
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIfError(Translate(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms)), "busy_timeout"), "sqlite configure");

  if (!options_.apply_pragmas || options_.read_only) {
    return;
  }

  // WAL lets readers proceed while a batch holds the write lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");
}

Result CopyDatabase(SqliteDB& from, SqliteDB& to) {
  sqlite3_backup* backup = sqlite3_backup_init(to.Handle(), "main", from.Handle(), "main");
  if (backup == nullptr) {
    return to.Translate(sqlite3_errcode(to.Handle()), "sqlite backup init");
  }

  const int step_rc   = sqlite3_backup_step(backup, -1);
  const int finish_rc = sqlite3_backup_finish(backup);

  if (step_rc != SQLITE_DONE) {
    return to.Translate(step_rc, "sqlite backup step");
  }
  return to.Translate(finish_rc, "sqlite backup finish");
}

} // namespace dbmgr::db::sqlite
