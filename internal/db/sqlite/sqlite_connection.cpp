#include "sqlite_connection.hpp"

#include <memory>

namespace dbmgr::db::sqlite {

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

int BindValue(sqlite3_stmt* stmt, int index, const sql::Value& value) {
  if (std::holds_alternative<std::nullptr_t>(value)) {
    return sqlite3_bind_null(stmt, index);
  }
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return sqlite3_bind_int64(stmt, index, *i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return sqlite3_bind_double(stmt, index, *d);
  }
  if (const auto* s = std::get_if<std::string>(&value)) {
    return sqlite3_bind_text(stmt, index, s->c_str(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
  }
  const auto& blob = std::get<sql::Blob>(value);
  return sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

sql::Value ColumnValue(sqlite3_stmt* stmt, int column) {
  switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt, column);
    case SQLITE_TEXT: {
      const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
      return std::string(text ? text : "", static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
    }
    case SQLITE_BLOB: {
      const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
      const auto  size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, column));
      return sql::Blob(data, data + size);
    }
    default:
      return nullptr;
  }
}

} // namespace

SqliteConnection::SqliteConnection(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

sql::Values SqliteConnection::Execute(const std::string& script, ExecutionType type, const sql::ParameterSet& parameters) {
  sqlite3* handle = db_->Handle();

  sql::Values  out;
  bool         scalar_taken = false;
  bool         changed      = false;
  std::int64_t changes      = 0;

  const char* tail = script.c_str();
  const char* end  = tail + script.size();

  while (tail < end) {
    sqlite3_stmt* raw  = nullptr;
    const char*   next = nullptr;
    ThrowIfError(db_->Translate(sqlite3_prepare_v2(handle, tail, static_cast<int>(end - tail), &raw, &next), "sqlite prepare"), "execute script");
    tail = next;

    // whitespace or a trailing comment
    if (raw == nullptr) continue;
    StatementPtr stmt(raw);

    const int bind_count = sqlite3_bind_parameter_count(raw);
    for (int i = 1; i <= bind_count; ++i) {
      const char* name = sqlite3_bind_parameter_name(raw, i);
      if (name == nullptr || name[0] == '\0') continue;

      if (const auto* parameter = parameters.Find(name + 1)) {
        ThrowIfError(db_->Translate(BindValue(raw, i, parameter->value), "sqlite bind"), "bind parameter " + parameter->name);
      }
    }

    const bool read_only_statement = sqlite3_stmt_readonly(raw) != 0;
    const int  total_before        = sqlite3_total_changes(handle);

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
      if (type == ExecutionType::kReader) {
        const int columns = sqlite3_column_count(raw);
        for (int c = 0; c < columns; ++c) {
          out.push_back(ColumnValue(raw, c));
        }
      } else if (type == ExecutionType::kScalar && !scalar_taken) {
        out.push_back(ColumnValue(raw, 0));
        scalar_taken = true;
      }
    }
    ThrowIfError(db_->Translate(rc, "sqlite step"), "execute script");

    if (!read_only_statement) {
      changed = true;
      changes += sqlite3_total_changes(handle) - total_before;
    }
  }

  if (type == ExecutionType::kNonQuery) {
    out.push_back(changed ? changes : std::int64_t{-1});
  } else if (type == ExecutionType::kScalar && !scalar_taken) {
    out.push_back(nullptr);
  }

  return out;
}

} // namespace dbmgr::db::sqlite
