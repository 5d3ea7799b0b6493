#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dbmgr::db::sql {

/*
  Driver-neutral cell value.

  SQLite: maps 1:1 to the storage classes (NULL, INTEGER, REAL, TEXT, BLOB)
  Postgres: every non-null field arrives as TEXT
*/

using Blob = std::vector<std::uint8_t>;

using Value = std::variant<
    std::nullptr_t,
    std::int64_t,
    double,
    std::string,
    Blob
>;

using Values = std::vector<Value>;

inline bool IsNull(const Value& v) {
  return std::holds_alternative<std::nullptr_t>(v);
}

// Integer view of a value. Text is parsed; out-of-range or unparsable yields nullopt.
std::optional<std::int64_t> ToInt64(const Value& v);
std::optional<int>          ToInt32(const Value& v);

// Text view of a value; null yields nullopt, blobs are hex encoded.
std::optional<std::string> ToText(const Value& v);

std::string ToDisplayString(const Value& v);

} // namespace dbmgr::db::sql
