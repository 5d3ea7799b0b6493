#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace dbmgr::db {

enum class IsolationLevel : std::uint8_t {
  kReadUncommitted = 0,
  kReadCommitted = 1,
  kRepeatableRead = 2,
  kSerializable = 3,
  kSnapshot = 4,
};

/*
  How a command's output is collected.

  Reader:   every column of every row
  Scalar:   first column of the first row
  NonQuery: affected row count, -1 when nothing was changed by any statement
*/
enum class ExecutionType : std::uint8_t {
  kReader = 0,
  kScalar = 1,
  kNonQuery = 2,
};

std::string_view ToString(IsolationLevel level);
std::string_view ToString(ExecutionType type);

// Case-insensitive; nullopt for unknown names.
std::optional<IsolationLevel> ParseIsolationLevel(std::string_view text);
std::optional<ExecutionType>  ParseExecutionType(std::string_view text);

} // namespace dbmgr::db
