#include "types.hpp"

#include <array>
#include <utility>

#include "internal/util/strings.hpp"

namespace dbmgr::db {

namespace {

constexpr std::array<std::pair<std::string_view, IsolationLevel>, 5> kIsolationLevels{{
    {"ReadUncommitted", IsolationLevel::kReadUncommitted},
    {"ReadCommitted", IsolationLevel::kReadCommitted},
    {"RepeatableRead", IsolationLevel::kRepeatableRead},
    {"Serializable", IsolationLevel::kSerializable},
    {"Snapshot", IsolationLevel::kSnapshot},
}};

constexpr std::array<std::pair<std::string_view, ExecutionType>, 3> kExecutionTypes{{
    {"Reader", ExecutionType::kReader},
    {"Scalar", ExecutionType::kScalar},
    {"NonQuery", ExecutionType::kNonQuery},
}};

} // namespace

std::string_view ToString(IsolationLevel level) {
  for (const auto& [name, value] : kIsolationLevels) {
    if (value == level) return name;
  }
  return "Unknown";
}

std::string_view ToString(ExecutionType type) {
  for (const auto& [name, value] : kExecutionTypes) {
    if (value == type) return name;
  }
  return "Unknown";
}

std::optional<IsolationLevel> ParseIsolationLevel(std::string_view text) {
  for (const auto& [name, value] : kIsolationLevels) {
    if (util::EqualsIgnoreCase(name, text)) return value;
  }
  return std::nullopt;
}

std::optional<ExecutionType> ParseExecutionType(std::string_view text) {
  for (const auto& [name, value] : kExecutionTypes) {
    if (util::EqualsIgnoreCase(name, text)) return value;
  }
  return std::nullopt;
}

} // namespace dbmgr::db
