#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/sql/sql_value.hpp"

namespace dbmgr::db::sql {

/*
  Named parameter abstraction.

  Postgres: bound positionally in set order ($1 $2 ...)
  SQLite:   bound by name (:name, @name, $name)

  Names are unique, compared case-insensitively.
*/

enum class ParameterType : std::uint8_t {
  kNull = 0,
  kInteger = 1,
  kReal = 2,
  kText = 3,
  kBlob = 4,
};

struct Parameter {
  std::string   name;
  ParameterType type = ParameterType::kNull;
  Value         value;
};

class ParameterSet {
 public:
  // Replaces an existing parameter with the same name.
  Parameter& Add(std::string name, ParameterType type, Value value = nullptr);

  bool             Remove(std::string_view name);
  bool             Contains(std::string_view name) const;
  const Parameter* Find(std::string_view name) const;
  Parameter*       Find(std::string_view name);

  void        Clear() { items_.clear(); }
  bool        Empty() const { return items_.empty(); }
  std::size_t Size() const { return items_.size(); }

  std::vector<Parameter>::const_iterator begin() const { return items_.begin(); }
  std::vector<Parameter>::const_iterator end() const { return items_.end(); }

 private:
  std::vector<Parameter> items_;
};

std::string_view ToString(ParameterType type);

} // namespace dbmgr::db::sql
