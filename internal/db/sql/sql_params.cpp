#include "sql_params.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace dbmgr::db::sql {

Parameter& ParameterSet::Add(std::string name, ParameterType type, Value value) {
  if (util::IsBlank(name)) {
    throw util::InvalidArgument("parameter name is empty");
  }

  if (auto* existing = Find(name)) {
    existing->name  = std::move(name);
    existing->type  = type;
    existing->value = std::move(value);
    return *existing;
  }

  items_.push_back(Parameter{std::move(name), type, std::move(value)});
  return items_.back();
}

bool ParameterSet::Remove(std::string_view name) {
  auto it = std::find_if(items_.begin(), items_.end(), [&](const Parameter& p) { return util::EqualsIgnoreCase(p.name, name); });
  if (it == items_.end()) return false;
  items_.erase(it);
  return true;
}

bool ParameterSet::Contains(std::string_view name) const {
  return Find(name) != nullptr;
}

const Parameter* ParameterSet::Find(std::string_view name) const {
  for (const auto& p : items_) {
    if (util::EqualsIgnoreCase(p.name, name)) return &p;
  }
  return nullptr;
}

Parameter* ParameterSet::Find(std::string_view name) {
  for (auto& p : items_) {
    if (util::EqualsIgnoreCase(p.name, name)) return &p;
  }
  return nullptr;
}

std::string_view ToString(ParameterType type) {
  switch (type) {
    case ParameterType::kNull:
      return "Null";
    case ParameterType::kInteger:
      return "Integer";
    case ParameterType::kReal:
      return "Real";
    case ParameterType::kText:
      return "Text";
    case ParameterType::kBlob:
      return "Blob";
  }
  return "Unknown";
}

} // namespace dbmgr::db::sql
