#include "sql_value.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace dbmgr::db::sql {

std::optional<std::int64_t> ToInt64(const Value& v) {
  if (const auto* i = std::get_if<std::int64_t>(&v)) {
    return *i;
  }

  if (const auto* d = std::get_if<double>(&v)) {
    if (!std::isfinite(*d) || *d < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
        *d > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(*d);
  }

  if (const auto* s = std::get_if<std::string>(&v)) {
    if (s->empty()) return std::nullopt;
    errno          = 0;
    char*     end  = nullptr;
    long long lval = std::strtoll(s->c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return std::nullopt;
    return static_cast<std::int64_t>(lval);
  }

  return std::nullopt;
}

std::optional<int> ToInt32(const Value& v) {
  auto wide = ToInt64(v);
  if (!wide || *wide < std::numeric_limits<int>::min() || *wide > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(*wide);
}

std::optional<std::string> ToText(const Value& v) {
  if (IsNull(v)) {
    return std::nullopt;
  }
  if (const auto* s = std::get_if<std::string>(&v)) {
    return *s;
  }
  if (const auto* i = std::get_if<std::int64_t>(&v)) {
    return std::to_string(*i);
  }
  if (const auto* d = std::get_if<double>(&v)) {
    return std::to_string(*d);
  }

  static constexpr char kHex[] = "0123456789abcdef";
  const auto&           blob   = std::get<Blob>(v);
  std::string           out;
  out.reserve(blob.size() * 2);
  for (auto byte : blob) {
    out.push_back(kHex[(byte >> 4) & 0x0F]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

std::string ToDisplayString(const Value& v) {
  auto text = ToText(v);
  return text ? *text : "NULL";
}

} // namespace dbmgr::db::sql
