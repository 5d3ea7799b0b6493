#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dbmgr::util {

/*
  ASCII case-insensitive helpers. Batch names, parameter names and
  directive keys are all compared this way.
*/

std::string ToLower(std::string_view s);
bool        EqualsIgnoreCase(std::string_view a, std::string_view b);
std::string Trim(std::string_view s);
bool        IsBlank(std::string_view s);

struct CaseInsensitiveLess {
  bool operator()(const std::string& a, const std::string& b) const;
};

struct CaseInsensitiveHash {
  std::size_t operator()(const std::string& s) const;
};

struct CaseInsensitiveEqual {
  bool operator()(const std::string& a, const std::string& b) const {
    return EqualsIgnoreCase(a, b);
  }
};

} // namespace dbmgr::util
