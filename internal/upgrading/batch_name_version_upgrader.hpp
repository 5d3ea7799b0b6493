#pragma once

#include <map>
#include <string>
#include <string_view>

#include <boost/regex.hpp>

#include "internal/upgrading/version_upgrader.hpp"

namespace dbmgr::upgrading {

inline constexpr std::string_view kDefaultUpgradeNameFormat = R"(.+?(?<sourceVersion>\d{4}).*)";

/*
  Upgrade steps taken from located batch names.

  A batch whose name matches the format (case-insensitive, capture
  "sourceVersion") upgrades from that version to the next one. The lowest
  source version is the minimum, the highest plus one the maximum.
  Duplicate source versions and gaps are configuration errors.
*/
class BatchNameVersionUpgrader final : public VersionUpgrader {
 public:
  explicit BatchNameVersionUpgrader(std::string name_format = std::string(kDefaultUpgradeNameFormat));

  int  GetMinVersion(core::DbManager& manager) override;
  int  GetMaxVersion(core::DbManager& manager) override;
  bool Upgrade(core::DbManager& manager, int from_version) override;

  // source version -> batch name. Throws std::runtime_error on duplicates or gaps.
  std::map<int, std::string> GetSteps(core::DbManager& manager) const;

  const std::string& NameFormat() const {
    return name_format_;
  }

 private:
  std::string  name_format_;
  boost::regex name_regex_;
};

} // namespace dbmgr::upgrading
