#pragma once

#include "internal/core/collaborator.hpp"

namespace dbmgr::upgrading {

class VersionUpgrader : public core::Collaborator {
 public:
  virtual int GetMinVersion(core::DbManager& manager) = 0;
  virtual int GetMaxVersion(core::DbManager& manager) = 0;

  // Advances exactly one version, from_version -> from_version + 1.
  virtual bool Upgrade(core::DbManager& manager, int from_version) = 0;
};

} // namespace dbmgr::upgrading
