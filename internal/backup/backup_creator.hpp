#pragma once

#include <string>

#include "internal/core/collaborator.hpp"

namespace dbmgr::backup {

class BackupCreator : public core::Collaborator {
 public:
  virtual bool SupportsBackup() const = 0;
  virtual bool SupportsRestore() const = 0;

  virtual bool Backup(core::DbManager& manager, const std::string& target) = 0;
  virtual bool Restore(core::DbManager& manager, const std::string& source) = 0;
};

} // namespace dbmgr::backup
