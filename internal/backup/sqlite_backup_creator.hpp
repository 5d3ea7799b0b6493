#pragma once

#include <memory>
#include <string>

#include "internal/backup/backup_creator.hpp"
#include "internal/db/sqlite/sqlite_provider.hpp"

namespace dbmgr::backup {

/*
  File backups of an SQLite database through the online backup API.

  Backup copies the live database into the target file (created or
  overwritten). Restore copies a backup file back into the live database.
*/
class SqliteBackupCreator final : public BackupCreator {
 public:
  explicit SqliteBackupCreator(std::shared_ptr<db::sqlite::SqliteConnectionProvider> provider, bool restore_enabled = true);

  bool SupportsBackup() const override {
    return true;
  }
  bool SupportsRestore() const override {
    return restore_enabled_;
  }

  bool Backup(core::DbManager& manager, const std::string& target) override;
  bool Restore(core::DbManager& manager, const std::string& source) override;

 private:
  std::shared_ptr<db::sqlite::SqliteConnectionProvider> provider_;
  bool                                                  restore_enabled_;
};

} // namespace dbmgr::backup
