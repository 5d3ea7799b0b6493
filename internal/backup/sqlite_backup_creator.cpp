#include "sqlite_backup_creator.hpp"

#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::backup {

using observability::StringField;

SqliteBackupCreator::SqliteBackupCreator(std::shared_ptr<db::sqlite::SqliteConnectionProvider> provider, bool restore_enabled)
    : provider_(std::move(provider)), restore_enabled_(restore_enabled) {
  if (!provider_) {
    throw util::InvalidArgument("sqlite backup creator requires a provider");
  }
}

bool SqliteBackupCreator::Backup(core::DbManager&, const std::string& target) {
  DBMGR_LOG_INFO("Beginning SQLite database backup", {StringField("source", provider_->Options().path), StringField("target", target)});

  try {
    auto source = provider_->OpenDatabase(false);

    db::sqlite::SqliteOpenOptions open;
    open.apply_pragmas = false;
    db::sqlite::SqliteDB destination(target, open);

    auto result = db::sqlite::CopyDatabase(*source, destination);
    if (!result) {
      DBMGR_LOG_ERROR("SQLite database backup failed", {StringField("target", target), StringField("error", result.message)});
      return false;
    }

    // the copied header carries the live journal mode; backups stand alone
    if (auto mode = destination.TryExec("PRAGMA journal_mode=DELETE;"); !mode) {
      DBMGR_LOG_WARN("SQLite backup journal mode not reset", {StringField("target", target), StringField("error", mode.message)});
    }
  } catch (const std::exception& e) {
    DBMGR_LOG_ERROR("SQLite database backup failed", {StringField("target", target), StringField("error", e.what())});
    return false;
  }

  DBMGR_LOG_INFO("Finished SQLite database backup", {StringField("target", target)});
  return true;
}

bool SqliteBackupCreator::Restore(core::DbManager&, const std::string& source) {
  if (!restore_enabled_) {
    throw util::NotSupported("sqlite restore is disabled");
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    DBMGR_LOG_ERROR("SQLite restore source missing", {StringField("source", source)});
    return false;
  }

  DBMGR_LOG_INFO("Beginning SQLite database restore", {StringField("source", source), StringField("target", provider_->Options().path)});

  try {
    db::sqlite::SqliteOpenOptions open;
    open.read_only     = true;
    open.apply_pragmas = false;
    db::sqlite::SqliteDB from(source, open);

    auto live = provider_->OpenDatabase(false);

    auto result = db::sqlite::CopyDatabase(from, *live);
    if (!result) {
      DBMGR_LOG_ERROR("SQLite database restore failed", {StringField("source", source), StringField("error", result.message)});
      return false;
    }
  } catch (const std::exception& e) {
    DBMGR_LOG_ERROR("SQLite database restore failed", {StringField("source", source), StringField("error", e.what())});
    return false;
  }

  DBMGR_LOG_INFO("Finished SQLite database restore", {StringField("source", source)});
  return true;
}

} // namespace dbmgr::backup
