#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/backup/sqlite_backup_creator.hpp"
#include "internal/cleanup/script_cleanup_processor.hpp"
#include "internal/db/sqlite/sqlite_provider.hpp"
#include "internal/locator/script_directory_batch_locator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/upgrading/batch_name_version_upgrader.hpp"
#include "internal/versioning/settings_table_version_detector.hpp"
#if DBMGR_WITH_POSTGRES
#include "internal/db/postgres/pg_provider.hpp"
#endif

namespace dbmgr::factory {

namespace {

using versioning::SettingsTableVersionDetector;

std::string OrDefault(const std::string& value, std::string fallback) {
  return value.empty() ? std::move(fallback) : value;
}

SettingsTableVersionDetector::Options DetectorOptions(const dbmgr::runtime::config::ManagerConfig& config) {
  const auto&                           versioning = config.versioning();
  SettingsTableVersionDetector::Options defaults;
  SettingsTableVersionDetector::Options options;

  options.settings_table         = OrDefault(versioning.settings_table(), defaults.settings_table);
  options.name_column            = OrDefault(versioning.name_column(), defaults.name_column);
  options.value_column           = OrDefault(versioning.value_column(), defaults.value_column);
  options.version_key            = OrDefault(versioning.version_key(), defaults.version_key);
  options.custom_detection_batch = versioning.custom_detection_batch();
  return options;
}

std::shared_ptr<locator::ScriptDirectoryBatchLocator> BuildScriptLocator(const dbmgr::runtime::config::BatchesConfig& batches) {
  if (batches.script_directories().empty()) {
    return nullptr;
  }

  std::vector<std::filesystem::path> directories(batches.script_directories().begin(), batches.script_directories().end());
  auto scripts = std::make_shared<locator::ScriptDirectoryBatchLocator>(std::move(directories));

  if (!batches.script_name_format().empty()) {
    scripts->SetNameFormat(batches.script_name_format());
  }
  if (!batches.command_separator().empty()) {
    scripts->SetCommandSeparator(batches.command_separator());
  }
  if (!batches.option_format().empty()) {
    scripts->SetOptionFormat(batches.option_format());
  }
  return scripts;
}

} // namespace

/*
    Build full manager dependency graph
*/
Application Build(const dbmgr::runtime::config::ManagerConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Batch sources
  // ------------------------------------------------------------------
  app.callbacks     = std::make_shared<locator::CallbackRegistryBatchLocator>();
  app.batch_locator = std::make_shared<locator::AggregateBatchLocator>();

  if (auto scripts = BuildScriptLocator(config.batches())) {
    app.batch_locator->Add(std::move(scripts));
  }
  app.batch_locator->Add(app.callbacks);

  // ------------------------------------------------------------------
  // Backend
  // ------------------------------------------------------------------
  core::ManagerComponents components;
  components.batch_locator = app.batch_locator;

  auto detector_options = DetectorOptions(config);
  auto dialect          = SettingsTableVersionDetector::Dialect::kSqlite;
  auto cleanup_commands = cleanup::ScriptCleanupProcessor::SqliteDefaultCommands();

  const auto& database = config.database();
  if (database.has_sqlite()) {
    db::sqlite::SqliteProviderOptions options;
    options.path                = database.sqlite().path();
    options.read_only_supported = database.sqlite().read_only_supported();
    if (database.sqlite().busy_timeout_ms() != 0) {
      options.busy_timeout_ms = database.sqlite().busy_timeout_ms();
    }

    auto provider                  = std::make_shared<db::sqlite::SqliteConnectionProvider>(options);
    detector_options.database_file = std::filesystem::path(options.path);
    components.provider            = provider;

    if (config.backup().enabled()) {
      components.backup_creator = std::make_shared<backup::SqliteBackupCreator>(provider);
    }
  } else if (database.has_postgres()) {
#if DBMGR_WITH_POSTGRES
    components.provider = std::make_shared<db::postgres::PgConnectionProvider>(database.postgres().connection_uri());
    dialect             = SettingsTableVersionDetector::Dialect::kPostgres;
    cleanup_commands    = cleanup::ScriptCleanupProcessor::PostgresDefaultCommands();

    if (config.backup().enabled()) {
      DBMGR_LOG_WARN("Backups are not available for postgres targets");
    }
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  } else {
    throw std::runtime_error("no database backend configured");
  }

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  components.version_detector = std::make_shared<SettingsTableVersionDetector>(std::move(detector_options), dialect);

  if (config.upgrading().enabled()) {
    components.version_upgrader = std::make_shared<upgrading::BatchNameVersionUpgrader>(
        OrDefault(config.upgrading().batch_name_format(), std::string(upgrading::kDefaultUpgradeNameFormat)));
  }

  if (config.cleanup().enabled()) {
    components.cleanup_processor = std::make_shared<cleanup::ScriptCleanupProcessor>(config.cleanup().custom_batch(), std::move(cleanup_commands));
  }

  app.manager = std::make_shared<core::DbManager>(std::move(components));
  return app;
}

} // namespace dbmgr::factory
