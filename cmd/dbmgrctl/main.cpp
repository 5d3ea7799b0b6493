#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lifecycle/db_state.hpp"
#include "internal/observability/logging.hpp"

using dbmgr::core::DbManager;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dbmgrctl --config <config.yaml> status\n"
            << "  dbmgrctl --config <config.yaml> names\n"
            << "  dbmgrctl --config <config.yaml> run <batch>\n"
            << "  dbmgrctl --config <config.yaml> upgrade [version]\n"
            << "  dbmgrctl --config <config.yaml> backup <file>\n"
            << "  dbmgrctl --config <config.yaml> restore <file>\n"
            << "  dbmgrctl --config <config.yaml> cleanup\n";
}

static std::optional<int> ParseVersion(const std::string& value) {
  try {
    std::size_t consumed = 0;
    int         version  = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return version;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static void PrintStatus(DbManager& manager) {
  std::cout << manager.ToString() << "\n"
            << "min_version=" << manager.MinVersion() << "\n"
            << "max_version=" << manager.MaxVersion() << "\n"
            << "can_upgrade=" << (manager.CanUpgrade() ? "true" : "false") << "\n"
            << "supports_backup=" << (manager.SupportsBackup() ? "true" : "false") << "\n"
            << "supports_restore=" << (manager.SupportsRestore() ? "true" : "false") << "\n"
            << "supports_cleanup=" << (manager.SupportsCleanup() ? "true" : "false") << "\n";
}

static int Run(DbManager& manager, int argc, char** argv) {
  const std::string cmd = argv[3];

  // ------------------------------------------------------------

  if (cmd == "status") {
    PrintStatus(manager);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "names") {
    for (const auto& name : manager.GetBatchNames()) {
      std::cout << name << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    if (argc < 5) return 1;

    auto batch = manager.GetBatch(argv[4]);
    if (!batch) {
      std::cerr << "unknown batch: " << argv[4] << "\n";
      return 2;
    }

    bool ok = manager.ExecuteBatch(*batch, false, true);

    for (std::size_t i = 0; i < batch->Size(); ++i) {
      const auto& command = batch->Commands()[i];
      if (!command->WasExecuted()) continue;

      std::cout << "command " << i << ":";
      for (const auto& value : command->Results()) {
        std::cout << " " << dbmgr::db::sql::ToDisplayString(value);
      }
      std::cout << "\n";
    }

    if (!ok) {
      for (const auto& error : batch->GetErrors()) {
        std::cerr << error << "\n";
      }
      return 2;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upgrade") {
    bool ok = false;
    if (argc >= 5) {
      auto version = ParseVersion(argv[4]);
      if (!version.has_value()) {
        std::cerr << "invalid version: " << argv[4] << "\n";
        return 1;
      }
      ok = manager.Upgrade(*version);
    } else {
      ok = manager.UpgradeToLatest();
    }

    std::cout << manager.ToString() << "\n";
    return ok ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "backup") {
    if (argc < 5) return 1;

    if (!manager.Backup(argv[4])) {
      std::cerr << "backup failed\n";
      return 2;
    }
    std::cout << "backup written\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "restore") {
    if (argc < 5) return 1;

    if (!manager.Restore(argv[4])) {
      std::cerr << "restore failed\n";
      return 2;
    }
    std::cout << manager.ToString() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    if (!manager.Cleanup()) {
      std::cerr << "cleanup failed\n";
      return 2;
    }
    std::cout << "cleanup done\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = dbmgr::config::ConfigLoader::LoadFromYaml(argv[2]);

    dbmgr::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build manager (dependency graph) and detect the database
    // ------------------------------------------------------------
    auto app = dbmgr::factory::Build(config);
    app.manager->Initialize();

    rc = Run(*app.manager, argc, argv);
    if (rc == 1) {
      Usage();
    }

    app.manager->Close();
  } catch (const std::exception& e) {
    DBMGR_LOG_ERROR("Fatal error", {dbmgr::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    dbmgr::observability::ShutdownLogging();
    return 2;
  }

  dbmgr::observability::ShutdownLogging();
  return rc;
}
