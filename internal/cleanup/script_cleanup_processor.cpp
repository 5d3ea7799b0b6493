#include "script_cleanup_processor.hpp"

#include "internal/core/db_manager.hpp"
#include "internal/observability/logging.hpp"

namespace dbmgr::cleanup {

using observability::StringField;

ScriptCleanupProcessor::ScriptCleanupProcessor(std::string custom_batch, std::vector<std::string> default_commands)
    : custom_batch_(std::move(custom_batch)), default_commands_(std::move(default_commands)) {
}

std::vector<std::string> ScriptCleanupProcessor::SqliteDefaultCommands() {
  return {"VACUUM;", "ANALYZE;", "REINDEX;"};
}

std::vector<std::string> ScriptCleanupProcessor::PostgresDefaultCommands() {
  return {"VACUUM ANALYZE;"};
}

bool ScriptCleanupProcessor::Cleanup(core::DbManager& manager) {
  batch::Batch steps("cleanup");

  if (!util::IsBlank(custom_batch_)) {
    auto located = manager.GetBatch(custom_batch_);
    if (!located) {
      DBMGR_LOG_ERROR("Cleanup batch not found", {StringField("batch", custom_batch_)});
      return false;
    }
    steps = std::move(*located);
  } else {
    for (const auto& command : default_commands_) {
      steps.AddScript(command, batch::TransactionRequirement::kDisallowed, std::nullopt, db::ExecutionType::kNonQuery);
    }
  }

  if (steps.IsEmpty()) {
    DBMGR_LOG_ERROR("No cleanup steps available");
    return false;
  }

  DBMGR_LOG_INFO("Beginning database cleanup", {StringField("batch", steps.Name())});
  const bool ok = RunBatch(manager, steps, false, true);
  if (ok) {
    DBMGR_LOG_INFO("Finished database cleanup");
  } else {
    DBMGR_LOG_ERROR("Database cleanup failed", {StringField("error", steps.GetError())});
  }
  return ok;
}

} // namespace dbmgr::cleanup
