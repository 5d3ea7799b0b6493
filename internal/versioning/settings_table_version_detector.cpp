#include "settings_table_version_detector.hpp"

#include <system_error>

#include "internal/core/db_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::versioning {

using observability::IntField;
using observability::StringField;

namespace {

std::string Quote(const std::string& identifier) {
  std::string out = "\"";
  for (char c : identifier) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

bool DatabaseFileMissingOrEmpty(const std::filesystem::path& file) {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec) || ec) {
    return true;
  }
  const auto size = std::filesystem::file_size(file, ec);
  return !ec && size == 0;
}

} // namespace

SettingsTableVersionDetector::SettingsTableVersionDetector(Options options, Dialect dialect) : options_(std::move(options)), dialect_(dialect) {
  if (options_.custom_detection_batch.empty()) {
    if (util::IsBlank(options_.settings_table) || util::IsBlank(options_.name_column) || util::IsBlank(options_.value_column) ||
        util::IsBlank(options_.version_key)) {
      throw util::InvalidArgument("settings table detector requires table, column and key names");
    }
  }
}

batch::Batch SettingsTableVersionDetector::BuildProbeBatch() const {
  using db::ExecutionType;
  using db::sql::ParameterType;

  const auto table = Quote(options_.settings_table);
  const auto name  = Quote(options_.name_column);
  const auto value = Quote(options_.value_column);

  const bool        sqlite = dialect_ == Dialect::kSqlite;
  const std::string key    = sqlite ? ":key" : "$1";

  batch::Batch probe("version-detection");

  auto& table_exists =
      probe.AddScript(sqlite ? "SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = :key;"
                             : "SELECT count(*) FROM information_schema.tables WHERE table_schema = current_schema() AND table_name = $1;",
                      batch::TransactionRequirement::kDontCare, std::nullopt, ExecutionType::kScalar);
  table_exists.Parameters().Add("key", ParameterType::kText, options_.settings_table);

  auto& row_exists = probe.AddScript("SELECT count(*) FROM " + table + " WHERE " + name + " = " + key + ";", batch::TransactionRequirement::kDontCare,
                                     std::nullopt, ExecutionType::kScalar);
  row_exists.Parameters().Add("key", ParameterType::kText, options_.version_key);

  auto& read_value = probe.AddScript("SELECT " + value + " FROM " + table + " WHERE " + name + " = " + key + ";",
                                     batch::TransactionRequirement::kDontCare, std::nullopt, ExecutionType::kScalar);
  read_value.Parameters().Add("key", ParameterType::kText, options_.version_key);

  return probe;
}

std::optional<batch::Batch> SettingsTableVersionDetector::DetectionBatch(core::DbManager& manager) const {
  if (options_.custom_detection_batch.empty()) {
    return BuildProbeBatch();
  }
  return manager.GetBatch(options_.custom_detection_batch);
}

DetectionResult SettingsTableVersionDetector::Detect(core::DbManager& manager) {
  if (options_.database_file && DatabaseFileMissingOrEmpty(*options_.database_file)) {
    DBMGR_LOG_DEBUG("Database file missing or empty", {StringField("file", options_.database_file->string())});
    return DetectionResult{true, std::nullopt, 0};
  }

  auto detection = DetectionBatch(manager);
  if (!detection) {
    DBMGR_LOG_ERROR("Version detection batch not found", {StringField("batch", options_.custom_detection_batch)});
    return DetectionResult{};
  }

  const bool read_only = manager.SupportsReadOnly();

  int version = -1;
  for (auto& step : detection->SplitCommands()) {
    if (!RunBatch(manager, step, read_only, false)) {
      DBMGR_LOG_ERROR("Version detection step failed", {StringField("error", step.GetError())});
      return DetectionResult{};
    }

    version = db::sql::ToInt32(step.GetResult()).value_or(-1);
    if (version <= 0) {
      break;
    }
  }

  DBMGR_LOG_DEBUG("Version detected", {IntField("version", version)});
  return DetectionResult{true, std::nullopt, version};
}

} // namespace dbmgr::versioning
