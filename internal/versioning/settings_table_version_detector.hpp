#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/batch/batch.hpp"
#include "internal/versioning/version_detector.hpp"

namespace dbmgr::versioning {

/*
  Reads the schema version from a key/value settings table.

  The probe is three scalar commands run one at a time:
    1. does the settings table exist (count)
    2. does the version row exist (count)
    3. the version value
  The first result <= 0 ends the probe and becomes the version, so a
  database without the table is version 0 (New).

  A custom detection batch replaces the probe; its commands are run the
  same way and the last result is the version.
*/
class SettingsTableVersionDetector final : public VersionDetector {
 public:
  enum class Dialect {
    kSqlite,
    kPostgres,
  };

  struct Options {
    std::string settings_table = "_DatabaseSettings";
    std::string name_column    = "Name";
    std::string value_column   = "Value";
    std::string version_key    = "Database.Version";

    // Name of a located batch used instead of the built-in probe.
    std::string custom_detection_batch;

    // SQLite only: a missing or empty file is version 0 without opening it.
    std::optional<std::filesystem::path> database_file;
  };

  explicit SettingsTableVersionDetector(Options options, Dialect dialect = Dialect::kSqlite);

  DetectionResult Detect(core::DbManager& manager) override;

  batch::Batch BuildProbeBatch() const;

  const Options& GetOptions() const {
    return options_;
  }

 private:
  std::optional<batch::Batch> DetectionBatch(core::DbManager& manager) const;

  Options options_;
  Dialect dialect_;
};

} // namespace dbmgr::versioning
