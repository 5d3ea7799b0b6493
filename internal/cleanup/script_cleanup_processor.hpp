#pragma once

#include <string>
#include <vector>

#include "internal/cleanup/cleanup_processor.hpp"

namespace dbmgr::cleanup {

/*
  Runs a located cleanup batch when custom_batch is set, otherwise the
  default maintenance commands, each with transactions disallowed.
*/
class ScriptCleanupProcessor final : public CleanupProcessor {
 public:
  ScriptCleanupProcessor(std::string custom_batch, std::vector<std::string> default_commands);

  static std::vector<std::string> SqliteDefaultCommands();
  static std::vector<std::string> PostgresDefaultCommands();

  bool Cleanup(core::DbManager& manager) override;

 private:
  std::string              custom_batch_;
  std::vector<std::string> default_commands_;
};

} // namespace dbmgr::cleanup
