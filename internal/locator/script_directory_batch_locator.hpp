#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "internal/locator/batch_locator.hpp"

namespace dbmgr::locator {

inline constexpr std::string_view kDefaultScriptNameFormat = R"(^(?<name>.+?)\.sql$)";

/*
  Batches stored as UTF-8 script files.

  Every regular file directly inside one of the directories whose file
  name matches the name format (case-insensitive, capture "name") is a
  batch. Files resolving to the same name are appended in directory order.
*/
class ScriptDirectoryBatchLocator final : public BatchLocatorBase {
 public:
  explicit ScriptDirectoryBatchLocator(std::vector<std::filesystem::path> directories = {});

  void AddDirectory(std::filesystem::path directory) {
    directories_.push_back(std::move(directory));
  }
  const std::vector<std::filesystem::path>& Directories() const {
    return directories_;
  }

  const std::string& NameFormat() const {
    return name_format_;
  }
  void SetNameFormat(std::string format);

 protected:
  std::vector<std::string> ListNames() const override;
  bool FillBatch(batch::Batch& batch, const std::string& name, const std::optional<std::string>& separator) const override;

 private:
  struct ScriptFile {
    std::string           name;
    std::filesystem::path path;
  };

  std::vector<ScriptFile>    Scan() const;
  std::optional<std::string> NameFromFile(const std::string& file_name) const;

  std::vector<std::filesystem::path> directories_;
  std::string                        name_format_;
  boost::regex                       name_regex_;
};

} // namespace dbmgr::locator
