#include "script_directory_batch_locator.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::locator {

namespace {

std::string ReadUtf8File(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open script file: " + path.string());
  }

  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF && static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    text.erase(0, 3);
  }
  return text;
}

} // namespace

ScriptDirectoryBatchLocator::ScriptDirectoryBatchLocator(std::vector<std::filesystem::path> directories)
    : directories_(std::move(directories)) {
  SetNameFormat(std::string(kDefaultScriptNameFormat));
}

void ScriptDirectoryBatchLocator::SetNameFormat(std::string format) {
  if (util::IsBlank(format)) {
    throw util::InvalidArgument("script name format is empty");
  }

  try {
    name_regex_ = boost::regex(format, boost::regex::perl | boost::regex::icase);
  } catch (const boost::regex_error& e) {
    throw util::InvalidArgument("invalid script name format '" + format + "': " + e.what());
  }
  name_format_ = std::move(format);
}

std::optional<std::string> ScriptDirectoryBatchLocator::NameFromFile(const std::string& file_name) const {
  boost::smatch match;
  if (!boost::regex_search(file_name, match, name_regex_)) {
    return std::nullopt;
  }

  auto name = match["name"].str();
  if (util::IsBlank(name)) {
    return std::nullopt;
  }
  return name;
}

std::vector<ScriptDirectoryBatchLocator::ScriptFile> ScriptDirectoryBatchLocator::Scan() const {
  std::vector<ScriptFile> files;

  for (const auto& directory : directories_) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
      DBMGR_LOG_WARN("Script directory not readable",
                     {observability::StringField("directory", directory.string()), observability::StringField("error", ec.message())});
      continue;
    }

    std::vector<ScriptFile> in_directory;
    for (const auto& entry : it) {
      if (!entry.is_regular_file(ec)) {
        continue;
      }
      if (auto name = NameFromFile(entry.path().filename().string())) {
        in_directory.push_back(ScriptFile{std::move(*name), entry.path()});
      }
    }

    std::sort(in_directory.begin(), in_directory.end(), [](const ScriptFile& a, const ScriptFile& b) { return a.path < b.path; });
    files.insert(files.end(), in_directory.begin(), in_directory.end());
  }

  return files;
}

std::vector<std::string> ScriptDirectoryBatchLocator::ListNames() const {
  std::vector<std::string> names;
  for (auto& file : Scan()) {
    names.push_back(std::move(file.name));
  }
  return names;
}

bool ScriptDirectoryBatchLocator::FillBatch(batch::Batch& batch, const std::string& name, const std::optional<std::string>& separator) const {
  bool found = false;

  for (const auto& file : Scan()) {
    if (!util::EqualsIgnoreCase(file.name, name)) {
      continue;
    }

    DBMGR_LOG_DEBUG("Loading batch script", {observability::StringField("batch", name), observability::StringField("file", file.path.string())});
    AddScriptCommands(batch, ReadUtf8File(file.path), separator, batch::TransactionRequirement::kDontCare, std::nullopt);
    found = true;
  }

  return found;
}

} // namespace dbmgr::locator
