#include "batch_name_version_upgrader.hpp"

#include <stdexcept>

#include "internal/core/db_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::upgrading {

using observability::IntField;
using observability::StringField;

BatchNameVersionUpgrader::BatchNameVersionUpgrader(std::string name_format) : name_format_(std::move(name_format)) {
  if (util::IsBlank(name_format_)) {
    throw util::InvalidArgument("upgrade batch name format is empty");
  }

  try {
    name_regex_ = boost::regex(name_format_, boost::regex::perl | boost::regex::icase);
  } catch (const boost::regex_error& e) {
    throw util::InvalidArgument("invalid upgrade batch name format '" + name_format_ + "': " + e.what());
  }
}

std::map<int, std::string> BatchNameVersionUpgrader::GetSteps(core::DbManager& manager) const {
  std::map<int, std::string> steps;

  for (const auto& candidate : manager.GetBatchNames()) {
    boost::smatch match;
    if (!boost::regex_search(candidate, match, name_regex_)) {
      continue;
    }

    const auto text = match["sourceVersion"].str();
    if (text.empty()) {
      continue;
    }

    int source_version = 0;
    try {
      source_version = std::stoi(text);
    } catch (const std::exception&) {
      DBMGR_LOG_WARN("Ignoring upgrade batch with unusable version", {StringField("batch", candidate)});
      continue;
    }

    auto [it, inserted] = steps.emplace(source_version, candidate);
    if (!inserted) {
      throw std::runtime_error("multiple upgrade batches apply to source version " + std::to_string(source_version) + ": '" + it->second +
                               "' and '" + candidate + "'");
    }
  }

  int expected = steps.empty() ? 0 : steps.begin()->first;
  for (const auto& [version, name] : steps) {
    if (version != expected) {
      throw std::runtime_error("upgrade batches are not contiguous: missing source version " + std::to_string(expected));
    }
    ++expected;
  }

  return steps;
}

int BatchNameVersionUpgrader::GetMinVersion(core::DbManager& manager) {
  auto steps = GetSteps(manager);
  return steps.empty() ? -1 : steps.begin()->first;
}

int BatchNameVersionUpgrader::GetMaxVersion(core::DbManager& manager) {
  auto steps = GetSteps(manager);
  return steps.empty() ? -1 : steps.rbegin()->first + 1;
}

bool BatchNameVersionUpgrader::Upgrade(core::DbManager& manager, int from_version) {
  auto steps = GetSteps(manager);
  if (steps.empty()) {
    throw util::InvalidState("no upgrade batches match the name format '" + name_format_ + "'");
  }

  auto it = steps.find(from_version);
  if (it == steps.end()) {
    throw util::OutOfRange("source version " + std::to_string(from_version) + " is not within the supported range (" +
                           std::to_string(steps.begin()->first) + "..." + std::to_string(steps.rbegin()->first) + ")");
  }

  auto batch = manager.GetBatch(it->second);
  if (!batch) {
    DBMGR_LOG_ERROR("Upgrade batch vanished", {StringField("batch", it->second)});
    return false;
  }

  DBMGR_LOG_INFO("Beginning version upgrade step", {IntField("from", from_version), IntField("to", from_version + 1), StringField("batch", it->second)});
  const bool ok = RunBatch(manager, *batch, false, true);
  if (ok) {
    DBMGR_LOG_INFO("Finished version upgrade step", {IntField("from", from_version), IntField("to", from_version + 1)});
  } else {
    DBMGR_LOG_ERROR("Failed version upgrade step", {IntField("from", from_version), IntField("to", from_version + 1), StringField("error", batch->GetError())});
  }
  return ok;
}

} // namespace dbmgr::upgrading
