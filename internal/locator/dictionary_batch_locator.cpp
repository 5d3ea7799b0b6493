#include "dictionary_batch_locator.hpp"

#include "internal/util/errors.hpp"

namespace dbmgr::locator {

void DictionaryBatchLocator::AddScript(const std::string&                name,
                                       std::string                       script,
                                       batch::TransactionRequirement     requirement,
                                       std::optional<db::IsolationLevel> isolation) {
  if (util::IsBlank(name)) {
    throw util::InvalidArgument("batch name is empty");
  }

  Entry entry;
  entry.script      = std::move(script);
  entry.requirement = requirement;
  entry.isolation   = isolation;
  entries_.insert_or_assign(name, std::move(entry));
}

void DictionaryBatchLocator::AddCallback(const std::string&                name,
                                         batch::Callback                   callback,
                                         batch::TransactionRequirement     requirement,
                                         std::optional<db::IsolationLevel> isolation,
                                         db::ExecutionType                 execution_type) {
  if (util::IsBlank(name)) {
    throw util::InvalidArgument("batch name is empty");
  }
  if (!callback) {
    throw util::InvalidArgument("callback for batch '" + name + "' is empty");
  }

  Entry entry;
  entry.callback       = std::move(callback);
  entry.requirement    = requirement;
  entry.isolation      = isolation;
  entry.execution_type = execution_type;
  entries_.insert_or_assign(name, std::move(entry));
}

bool DictionaryBatchLocator::Remove(const std::string& name) {
  return entries_.erase(name) > 0;
}

std::vector<std::string> DictionaryBatchLocator::ListNames() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) {
    names.push_back(name);
  }
  return names;
}

bool DictionaryBatchLocator::FillBatch(batch::Batch& batch, const std::string& name, const std::optional<std::string>& separator) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    return false;
  }

  const auto& entry = it->second;
  if (entry.script) {
    AddScriptCommands(batch, *entry.script, separator, entry.requirement, entry.isolation);
    return true;
  }

  batch.AddCallback(entry.callback, entry.requirement, entry.isolation, entry.execution_type);
  return true;
}

} // namespace dbmgr::locator
