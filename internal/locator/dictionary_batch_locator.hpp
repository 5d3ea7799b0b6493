#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/locator/batch_locator.hpp"

namespace dbmgr::locator {

/*
  In-memory batches keyed by name.

  A name holds either a script (split into commands) or a callback.
  Registering one replaces the other under the same name.
*/
class DictionaryBatchLocator final : public BatchLocatorBase {
 public:
  void AddScript(const std::string&                name,
                 std::string                       script,
                 batch::TransactionRequirement     requirement = batch::TransactionRequirement::kDontCare,
                 std::optional<db::IsolationLevel> isolation   = std::nullopt);

  void AddCallback(const std::string&                name,
                   batch::Callback                   callback,
                   batch::TransactionRequirement     requirement    = batch::TransactionRequirement::kDontCare,
                   std::optional<db::IsolationLevel> isolation      = std::nullopt,
                   db::ExecutionType                 execution_type = db::ExecutionType::kReader);

  bool Remove(const std::string& name);
  void Clear() {
    entries_.clear();
  }

 protected:
  std::vector<std::string> ListNames() const override;
  bool FillBatch(batch::Batch& batch, const std::string& name, const std::optional<std::string>& separator) const override;

 private:
  struct Entry {
    std::optional<std::string>        script;
    batch::Callback                   callback;
    batch::TransactionRequirement     requirement = batch::TransactionRequirement::kDontCare;
    std::optional<db::IsolationLevel> isolation;
    db::ExecutionType                 execution_type = db::ExecutionType::kReader;
  };

  std::map<std::string, Entry, util::CaseInsensitiveLess> entries_;
};

} // namespace dbmgr::locator
