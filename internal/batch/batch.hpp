#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/batch/batch_command.hpp"
#include "internal/db/api/result.hpp"

namespace dbmgr::batch {

/*
  Ordered, mutable sequence of commands executed as one unit against one
  connection or transaction.

  Commands are shared: SplitCommands() hands out batches that point at the
  same command objects, so results written through a split batch are
  visible here too.
*/
class Batch {
 public:
  using CommandPtr    = std::shared_ptr<BatchCommand>;
  using CommandFilter = std::function<bool(const BatchCommand&)>;

  Batch() = default;
  explicit Batch(std::string name) : name_(std::move(name)) {
  }

  const std::string& Name() const {
    return name_;
  }
  void SetName(std::string name) {
    name_ = std::move(name);
  }

  BatchCommand& AddScript(std::string                       script,
                          TransactionRequirement            requirement = TransactionRequirement::kDontCare,
                          std::optional<db::IsolationLevel> isolation = std::nullopt,
                          db::ExecutionType                 execution_type = db::ExecutionType::kReader);

  BatchCommand& AddCallback(Callback                          code,
                            TransactionRequirement            requirement = TransactionRequirement::kDontCare,
                            std::optional<db::IsolationLevel> isolation = std::nullopt,
                            db::ExecutionType                 execution_type = db::ExecutionType::kReader);

  void AddCommand(CommandPtr command);

  const std::vector<CommandPtr>& Commands() const {
    return commands_;
  }
  std::size_t Size() const {
    return commands_.size();
  }
  bool IsEmpty() const {
    return commands_.empty();
  }
  void Clear() {
    commands_.clear();
  }

  void Reset();

  // Non-throwing conflict check; ErrorCode::Conflict on disagreement.
  db::Result CheckRequirements() const;

  // Both throw util::ConflictingRequirement when one command requires a
  // transaction and another disallows it.
  bool RequiresTransaction() const;
  bool DisallowsTransaction() const;

  // The single explicit isolation level, nullopt if none. Two different
  // explicit levels throw util::ConflictingRequirement.
  std::optional<db::IsolationLevel> GetIsolationLevel() const;

  bool WasFullyExecuted() const;
  bool WasPartiallyExecuted() const;
  bool HasFailed() const;

  // Result() of the last executed command; null when nothing ran.
  db::sql::Value GetResult() const;
  // Full value list of the last executed command.
  db::sql::Values GetLastResult() const;
  // Every value of every executed command, in command order.
  db::sql::Values GetResults() const;

  // First non-empty error / every non-empty error.
  std::string              GetError() const;
  std::vector<std::string> GetErrors() const;

  std::exception_ptr              GetException() const;
  std::vector<std::exception_ptr> GetExceptions() const;

  // Throws util::BatchError with the first failure (or all failures) as text.
  void ThrowIfFailed(bool all = false) const;
  // Re-throws the first captured exception object unchanged.
  void RethrowFirstException() const;

  std::vector<Batch> SplitCommands(const CommandFilter& filter = {}) const;

  // Deep copy: every command is cloned.
  Batch Clone() const;

 private:
  std::string             name_;
  std::vector<CommandPtr> commands_;
};

} // namespace dbmgr::batch
