#include "batch.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace dbmgr::batch {

namespace {

std::string ExceptionMessage(const std::exception_ptr& ex) {
  try {
    std::rethrow_exception(ex);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

std::string FailureText(const BatchCommand& command) {
  if (!command.Error().empty()) {
    return command.Error();
  }
  return ExceptionMessage(command.Exception());
}

} // namespace

BatchCommand& Batch::AddScript(std::string                       script,
                               TransactionRequirement            requirement,
                               std::optional<db::IsolationLevel> isolation,
                               db::ExecutionType                 execution_type) {
  commands_.push_back(BatchCommand::FromScript(std::move(script), requirement, isolation, execution_type));
  return *commands_.back();
}

BatchCommand& Batch::AddCallback(Callback                          code,
                                 TransactionRequirement            requirement,
                                 std::optional<db::IsolationLevel> isolation,
                                 db::ExecutionType                 execution_type) {
  commands_.push_back(BatchCommand::FromCallback(std::move(code), requirement, isolation, execution_type));
  return *commands_.back();
}

void Batch::AddCommand(CommandPtr command) {
  if (!command) {
    throw util::InvalidArgument("batch command is null");
  }
  commands_.push_back(std::move(command));
}

void Batch::Reset() {
  for (auto& command : commands_) {
    command->Reset();
  }
}

db::Result Batch::CheckRequirements() const {
  const bool required = std::any_of(commands_.begin(), commands_.end(), [](const CommandPtr& c) {
    return c->GetTransactionRequirement() == TransactionRequirement::kRequired;
  });
  const bool disallowed = std::any_of(commands_.begin(), commands_.end(), [](const CommandPtr& c) {
    return c->GetTransactionRequirement() == TransactionRequirement::kDisallowed;
  });

  if (required && disallowed) {
    return db::Result::Err(db::ErrorCode::Conflict, "conflicting transaction requirements in batch '" + name_ + "'");
  }

  std::optional<db::IsolationLevel> level;
  for (const auto& command : commands_) {
    auto current = command->GetIsolationLevel();
    if (!current) continue;
    if (level && *level != *current) {
      return db::Result::Err(db::ErrorCode::Conflict,
                             "conflicting isolation levels in batch '" + name_ + "': " + std::string(db::ToString(*level)) +
                                 " vs " + std::string(db::ToString(*current)));
    }
    level = current;
  }

  return db::Result::Ok();
}

bool Batch::RequiresTransaction() const {
  db::ThrowIfError(CheckRequirements(), "requires transaction");
  return std::any_of(commands_.begin(), commands_.end(), [](const CommandPtr& c) {
    return c->GetTransactionRequirement() == TransactionRequirement::kRequired;
  });
}

bool Batch::DisallowsTransaction() const {
  db::ThrowIfError(CheckRequirements(), "disallows transaction");
  return std::any_of(commands_.begin(), commands_.end(), [](const CommandPtr& c) {
    return c->GetTransactionRequirement() == TransactionRequirement::kDisallowed;
  });
}

std::optional<db::IsolationLevel> Batch::GetIsolationLevel() const {
  db::ThrowIfError(CheckRequirements(), "isolation level");
  for (const auto& command : commands_) {
    if (auto level = command->GetIsolationLevel()) {
      return level;
    }
  }
  return std::nullopt;
}

bool Batch::WasFullyExecuted() const {
  return std::all_of(commands_.begin(), commands_.end(), [](const CommandPtr& c) { return c->WasExecuted(); });
}

bool Batch::WasPartiallyExecuted() const {
  return std::any_of(commands_.begin(), commands_.end(), [](const CommandPtr& c) { return c->WasExecuted(); });
}

bool Batch::HasFailed() const {
  return std::any_of(commands_.begin(), commands_.end(), [](const CommandPtr& c) { return c->HasFailed(); });
}

db::sql::Value Batch::GetResult() const {
  for (auto it = commands_.rbegin(); it != commands_.rend(); ++it) {
    if ((*it)->WasExecuted()) {
      return (*it)->Result();
    }
  }
  return nullptr;
}

db::sql::Values Batch::GetLastResult() const {
  for (auto it = commands_.rbegin(); it != commands_.rend(); ++it) {
    if ((*it)->WasExecuted()) {
      return (*it)->Results();
    }
  }
  return {};
}

db::sql::Values Batch::GetResults() const {
  db::sql::Values out;
  for (const auto& command : commands_) {
    if (!command->WasExecuted()) continue;
    out.insert(out.end(), command->Results().begin(), command->Results().end());
  }
  return out;
}

std::string Batch::GetError() const {
  for (const auto& command : commands_) {
    if (!command->Error().empty()) return command->Error();
  }
  return {};
}

std::vector<std::string> Batch::GetErrors() const {
  std::vector<std::string> out;
  for (const auto& command : commands_) {
    if (!command->Error().empty()) out.push_back(command->Error());
  }
  return out;
}

std::exception_ptr Batch::GetException() const {
  for (const auto& command : commands_) {
    if (command->Exception()) return command->Exception();
  }
  return nullptr;
}

std::vector<std::exception_ptr> Batch::GetExceptions() const {
  std::vector<std::exception_ptr> out;
  for (const auto& command : commands_) {
    if (command->Exception()) out.push_back(command->Exception());
  }
  return out;
}

void Batch::ThrowIfFailed(bool all) const {
  std::string message;
  for (std::size_t i = 0; i < commands_.size(); ++i) {
    const auto& command = *commands_[i];
    if (!command.HasFailed()) continue;

    if (!message.empty()) message += "; ";
    message += "command " + std::to_string(i) + ": " + FailureText(command);
    if (!all) break;
  }

  if (!message.empty()) {
    throw util::BatchError(name_.empty() ? message : name_ + ": " + message);
  }
}

void Batch::RethrowFirstException() const {
  if (auto ex = GetException()) {
    std::rethrow_exception(ex);
  }
}

std::vector<Batch> Batch::SplitCommands(const CommandFilter& filter) const {
  std::vector<Batch> out;
  for (const auto& command : commands_) {
    if (filter && !filter(*command)) continue;
    Batch single(name_);
    single.commands_.push_back(command);
    out.push_back(std::move(single));
  }
  return out;
}

Batch Batch::Clone() const {
  Batch copy(name_);
  copy.commands_.reserve(commands_.size());
  for (const auto& command : commands_) {
    copy.commands_.push_back(command->Clone());
  }
  return copy;
}

} // namespace dbmgr::batch
