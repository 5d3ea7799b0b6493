#include "batch_command.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace dbmgr::batch {

std::string_view ToString(TransactionRequirement requirement) {
  switch (requirement) {
    case TransactionRequirement::kDontCare:
      return "DontCare";
    case TransactionRequirement::kRequired:
      return "Required";
    case TransactionRequirement::kDisallowed:
      return "Disallowed";
  }
  return "Unknown";
}

std::optional<TransactionRequirement> ParseTransactionRequirement(std::string_view text) {
  for (auto requirement : {TransactionRequirement::kDontCare, TransactionRequirement::kRequired, TransactionRequirement::kDisallowed}) {
    if (util::EqualsIgnoreCase(ToString(requirement), text)) {
      return requirement;
    }
  }
  return std::nullopt;
}

std::shared_ptr<BatchCommand> BatchCommand::FromScript(std::string                       script,
                                                       TransactionRequirement            requirement,
                                                       std::optional<db::IsolationLevel> isolation,
                                                       db::ExecutionType                 execution_type) {
  auto command = std::make_shared<BatchCommand>(PrivateTag{});
  command->script_                  = std::move(script);
  command->transaction_requirement_ = requirement;
  command->isolation_level_         = isolation;
  command->execution_type_          = execution_type;
  return command;
}

std::shared_ptr<BatchCommand> BatchCommand::FromCallback(Callback                          code,
                                                         TransactionRequirement            requirement,
                                                         std::optional<db::IsolationLevel> isolation,
                                                         db::ExecutionType                 execution_type) {
  auto command = std::make_shared<BatchCommand>(PrivateTag{});
  command->code_                    = std::move(code);
  command->transaction_requirement_ = requirement;
  command->isolation_level_         = isolation;
  command->execution_type_          = execution_type;
  return command;
}

bool BatchCommand::HasScript() const {
  return script_.has_value() && !util::IsBlank(*script_);
}

void BatchCommand::Validate() const {
  const bool script = HasScript();
  const bool code   = HasCode();
  if (script && code) {
    throw util::InvalidCommand("batch command has both a script and a callback");
  }
  if (!script && !code) {
    throw util::InvalidCommand("batch command has neither a script nor a callback");
  }
}

db::sql::Value BatchCommand::Result() const {
  if (results_.empty()) {
    return nullptr;
  }
  return results_.front();
}

void BatchCommand::RecordSuccess(db::sql::Values results) {
  results_      = std::move(results);
  error_.clear();
  exception_    = nullptr;
  was_executed_ = true;
}

void BatchCommand::RecordFailure(std::string error, std::exception_ptr exception) {
  error_        = std::move(error);
  exception_    = std::move(exception);
  was_executed_ = true;
}

void BatchCommand::Reset() {
  results_.clear();
  error_.clear();
  exception_    = nullptr;
  was_executed_ = false;
}

std::shared_ptr<BatchCommand> BatchCommand::Clone() const {
  return std::make_shared<BatchCommand>(*this);
}

std::string BatchCommand::Describe() const {
  std::string out = HasCode() ? "callback" : "script";
  out += " tx=";
  out += ToString(transaction_requirement_);
  if (isolation_level_) {
    out += " isolation=";
    out += db::ToString(*isolation_level_);
  }
  out += " exec=";
  out += db::ToString(execution_type_);
  return out;
}

} // namespace dbmgr::batch
