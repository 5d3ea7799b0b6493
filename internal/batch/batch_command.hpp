#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_value.hpp"

namespace dbmgr::batch {

enum class TransactionRequirement : std::uint8_t {
  kDontCare = 0,
  kRequired = 1,
  kDisallowed = 2,
};

std::string_view                      ToString(TransactionRequirement requirement);
std::optional<TransactionRequirement> ParseTransactionRequirement(std::string_view text);

/*
  What a callback command sees while it runs.

  transaction is null when the batch runs on a plain connection.
  Setting error marks the command failed without throwing.
*/
struct CallbackContext {
  db::Connection&              connection;
  db::Transaction*             transaction = nullptr;
  db::ExecutionType            execution_type;
  const db::sql::ParameterSet& parameters;
  std::string                  error;
};

using Callback = std::function<db::sql::Values(CallbackContext&)>;

/*
  Single unit of work inside a batch: a script or a callback.

  Requirements (transaction, isolation, execution type) and parameters are
  set by whoever builds the batch. Results, error, exception and the
  executed flag are written by the executor only.
*/
class BatchCommand {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  // Only reachable through FromScript / FromCallback.
  explicit BatchCommand(PrivateTag) {
  }

  static std::shared_ptr<BatchCommand> FromScript(std::string                   script,
                                                  TransactionRequirement        requirement = TransactionRequirement::kDontCare,
                                                  std::optional<db::IsolationLevel> isolation = std::nullopt,
                                                  db::ExecutionType             execution_type = db::ExecutionType::kReader);

  static std::shared_ptr<BatchCommand> FromCallback(Callback                      code,
                                                    TransactionRequirement        requirement = TransactionRequirement::kDontCare,
                                                    std::optional<db::IsolationLevel> isolation = std::nullopt,
                                                    db::ExecutionType             execution_type = db::ExecutionType::kReader);

  const std::optional<std::string>& Script() const {
    return script_;
  }
  const Callback& Code() const {
    return code_;
  }

  // A blank script counts as absent.
  bool HasScript() const;
  bool HasCode() const {
    return static_cast<bool>(code_);
  }

  // Throws util::InvalidCommand unless exactly one of script/code is set.
  void Validate() const;

  TransactionRequirement GetTransactionRequirement() const {
    return transaction_requirement_;
  }
  void SetTransactionRequirement(TransactionRequirement requirement) {
    transaction_requirement_ = requirement;
  }

  std::optional<db::IsolationLevel> GetIsolationLevel() const {
    return isolation_level_;
  }
  void SetIsolationLevel(std::optional<db::IsolationLevel> level) {
    isolation_level_ = level;
  }

  db::ExecutionType GetExecutionType() const {
    return execution_type_;
  }
  void SetExecutionType(db::ExecutionType type) {
    execution_type_ = type;
  }

  db::sql::ParameterSet& Parameters() {
    return parameters_;
  }
  const db::sql::ParameterSet& Parameters() const {
    return parameters_;
  }

  const db::sql::Values& Results() const {
    return results_;
  }

  // First value of Results(), null when there is none.
  db::sql::Value Result() const;

  const std::string& Error() const {
    return error_;
  }
  std::exception_ptr Exception() const {
    return exception_;
  }
  bool WasExecuted() const {
    return was_executed_;
  }
  bool HasFailed() const {
    return !error_.empty() || exception_ != nullptr;
  }

  void RecordSuccess(db::sql::Values results);
  void RecordFailure(std::string error, std::exception_ptr exception);

  // Clears results, error, exception and the executed flag.
  void Reset();

  // Deep, independent copy including parameters and execution state.
  std::shared_ptr<BatchCommand> Clone() const;

  // "script" or "callback" plus requirements, for logs.
  std::string Describe() const;

 private:
  std::optional<std::string>        script_;
  Callback                          code_;
  TransactionRequirement            transaction_requirement_ = TransactionRequirement::kDontCare;
  std::optional<db::IsolationLevel> isolation_level_;
  db::ExecutionType                 execution_type_ = db::ExecutionType::kReader;
  db::sql::ParameterSet             parameters_;

  db::sql::Values    results_;
  std::string        error_;
  std::exception_ptr exception_;
  bool               was_executed_ = false;
};

} // namespace dbmgr::batch
