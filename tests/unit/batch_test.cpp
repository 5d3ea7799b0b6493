#include "internal/batch/batch.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using dbmgr::batch::Batch;
using dbmgr::batch::BatchCommand;
using dbmgr::batch::CallbackContext;
using dbmgr::batch::TransactionRequirement;
using dbmgr::db::ExecutionType;
using dbmgr::db::IsolationLevel;
using dbmgr::db::sql::ParameterType;
using dbmgr::db::sql::Value;
using dbmgr::db::sql::Values;

bool ThrowsConflict(const Batch& batch) {
  bool requires_threw  = false;
  bool disallows_threw = false;
  bool isolation_threw = false;
  try {
    (void)batch.RequiresTransaction();
  } catch (const dbmgr::util::ConflictingRequirement&) {
    requires_threw = true;
  }
  try {
    (void)batch.DisallowsTransaction();
  } catch (const dbmgr::util::ConflictingRequirement&) {
    disallows_threw = true;
  }
  try {
    (void)batch.GetIsolationLevel();
  } catch (const dbmgr::util::ConflictingRequirement&) {
    isolation_threw = true;
  }
  return requires_threw && disallows_threw && isolation_threw;
}

void TestRequiredAndDontCare() {
  Batch batch("mixed");
  batch.AddScript("A", TransactionRequirement::kRequired);
  batch.AddScript("B", TransactionRequirement::kDontCare);

  assert(batch.RequiresTransaction());
  assert(!batch.DisallowsTransaction());
  assert(batch.CheckRequirements());
}

void TestConflictInEveryOrdering() {
  Batch first("required-first");
  first.AddScript("A", TransactionRequirement::kRequired);
  first.AddScript("B", TransactionRequirement::kDisallowed);

  Batch second("disallowed-first");
  second.AddScript("B", TransactionRequirement::kDisallowed);
  second.AddScript("C", TransactionRequirement::kDontCare);
  second.AddScript("A", TransactionRequirement::kRequired);

  assert(ThrowsConflict(first));
  assert(ThrowsConflict(second));

  auto result = first.CheckRequirements();
  assert(!result);
  assert(result.code == dbmgr::db::ErrorCode::Conflict);
}

void TestIsolationLevels() {
  Batch same;
  same.AddScript("A", TransactionRequirement::kRequired, IsolationLevel::kSerializable);
  same.AddScript("B");
  same.AddScript("C", TransactionRequirement::kDontCare, IsolationLevel::kSerializable);
  assert(same.GetIsolationLevel() == IsolationLevel::kSerializable);

  Batch none;
  none.AddScript("A");
  assert(!none.GetIsolationLevel().has_value());

  Batch conflicting;
  conflicting.AddScript("A", TransactionRequirement::kRequired, IsolationLevel::kSerializable);
  conflicting.AddScript("B", TransactionRequirement::kRequired, IsolationLevel::kReadCommitted);

  bool threw = false;
  try {
    (void)conflicting.GetIsolationLevel();
  } catch (const dbmgr::util::ConflictingRequirement&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyBatchQueries() {
  Batch batch;
  assert(batch.IsEmpty());
  assert(!batch.RequiresTransaction());
  assert(!batch.WasPartiallyExecuted());
  assert(!batch.HasFailed());
  assert(dbmgr::db::sql::IsNull(batch.GetResult()));
  assert(batch.GetResults().empty());
  assert(batch.GetError().empty());
  assert(batch.GetErrors().empty());
  assert(batch.GetException() == nullptr);
  assert(batch.GetExceptions().empty());
  batch.ThrowIfFailed(true);
}

void TestResultsAndExecutionFlags() {
  Batch batch("results");
  auto& a = batch.AddScript("A");
  auto& b = batch.AddScript("B");
  batch.AddScript("C");

  a.RecordSuccess({Value(std::int64_t{1}), Value(std::string("x"))});
  b.RecordSuccess({Value(2.5)});

  assert(batch.WasPartiallyExecuted());
  assert(!batch.WasFullyExecuted());
  assert(std::get<double>(batch.GetResult()) == 2.5);
  assert(batch.GetLastResult().size() == 1);
  assert(batch.GetResults().size() == 3);
  assert(std::get<std::int64_t>(batch.GetResults()[0]) == 1);
  assert(std::get<std::string>(batch.GetResults()[1]) == "x");
}

void TestResetIsIdempotent() {
  Batch batch("reset");
  auto& a = batch.AddScript("A");
  auto& b = batch.AddScript("B");
  a.RecordSuccess({Value(std::int64_t{7})});
  b.RecordFailure("boom", std::make_exception_ptr(std::runtime_error("boom")));

  batch.Reset();
  const bool partially = batch.WasPartiallyExecuted();
  const bool failed    = batch.HasFailed();
  const auto results   = batch.GetResults().size();

  batch.Reset();
  assert(batch.WasPartiallyExecuted() == partially);
  assert(batch.HasFailed() == failed);
  assert(batch.GetResults().size() == results);

  assert(!partially);
  assert(!failed);
  assert(results == 0);
  assert(a.Results().empty());
  assert(b.Error().empty());
  assert(b.Exception() == nullptr);
}

void TestSplitSharesCommands() {
  Batch batch("split");
  batch.AddScript("A", TransactionRequirement::kRequired);
  batch.AddScript("B");
  batch.AddScript("C", TransactionRequirement::kRequired);

  auto all = batch.SplitCommands();
  assert(all.size() == 3);
  assert(all[1].Size() == 1);
  assert(all[1].Commands()[0] == batch.Commands()[1]);
  assert(all[1].Name() == "split");

  all[2].Commands()[0]->RecordSuccess({Value(std::int64_t{3})});
  assert(batch.Commands()[2]->WasExecuted());

  auto required = batch.SplitCommands([](const dbmgr::batch::BatchCommand& c) {
    return c.GetTransactionRequirement() == TransactionRequirement::kRequired;
  });
  assert(required.size() == 2);
  assert(required[0].Commands()[0] == batch.Commands()[0]);
  assert(required[1].Commands()[0] == batch.Commands()[2]);
}

void TestCloneIsDeep() {
  Batch batch("clone");
  auto& a = batch.AddScript("SELECT :id;", TransactionRequirement::kRequired, IsolationLevel::kSnapshot, ExecutionType::kScalar);
  a.Parameters().Add("id", ParameterType::kInteger, std::int64_t{5});
  a.RecordSuccess({Value(std::int64_t{5})});

  auto copy = batch.Clone();
  assert(copy.Size() == 1);
  assert(copy.Commands()[0] != batch.Commands()[0]);

  const auto& cloned = *copy.Commands()[0];
  assert(*cloned.Script() == "SELECT :id;");
  assert(cloned.GetTransactionRequirement() == TransactionRequirement::kRequired);
  assert(cloned.GetIsolationLevel() == IsolationLevel::kSnapshot);
  assert(cloned.GetExecutionType() == ExecutionType::kScalar);
  assert(cloned.WasExecuted());
  assert(cloned.Parameters().Contains("ID"));

  copy.Commands()[0]->Parameters().Add("other", ParameterType::kText, std::string("x"));
  copy.Reset();
  assert(a.WasExecuted());
  assert(!a.Parameters().Contains("other"));
}

void TestCommandFactories() {
  auto script = BatchCommand::FromScript("SELECT 1;", TransactionRequirement::kDisallowed);
  assert(script->HasScript());
  assert(!script->HasCode());
  assert(script->GetTransactionRequirement() == TransactionRequirement::kDisallowed);
  assert(script.use_count() == 1);

  auto callback = BatchCommand::FromCallback([](CallbackContext&) { return Values{}; }, TransactionRequirement::kDontCare, std::nullopt,
                                             ExecutionType::kNonQuery);
  assert(callback->HasCode());
  assert(!callback->HasScript());
  assert(callback->GetExecutionType() == ExecutionType::kNonQuery);

  auto copy = script->Clone();
  assert(copy != script);
  assert(*copy->Script() == "SELECT 1;");
  copy->RecordFailure("boom", nullptr);
  assert(!script->WasExecuted());
}

void TestThrowIfFailed() {
  Batch batch("failing");
  auto& a = batch.AddScript("A");
  auto& b = batch.AddCallback([](CallbackContext&) { return Values{}; });
  auto& c = batch.AddScript("C");

  a.RecordSuccess({});
  b.RecordFailure("soft failure", nullptr);
  c.RecordFailure("hard failure", std::make_exception_ptr(std::logic_error("hard failure")));

  assert(batch.HasFailed());
  assert(batch.GetError() == "soft failure");
  assert(batch.GetErrors().size() == 2);
  assert(batch.GetExceptions().size() == 1);

  std::string first;
  try {
    batch.ThrowIfFailed();
  } catch (const dbmgr::util::BatchError& e) {
    first = e.what();
  }
  assert(first.find("command 1: soft failure") != std::string::npos);
  assert(first.find("hard failure") == std::string::npos);

  std::string all;
  try {
    batch.ThrowIfFailed(true);
  } catch (const dbmgr::util::BatchError& e) {
    all = e.what();
  }
  assert(all.find("command 1: soft failure") != std::string::npos);
  assert(all.find("command 2: hard failure") != std::string::npos);

  bool rethrown = false;
  try {
    batch.RethrowFirstException();
  } catch (const std::logic_error& e) {
    rethrown = std::string(e.what()) == "hard failure";
  }
  assert(rethrown);
}

void TestValidateCommand() {
  Batch batch;
  auto& blank = batch.AddScript("   ");
  auto& good  = batch.AddScript("SELECT 1;");

  good.Validate();

  bool threw = false;
  try {
    blank.Validate();
  } catch (const dbmgr::util::InvalidCommand&) {
    threw = true;
  }
  assert(threw);
}

void TestParametersAreUniqueByName() {
  Batch batch;
  auto& command = batch.AddScript("SELECT :name;");
  command.Parameters().Add("name", ParameterType::kText, std::string("a"));
  command.Parameters().Add("NAME", ParameterType::kInteger, std::int64_t{2});

  assert(command.Parameters().Size() == 1);
  const auto* parameter = command.Parameters().Find("Name");
  assert(parameter != nullptr);
  assert(parameter->type == ParameterType::kInteger);
  assert(command.Parameters().Remove("name"));
  assert(command.Parameters().Empty());
}

} // namespace

int main() {
  TestRequiredAndDontCare();
  TestConflictInEveryOrdering();
  TestIsolationLevels();
  TestEmptyBatchQueries();
  TestResultsAndExecutionFlags();
  TestResetIsIdempotent();
  TestSplitSharesCommands();
  TestCloneIsDeep();
  TestCommandFactories();
  TestThrowIfFailed();
  TestValidateCommand();
  TestParametersAreUniqueByName();

  std::cout << "dbmgr_unit_batch: pass\n";
  return 0;
}
