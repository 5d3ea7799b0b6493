#include "internal/core/db_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "internal/locator/dictionary_batch_locator.hpp"
#include "internal/util/errors.hpp"

namespace {

using dbmgr::batch::Batch;
using dbmgr::batch::CallbackContext;
using dbmgr::batch::TransactionRequirement;
using dbmgr::core::DbManager;
using dbmgr::core::ManagerComponents;
using dbmgr::db::ExecutionType;
using dbmgr::db::IsolationLevel;
using dbmgr::db::sql::Value;
using dbmgr::db::sql::Values;
using dbmgr::lifecycle::DbState;
using dbmgr::versioning::DetectionResult;

// ------------------------------------------------------------
// In-memory stand-ins for the database and its collaborators
// ------------------------------------------------------------

struct FakeDatabase {
  bool success = true;
  int  version = 1;

  std::vector<std::string> executed;

  int  connections  = 0;
  int  transactions = 0;
  int  commits      = 0;
  int  rollbacks    = 0;
  bool refuse       = false;
  bool fail_commit  = false;

  std::optional<IsolationLevel> last_isolation;
};

class FakeConnection final : public dbmgr::db::Connection {
 public:
  FakeConnection(FakeDatabase& db, bool read_only) : db_(db), read_only_(read_only) {
  }

  bool IsReadOnly() const override {
    return read_only_;
  }

  Values Execute(const std::string& script, ExecutionType type, const dbmgr::db::sql::ParameterSet&) override {
    if (script == "FAIL") {
      throw std::runtime_error("script failed");
    }
    db_.executed.push_back(script);
    if (type == ExecutionType::kNonQuery) {
      return {Value(std::int64_t{-1})};
    }
    return {Value(script)};
  }

 private:
  FakeDatabase& db_;
  bool          read_only_;
};

class FakeTransaction final : public dbmgr::db::Transaction {
 public:
  FakeTransaction(FakeDatabase& db, bool read_only, std::optional<IsolationLevel> isolation)
      : db_(db), connection_(db, read_only), isolation_(isolation) {
  }

  ~FakeTransaction() override {
    if (active_) ++db_.rollbacks;
  }

  void Commit() override {
    if (db_.fail_commit) throw std::runtime_error("commit refused");
    active_    = false;
    committed_ = true;
    ++db_.commits;
  }

  void Rollback() override {
    active_ = false;
    ++db_.rollbacks;
  }

  bool IsCommitted() const override {
    return committed_;
  }
  bool IsActive() const override {
    return active_;
  }
  dbmgr::db::Connection& ConnectionHandle() override {
    return connection_;
  }
  std::optional<IsolationLevel> Isolation() const override {
    return isolation_;
  }

 private:
  FakeDatabase&                 db_;
  FakeConnection                connection_;
  std::optional<IsolationLevel> isolation_;
  bool                          active_    = true;
  bool                          committed_ = false;
};

class FakeProvider final : public dbmgr::db::ConnectionProvider {
 public:
  FakeProvider(FakeDatabase& db, bool read_only_supported) : db_(db), read_only_supported_(read_only_supported) {
  }

  bool SupportsReadOnly() const override {
    return read_only_supported_;
  }

  std::unique_ptr<dbmgr::db::Connection> CreateConnection(bool read_only) override {
    if (db_.refuse) return nullptr;
    ++db_.connections;
    return std::make_unique<FakeConnection>(db_, read_only);
  }

  std::unique_ptr<dbmgr::db::Transaction> CreateTransaction(bool read_only, std::optional<IsolationLevel> isolation) override {
    if (db_.refuse) return nullptr;
    ++db_.transactions;
    db_.last_isolation = isolation;
    return std::make_unique<FakeTransaction>(db_, read_only, isolation);
  }

  std::string Describe() const override {
    return "fake";
  }

 private:
  FakeDatabase& db_;
  bool          read_only_supported_;
};

class FakeDetector final : public dbmgr::versioning::VersionDetector {
 public:
  explicit FakeDetector(FakeDatabase& db) : db_(db) {
  }

  DetectionResult Detect(DbManager&) override {
    ++calls;
    DetectionResult result;
    result.success = db_.success;
    result.version = db_.version;
    return result;
  }

  int calls = 0;

 private:
  FakeDatabase& db_;
};

class FakeUpgrader final : public dbmgr::upgrading::VersionUpgrader {
 public:
  enum class Behavior { kAdvance, kSkip, kStall, kFail, kRunBatch };

  FakeUpgrader(FakeDatabase& db, int min, int max, Behavior behavior) : db_(db), min_(min), max_(max), behavior_(behavior) {
  }

  int GetMinVersion(DbManager&) override {
    return min_;
  }
  int GetMaxVersion(DbManager&) override {
    return max_;
  }

  bool Upgrade(DbManager& manager, int from_version) override {
    ++calls;
    switch (behavior_) {
      case Behavior::kAdvance:
        db_.version = from_version + 1;
        return true;
      case Behavior::kSkip:
        db_.version = from_version + 2;
        return true;
      case Behavior::kStall:
        return true;
      case Behavior::kFail:
        return false;
      case Behavior::kRunBatch: {
        Batch step("step");
        step.AddScript("UPGRADE " + std::to_string(from_version), TransactionRequirement::kRequired);
        db_.version = from_version + 1;
        return RunBatch(manager, step, false, true);
      }
    }
    return false;
  }

  int calls = 0;

 private:
  FakeDatabase& db_;
  int           min_;
  int           max_;
  Behavior      behavior_;
};

class FakeBackup final : public dbmgr::backup::BackupCreator {
 public:
  bool SupportsBackup() const override {
    return true;
  }
  bool SupportsRestore() const override {
    return false;
  }
  bool Backup(DbManager&, const std::string& target) override {
    targets.push_back(target);
    return true;
  }
  bool Restore(DbManager&, const std::string&) override {
    return false;
  }

  std::vector<std::string> targets;
};

class FakeCleanup final : public dbmgr::cleanup::CleanupProcessor {
 public:
  bool Cleanup(DbManager&) override {
    ++calls;
    return true;
  }

  int calls = 0;
};

struct Harness {
  explicit Harness(int version, bool with_upgrader = true, FakeUpgrader::Behavior behavior = FakeUpgrader::Behavior::kAdvance,
                   int min = 1, int max = 3, bool read_only_supported = true) {
    db.version = version;

    detector = std::make_shared<FakeDetector>(db);
    ManagerComponents components;
    components.provider         = std::make_shared<FakeProvider>(db, read_only_supported);
    components.version_detector = detector;
    if (with_upgrader) {
      upgrader                    = std::make_shared<FakeUpgrader>(db, min, max, behavior);
      components.version_upgrader = upgrader;
    }
    backup                       = std::make_shared<FakeBackup>();
    components.backup_creator    = backup;
    cleanup                      = std::make_shared<FakeCleanup>();
    components.cleanup_processor = cleanup;

    manager = std::make_unique<DbManager>(std::move(components));
  }

  FakeDatabase                  db;
  std::shared_ptr<FakeDetector> detector;
  std::shared_ptr<FakeUpgrader> upgrader;
  std::shared_ptr<FakeBackup>   backup;
  std::shared_ptr<FakeCleanup>  cleanup;
  std::unique_ptr<DbManager>    manager;
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void TestInitializeDerivesState() {
  Harness h(1);
  assert(h.manager->State() == DbState::kUninitialized);
  assert(h.manager->Version() == -1);

  h.manager->Initialize();
  assert(h.manager->State() == DbState::kReadyOld);
  assert(h.manager->Version() == 1);
  assert(h.manager->InitialState() == DbState::kReadyOld);
  assert(h.manager->InitialVersion() == 1);
  assert(h.manager->IsReady());
  assert(h.manager->CanUpgrade());
  assert(h.manager->ToString() == "DbManager; State=ReadyOld; Version=1");

  h.manager->Close();
  assert(h.manager->State() == DbState::kUninitialized);
  assert(h.manager->InitialVersion() == -1);
}

void TestDetectionFailureIsDamaged() {
  Harness h(2);
  h.db.success = false;

  h.manager->Initialize();
  assert(h.manager->State() == DbState::kDamagedOrInvalid);
  assert(h.manager->Version() == -1);
}

void TestWithoutUpgraderVersionsAreUnknown() {
  Harness fresh(0, false);
  fresh.manager->Initialize();
  assert(fresh.manager->State() == DbState::kUnavailable);
  assert(fresh.manager->MinVersion() == -1);
  assert(fresh.manager->MaxVersion() == -1);
  assert(!fresh.manager->CanUpgrade());

  Harness existing(4, false);
  existing.manager->Initialize();
  assert(existing.manager->State() == DbState::kReadyUnknown);
}

void TestListenersFireOncePerChange() {
  Harness h(1);

  std::vector<std::pair<DbState, DbState>> states;
  std::vector<std::pair<int, int>>         versions;
  h.manager->OnStateChanged([&](DbState old_state, DbState new_state) { states.emplace_back(old_state, new_state); });
  h.manager->OnVersionChanged([&](int old_version, int new_version) { versions.emplace_back(old_version, new_version); });

  h.manager->Initialize();
  assert(states.size() == 1);
  assert((states[0] == std::make_pair(DbState::kUninitialized, DbState::kReadyOld)));
  assert(versions.size() == 1);
  assert((versions[0] == std::make_pair(-1, 1)));

  // redetection with nothing changed is silent
  Batch batch;
  batch.AddScript("SELECT 1;");
  assert(h.manager->ExecuteBatch(batch, false, true));
  assert(states.size() == 1);
  assert(versions.size() == 1);

  // re-initialize closes first
  h.manager->Initialize();
  assert(states.size() == 3);
  assert(states[1].second == DbState::kUninitialized);
  assert(states[2].second == DbState::kReadyOld);
  assert(versions.size() == 3);
}

// ------------------------------------------------------------
// Batch execution
// ------------------------------------------------------------

void TestTransactionalBatchCommits() {
  Harness h(1);
  h.manager->Initialize();

  Batch batch("tx");
  batch.AddScript("A", TransactionRequirement::kRequired);
  batch.AddScript("B", TransactionRequirement::kDontCare);

  assert(h.manager->ExecuteBatch(batch));
  assert(batch.RequiresTransaction());
  assert(batch.WasFullyExecuted());
  assert(h.db.transactions == 1);
  assert(h.db.connections == 0);
  assert(h.db.commits == 1);
  assert(h.db.rollbacks == 0);
  assert(std::get<std::string>(batch.GetResult()) == "B");
}

void TestPlainBatchUsesConnection() {
  Harness h(1);
  h.manager->Initialize();

  Batch batch;
  batch.AddScript("A", TransactionRequirement::kDisallowed, std::nullopt, ExecutionType::kNonQuery);

  const int detections = h.detector->calls;
  assert(h.manager->ExecuteBatch(batch, true, true));
  assert(h.db.connections == 1);
  assert(h.db.transactions == 0);
  assert(std::get<std::int64_t>(batch.GetResult()) == -1);
  assert(h.detector->calls == detections + 1);
}

void TestConflictingBatchNeverRuns() {
  Harness h(1);
  h.manager->Initialize();

  Batch batch;
  batch.AddScript("A", TransactionRequirement::kRequired);
  batch.AddScript("B", TransactionRequirement::kDisallowed);

  assert(Throws<dbmgr::util::ConflictingRequirement>([&] { (void)batch.RequiresTransaction(); }));
  assert(Throws<dbmgr::util::ConflictingRequirement>([&] { (void)h.manager->ExecuteBatch(batch); }));
  assert(!batch.WasPartiallyExecuted());
  assert(h.db.connections == 0);
  assert(h.db.transactions == 0);
  assert(h.db.executed.empty());
}

void TestIsolationLevelReachesProvider() {
  Harness h(1);
  h.manager->Initialize();

  Batch batch;
  batch.AddScript("A", TransactionRequirement::kRequired, IsolationLevel::kSerializable);
  assert(h.manager->ExecuteBatch(batch));
  assert(h.db.last_isolation == IsolationLevel::kSerializable);
}

void TestFirstFailureAbortsBatch() {
  Harness h(1);
  h.manager->Initialize();

  Batch batch("abort");
  batch.AddScript("A", TransactionRequirement::kRequired);
  batch.AddScript("FAIL");
  batch.AddScript("C");

  assert(!h.manager->ExecuteBatch(batch));
  assert(batch.Commands()[0]->WasExecuted());
  assert(batch.Commands()[1]->WasExecuted());
  assert(batch.Commands()[1]->Error() == "script failed");
  assert(batch.Commands()[1]->Exception() != nullptr);
  assert(!batch.Commands()[2]->WasExecuted());
  assert(batch.WasPartiallyExecuted());
  assert(!batch.WasFullyExecuted());
  assert(h.db.executed.size() == 1);
  assert(h.db.commits == 0);
  assert(h.db.rollbacks == 1);

  // a second run starts from a clean slate
  assert(!h.manager->ExecuteBatch(batch));
  assert(batch.GetErrors().size() == 1);
}

void TestCallbackSoftErrorAndContext() {
  Harness h(1);
  h.manager->Initialize();

  bool saw_transaction = false;
  bool saw_parameter   = false;

  Batch batch;
  auto& first = batch.AddCallback(
      [&](CallbackContext& ctx) {
        saw_transaction = ctx.transaction != nullptr;
        saw_parameter   = ctx.parameters.Contains("id");
        ctx.connection.Execute("FROM CALLBACK", ctx.execution_type, ctx.parameters);
        return Values{Value(std::int64_t{42})};
      },
      TransactionRequirement::kRequired, std::nullopt, ExecutionType::kScalar);
  first.Parameters().Add("id", dbmgr::db::sql::ParameterType::kInteger, std::int64_t{1});

  batch.AddCallback([](CallbackContext& ctx) {
    ctx.error = "validation failed";
    return Values{};
  });
  batch.AddScript("NEVER");

  assert(!h.manager->ExecuteBatch(batch));
  assert(saw_transaction);
  assert(saw_parameter);
  assert(std::get<std::int64_t>(batch.Commands()[0]->Result()) == 42);
  assert(batch.GetError() == "validation failed");
  assert(batch.GetException() == nullptr);
  assert(!batch.Commands()[2]->WasExecuted());
  assert(h.db.executed.size() == 1);
  assert(h.db.commits == 0);
}

void TestNonStandardThrowAbortsBatch() {
  Harness h(1);
  h.manager->Initialize();

  Batch batch;
  batch.AddScript("A");
  batch.AddCallback([&](CallbackContext&) -> Values {
    h.db.version = 2;
    throw 42;
  });
  batch.AddScript("NEVER");

  bool escaped = false;
  bool ok      = true;
  try {
    ok = h.manager->ExecuteBatch(batch, false, true);
  } catch (...) {
    escaped = true;
  }
  assert(!escaped);
  assert(!ok);
  assert(batch.Commands()[1]->WasExecuted());
  assert(batch.Commands()[1]->Error() == "non-standard exception");
  assert(batch.GetException() != nullptr);
  assert(!batch.Commands()[2]->WasExecuted());
  assert(h.db.executed.size() == 1);
  assert(h.manager->Version() == 2);

  bool rethrown = false;
  try {
    batch.RethrowFirstException();
  } catch (int value) {
    rethrown = value == 42;
  }
  assert(rethrown);
}

void TestCommitFailureFailsBatch() {
  Harness h(1);
  h.manager->Initialize();
  h.db.fail_commit = true;

  Batch batch;
  batch.AddScript("A", TransactionRequirement::kRequired);
  assert(!h.manager->ExecuteBatch(batch));
  assert(batch.WasFullyExecuted());
  assert(h.db.rollbacks == 1);
}

void TestInvalidCommandIsRejectedBeforeExecution() {
  Harness h(1);
  h.manager->Initialize();

  Batch batch;
  batch.AddScript("A");
  batch.AddScript("   ");

  assert(Throws<dbmgr::util::InvalidCommand>([&] { (void)h.manager->ExecuteBatch(batch); }));
  assert(h.db.executed.empty());
  assert(h.db.connections == 0);
}

void TestExecutionGuards() {
  Harness h(1, true, FakeUpgrader::Behavior::kAdvance, 1, 3, false);

  Batch batch;
  batch.AddScript("A");
  assert(Throws<dbmgr::util::InvalidState>([&] { (void)h.manager->ExecuteBatch(batch); }));
  assert(Throws<dbmgr::util::InvalidState>([&] { (void)h.manager->CreateConnection(false); }));

  h.manager->Initialize();
  assert(Throws<dbmgr::util::NotSupported>([&] { (void)h.manager->ExecuteBatch(batch, true); }));
  assert(Throws<dbmgr::util::NotSupported>([&] { (void)h.manager->CreateTransaction(true); }));

  h.db.refuse = true;
  assert(h.manager->CreateConnection(false) == nullptr);
  assert(h.manager->CreateTransaction(false) == nullptr);
  assert(!h.manager->ExecuteBatch(batch));
  assert(!batch.WasPartiallyExecuted());

  Harness fresh(0);
  fresh.manager->Initialize();
  assert(fresh.manager->State() == DbState::kNew);
  assert(Throws<dbmgr::util::InvalidState>([&] { (void)fresh.manager->ExecuteBatch(batch); }));
}

// ------------------------------------------------------------
// Upgrades
// ------------------------------------------------------------

void TestUpgradeStepsToTarget() {
  Harness h(1);
  h.manager->Initialize();

  assert(h.manager->Upgrade(3));
  assert(h.upgrader->calls == 2);
  assert(h.manager->Version() == 3);
  assert(h.manager->State() == DbState::kReadyNew);
  assert(!h.manager->CanUpgrade());

  // already there
  assert(h.manager->Upgrade(3));
  assert(h.upgrader->calls == 2);
}

void TestStalledUpgraderTerminates() {
  Harness h(1, true, FakeUpgrader::Behavior::kStall);
  h.manager->Initialize();

  assert(!h.manager->Upgrade(3));
  assert(h.upgrader->calls == 1);
  assert(h.manager->Version() == 1);
}

void TestSkippingUpgraderStops() {
  Harness h(1, true, FakeUpgrader::Behavior::kSkip, 1, 5);
  h.manager->Initialize();

  assert(!h.manager->Upgrade(2));
  assert(h.upgrader->calls == 1);
  assert(h.manager->Version() == 3);

  Harness longer(1, true, FakeUpgrader::Behavior::kSkip, 1, 5);
  longer.manager->Initialize();
  assert(!longer.manager->Upgrade(5));
  assert(longer.upgrader->calls == 1);
}

void TestFailedStepStops() {
  Harness h(1, true, FakeUpgrader::Behavior::kFail);
  h.manager->Initialize();

  assert(!h.manager->Upgrade(2));
  assert(h.upgrader->calls == 1);
}

void TestUpgradeFromNewRunsCollaboratorBatches() {
  Harness h(0, true, FakeUpgrader::Behavior::kRunBatch, 0, 2);
  h.manager->Initialize();
  assert(h.manager->State() == DbState::kNew);
  assert(h.manager->CanUpgrade());

  assert(h.manager->UpgradeToLatest());
  assert(h.upgrader->calls == 2);
  assert(h.manager->State() == DbState::kReadyNew);
  assert(h.manager->Version() == 2);
  assert(h.db.executed.size() == 2);
  assert(h.db.executed[0] == "UPGRADE 0");
  assert(h.db.commits == 2);
}

void TestUpgradeGuards() {
  Harness h(2);
  assert(Throws<dbmgr::util::InvalidState>([&] { (void)h.manager->Upgrade(3); }));

  h.manager->Initialize();
  assert(Throws<dbmgr::util::OutOfRange>([&] { (void)h.manager->Upgrade(4); }));
  assert(Throws<dbmgr::util::OutOfRange>([&] { (void)h.manager->Upgrade(0); }));
  assert(Throws<dbmgr::util::OutOfRange>([&] { (void)h.manager->Upgrade(1); }));
  assert(h.upgrader->calls == 0);

  Harness none(2, false);
  none.manager->Initialize();
  assert(Throws<dbmgr::util::NotSupported>([&] { (void)none.manager->Upgrade(3); }));
  assert(Throws<dbmgr::util::NotSupported>([&] { (void)none.manager->UpgradeToLatest(); }));

  Harness too_new(9);
  too_new.manager->Initialize();
  assert(too_new.manager->State() == DbState::kTooNew);
  assert(Throws<dbmgr::util::InvalidState>([&] { (void)too_new.manager->Upgrade(3); }));
}

// ------------------------------------------------------------
// Backup, cleanup, batch lookup
// ------------------------------------------------------------

void TestBackupAndCleanupGuards() {
  Harness h(9);
  assert(Throws<dbmgr::util::InvalidState>([&] { (void)h.manager->Backup("/tmp/x"); }));

  h.manager->Initialize();
  assert(h.manager->State() == DbState::kTooNew);

  // backup only needs an initialized manager
  const int detections = h.detector->calls;
  assert(h.manager->Backup("/tmp/dbmgr-backup"));
  assert(h.backup->targets.size() == 1);
  assert(h.detector->calls == detections + 1);

  assert(Throws<dbmgr::util::InvalidArgument>([&] { (void)h.manager->Backup(" "); }));
  assert(Throws<dbmgr::util::NotSupported>([&] { (void)h.manager->Restore("/tmp/dbmgr-backup"); }));
  assert(Throws<dbmgr::util::InvalidState>([&] { (void)h.manager->Cleanup(); }));

  Harness fresh(0);
  fresh.manager->Initialize();
  assert(fresh.manager->Cleanup());
  assert(fresh.cleanup->calls == 1);
}

void TestBatchLookupWorksInAnyState() {
  FakeDatabase db;
  auto locator = std::make_shared<dbmgr::locator::DictionaryBatchLocator>();
  locator->AddScript("Report", "SELECT 1;\nGO\nSELECT 2;");

  ManagerComponents components;
  components.provider         = std::make_shared<FakeProvider>(db, true);
  components.version_detector = std::make_shared<FakeDetector>(db);
  components.batch_locator    = locator;
  DbManager manager(std::move(components));

  assert(manager.SupportsScripts());
  assert(manager.GetBatchNames().count("report") == 1);

  auto batch = manager.GetBatch("REPORT");
  assert(batch.has_value());
  assert(batch->Size() == 2);
  assert(!manager.GetBatch("missing").has_value());
  assert(manager.GetBatches().size() == 1);
  assert(manager.GetBatches(std::string("NONE")).begin()->second.Size() == 1);

  Harness h(1);
  assert(!h.manager->SupportsScripts());
  assert(!h.manager->GetBatch("Report").has_value());
  assert(h.manager->GetBatchNames().empty());
}

void TestMissingMandatoryCollaborators() {
  FakeDatabase      db;
  ManagerComponents components;
  components.provider = std::make_shared<FakeProvider>(db, true);
  assert(Throws<dbmgr::util::InvalidArgument>([&] { DbManager manager(components); }));
}

} // namespace

int main() {
  TestInitializeDerivesState();
  TestDetectionFailureIsDamaged();
  TestWithoutUpgraderVersionsAreUnknown();
  TestListenersFireOncePerChange();
  TestTransactionalBatchCommits();
  TestPlainBatchUsesConnection();
  TestConflictingBatchNeverRuns();
  TestIsolationLevelReachesProvider();
  TestFirstFailureAbortsBatch();
  TestCallbackSoftErrorAndContext();
  TestNonStandardThrowAbortsBatch();
  TestCommitFailureFailsBatch();
  TestInvalidCommandIsRejectedBeforeExecution();
  TestExecutionGuards();
  TestUpgradeStepsToTarget();
  TestStalledUpgraderTerminates();
  TestSkippingUpgraderStops();
  TestFailedStepStops();
  TestUpgradeFromNewRunsCollaboratorBatches();
  TestUpgradeGuards();
  TestBackupAndCleanupGuards();
  TestBatchLookupWorksInAnyState();
  TestMissingMandatoryCollaborators();

  std::cout << "dbmgr_unit_db_manager: pass\n";
  return 0;
}
