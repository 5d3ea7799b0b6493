#include "db_manager.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::core {

using lifecycle::DbState;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

bool Collaborator::RunBatch(DbManager& manager, batch::Batch& batch, bool read_only, bool redetect_after) {
  return manager.RunBatch(batch, read_only, redetect_after);
}

namespace {

std::string StateName(DbState state) {
  return std::string(lifecycle::ToString(state));
}

} // namespace

DbManager::DbManager(ManagerComponents components) : components_(std::move(components)) {
  if (!components_.provider) {
    throw util::InvalidArgument("db manager requires a connection provider");
  }
  if (!components_.version_detector) {
    throw util::InvalidArgument("db manager requires a version detector");
  }
}

DbManager::~DbManager() = default;

bool DbManager::IsReady() const {
  return lifecycle::IsReady(state_);
}

bool DbManager::IsInitialized() const {
  return state_ != DbState::kUninitialized;
}

int DbManager::MinVersion() {
  return SupportsUpgrade() ? components_.version_upgrader->GetMinVersion(*this) : -1;
}

int DbManager::MaxVersion() {
  return SupportsUpgrade() ? components_.version_upgrader->GetMaxVersion(*this) : -1;
}

bool DbManager::SupportsBackup() const {
  return components_.backup_creator && components_.backup_creator->SupportsBackup();
}

bool DbManager::SupportsRestore() const {
  return components_.backup_creator && components_.backup_creator->SupportsRestore();
}

bool DbManager::SupportsCleanup() const {
  return static_cast<bool>(components_.cleanup_processor);
}

bool DbManager::SupportsUpgrade() const {
  return static_cast<bool>(components_.version_upgrader);
}

bool DbManager::SupportsReadOnly() const {
  return components_.provider->SupportsReadOnly();
}

bool DbManager::SupportsScripts() const {
  return static_cast<bool>(components_.batch_locator);
}

bool DbManager::CanUpgrade() {
  return SupportsUpgrade() && (IsReady() || state_ == DbState::kNew) && version_ >= 0 && version_ < MaxVersion();
}

void DbManager::Initialize() {
  DBMGR_LOG_DEBUG("Initializing database manager", {StringField("target", components_.provider->Describe())});

  if (state_ != DbState::kUninitialized) {
    Close();
  }

  DetectStateAndVersion();

  initial_state_   = state_;
  initial_version_ = version_;

  DBMGR_LOG_INFO("Database manager initialized", {StringField("state", StateName(state_)), IntField("version", version_)});
}

void DbManager::Close() {
  DBMGR_LOG_DEBUG("Closing database manager", {StringField("state", StateName(state_))});

  SetStateAndVersion(DbState::kUninitialized, -1);

  initial_state_   = DbState::kUninitialized;
  initial_version_ = -1;
}

std::unique_ptr<db::Connection> DbManager::CreateConnection(bool read_only) {
  RequireReady("create a connection");
  if (read_only && !SupportsReadOnly()) {
    throw util::NotSupported("database manager does not support read-only connections");
  }

  auto connection = components_.provider->CreateConnection(read_only);
  if (!connection) {
    DBMGR_LOG_ERROR("Connection creation failed", {StringField("target", components_.provider->Describe()), BoolField("read_only", read_only)});
  }
  return connection;
}

std::unique_ptr<db::Transaction> DbManager::CreateTransaction(bool read_only, std::optional<db::IsolationLevel> isolation) {
  RequireReady("create a transaction");
  if (read_only && !SupportsReadOnly()) {
    throw util::NotSupported("database manager does not support read-only transactions");
  }

  auto transaction = components_.provider->CreateTransaction(read_only, isolation);
  if (!transaction) {
    DBMGR_LOG_ERROR("Transaction creation failed", {StringField("target", components_.provider->Describe()), BoolField("read_only", read_only)});
  }
  return transaction;
}

bool DbManager::ExecuteBatch(batch::Batch& batch, bool read_only, bool redetect_after) {
  RequireReady("execute a batch");
  return RunBatch(batch, read_only, redetect_after);
}

bool DbManager::RunBatch(batch::Batch& batch, bool read_only, bool redetect_after) {
  if (read_only && !SupportsReadOnly()) {
    throw util::NotSupported("database manager does not support read-only batches");
  }

  batch.Reset();

  for (const auto& command : batch.Commands()) {
    command->Validate();
  }

  const bool requires_transaction = batch.RequiresTransaction();
  const auto isolation            = batch.GetIsolationLevel();

  bool ok = true;
  {
    std::unique_ptr<db::Transaction> transaction;
    std::unique_ptr<db::Connection>  plain;
    db::Connection*                  connection = nullptr;

    if (requires_transaction) {
      transaction = components_.provider->CreateTransaction(read_only, isolation);
      if (transaction) connection = &transaction->ConnectionHandle();
    } else {
      plain      = components_.provider->CreateConnection(read_only);
      connection = plain.get();
    }

    if (connection == nullptr) {
      DBMGR_LOG_ERROR("Batch execution failed: no connection",
                      {StringField("batch", batch.Name()), BoolField("transaction", requires_transaction), BoolField("read_only", read_only)});
      return false;
    }

    DBMGR_LOG_DEBUG("Executing batch", {StringField("batch", batch.Name()), IntField("commands", static_cast<std::int64_t>(batch.Size())),
                                        BoolField("transaction", requires_transaction), BoolField("read_only", read_only)});

    for (std::size_t i = 0; i < batch.Size(); ++i) {
      auto& command = *batch.Commands()[i];

      try {
        if (command.HasScript()) {
          command.RecordSuccess(connection->Execute(*command.Script(), command.GetExecutionType(), command.Parameters()));
        } else {
          batch::CallbackContext context{*connection, transaction.get(), command.GetExecutionType(), command.Parameters(), {}};
          auto values = command.Code()(context);
          if (!context.error.empty()) {
            command.RecordFailure(std::move(context.error), nullptr);
          } else {
            command.RecordSuccess(std::move(values));
          }
        }
      } catch (const std::exception& e) {
        command.RecordFailure(e.what(), std::current_exception());
      } catch (...) {
        command.RecordFailure("non-standard exception", std::current_exception());
      }

      if (command.HasFailed()) {
        DBMGR_LOG_ERROR("Batch command failed",
                        {StringField("batch", batch.Name()), IntField("command", static_cast<std::int64_t>(i)), StringField("kind", command.Describe()),
                         StringField("error", command.Error())});
        ok = false;
        break;
      }
    }

    if (ok && transaction) {
      try {
        transaction->Commit();
      } catch (const std::exception& e) {
        DBMGR_LOG_ERROR("Batch commit failed", {StringField("batch", batch.Name()), StringField("error", e.what())});
        ok = false;
      }
    }
  }

  if (redetect_after) {
    DetectStateAndVersion();
  }

  return ok;
}

std::optional<batch::Batch> DbManager::GetBatch(const std::string& name, const std::optional<std::string>& separator) {
  if (!components_.batch_locator) {
    DBMGR_LOG_WARN("Batch requested without a batch locator", {StringField("batch", name)});
    return std::nullopt;
  }

  auto batch = components_.batch_locator->GetBatch(name, separator, [this] { return CreateBatch(); });
  if (!batch) {
    DBMGR_LOG_DEBUG("Batch not found", {StringField("batch", name)});
  }
  return batch;
}

locator::NameSet DbManager::GetBatchNames() const {
  if (!components_.batch_locator) {
    return {};
  }
  return components_.batch_locator->GetNames();
}

DbManager::BatchMap DbManager::GetBatches(const std::optional<std::string>& separator) {
  BatchMap batches;
  for (const auto& name : GetBatchNames()) {
    if (auto batch = GetBatch(name, separator)) {
      batches.emplace(name, std::move(*batch));
    }
  }
  return batches;
}

bool DbManager::Upgrade(int target_version) {
  RequireReadyOrNew("upgrade");
  if (!SupportsUpgrade()) {
    throw util::NotSupported("database manager does not support upgrades");
  }

  const int min_version = MinVersion();
  const int max_version = MaxVersion();
  if (target_version < min_version || target_version > max_version) {
    throw util::OutOfRange("version " + std::to_string(target_version) + " is not within the supported range (" + std::to_string(min_version) +
                           "..." + std::to_string(max_version) + ")");
  }
  if (target_version < version_) {
    throw util::OutOfRange("version " + std::to_string(target_version) + " is lower than the current version (" + std::to_string(version_) + ")");
  }

  if (target_version == version_) {
    return true;
  }

  int current = version_;
  while (current < target_version) {
    DBMGR_LOG_INFO("Performing database upgrade step", {IntField("from", current), IntField("to", current + 1)});

    const bool stepped = components_.version_upgrader->Upgrade(*this, current);

    DetectStateAndVersion();

    // each step must land on exactly the next version
    if (!IsReady() || !stepped || version_ != current + 1) {
      DBMGR_LOG_ERROR("Database upgrade step failed", {IntField("from", current), BoolField("step_ok", stepped), StringField("state", StateName(state_)),
                                                       IntField("version", version_)});
      return false;
    }

    current = version_;
  }

  return true;
}

bool DbManager::UpgradeToLatest() {
  RequireReadyOrNew("upgrade");
  if (!SupportsUpgrade()) {
    throw util::NotSupported("database manager does not support upgrades");
  }
  return Upgrade(MaxVersion());
}

bool DbManager::Backup(const std::string& target) {
  if (util::IsBlank(target)) {
    throw util::InvalidArgument("backup target is empty");
  }
  RequireInitialized("perform a backup");
  if (!SupportsBackup()) {
    throw util::NotSupported("database manager does not support backups");
  }

  DBMGR_LOG_INFO("Performing database backup", {StringField("target", target)});
  const bool ok = components_.backup_creator->Backup(*this, target);

  DetectStateAndVersion();
  return ok;
}

bool DbManager::Restore(const std::string& source) {
  if (util::IsBlank(source)) {
    throw util::InvalidArgument("restore source is empty");
  }
  RequireInitialized("perform a restore");
  if (!SupportsRestore()) {
    throw util::NotSupported("database manager does not support restores");
  }

  DBMGR_LOG_INFO("Performing database restore", {StringField("source", source)});
  const bool ok = components_.backup_creator->Restore(*this, source);

  DetectStateAndVersion();
  return ok;
}

bool DbManager::Cleanup() {
  RequireReadyOrNew("perform a cleanup");
  if (!SupportsCleanup()) {
    throw util::NotSupported("database manager does not support cleanups");
  }

  DBMGR_LOG_INFO("Performing database cleanup");
  const bool ok = components_.cleanup_processor->Cleanup(*this);

  DetectStateAndVersion();
  return ok;
}

void DbManager::OnStateChanged(StateListener listener) {
  if (listener) state_listeners_.push_back(std::move(listener));
}

void DbManager::OnVersionChanged(VersionListener listener) {
  if (listener) version_listeners_.push_back(std::move(listener));
}

std::string DbManager::ToString() const {
  return "DbManager; State=" + StateName(state_) + "; Version=" + std::to_string(version_);
}

void DbManager::DetectStateAndVersion() {
  const auto detected = components_.version_detector->Detect(*this);

  const bool upgrade = SupportsUpgrade();
  const int  min     = upgrade ? MinVersion() : -1;
  const int  max     = upgrade ? MaxVersion() : -1;

  const auto derived = lifecycle::DeriveState(detected.success, detected.state, detected.version, min, max, upgrade);
  if (derived.state == DbState::kDamagedOrInvalid) {
    DBMGR_LOG_WARN("Database detected as damaged or invalid",
                   {BoolField("detected", detected.success), IntField("raw_version", detected.version)});
  }

  SetStateAndVersion(derived.state, derived.version);
}

void DbManager::SetStateAndVersion(DbState state, int version) {
  const DbState old_state   = state_;
  const int     old_version = version_;

  state_   = state;
  version_ = version;

  if (old_state != state) {
    DBMGR_LOG_INFO("Database state changed", {StringField("old", StateName(old_state)), StringField("new", StateName(state))});
    for (const auto& listener : state_listeners_) {
      listener(old_state, state);
    }
  }

  if (old_version != version) {
    DBMGR_LOG_INFO("Database version changed", {IntField("old", old_version), IntField("new", version)});
    for (const auto& listener : version_listeners_) {
      listener(old_version, version);
    }
  }
}

void DbManager::RequireReady(const char* operation) const {
  if (!IsReady()) {
    throw util::InvalidState(std::string("database manager must be in a ready state to ") + operation + "; current state is " + StateName(state_));
  }
}

void DbManager::RequireReadyOrNew(const char* operation) const {
  if (!IsReady() && state_ != DbState::kNew) {
    throw util::InvalidState(std::string("database manager must be in a ready state or the new state to ") + operation + "; current state is " +
                             StateName(state_));
  }
}

void DbManager::RequireInitialized(const char* operation) const {
  if (state_ == DbState::kUninitialized) {
    throw util::InvalidState(std::string("database manager must be initialized to ") + operation + "; current state is " + StateName(state_));
  }
}

} // namespace dbmgr::core
