#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/backup/backup_creator.hpp"
#include "internal/batch/batch.hpp"
#include "internal/cleanup/cleanup_processor.hpp"
#include "internal/db/api/connection_provider.hpp"
#include "internal/lifecycle/db_state.hpp"
#include "internal/locator/batch_locator.hpp"
#include "internal/upgrading/version_upgrader.hpp"
#include "internal/util/strings.hpp"
#include "internal/versioning/version_detector.hpp"

namespace dbmgr::core {

/*
  Collaborators wired into a manager.

  provider and version_detector are mandatory. A null optional
  collaborator disables the matching capability.
*/
struct ManagerComponents {
  std::shared_ptr<db::ConnectionProvider>      provider;
  std::shared_ptr<versioning::VersionDetector> version_detector;

  std::shared_ptr<const locator::BatchLocator> batch_locator;
  std::shared_ptr<upgrading::VersionUpgrader>  version_upgrader;
  std::shared_ptr<backup::BackupCreator>       backup_creator;
  std::shared_ptr<cleanup::CleanupProcessor>   cleanup_processor;
};

/*
  DbManager

  Owns the lifecycle state and version of one target database and runs
  batches against it.

  Lifecycle:
    Uninitialized -> Initialize() -> detected state -> Close() -> Uninitialized

  Every state/version change goes through SetStateAndVersion, which logs
  the transition and notifies listeners once per distinct change.

  Not synchronized. Callers must not run mutating operations concurrently
  on the same instance.
*/
class DbManager {
 public:
  using StateListener   = std::function<void(lifecycle::DbState old_state, lifecycle::DbState new_state)>;
  using VersionListener = std::function<void(int old_version, int new_version)>;
  using BatchMap        = std::map<std::string, batch::Batch, util::CaseInsensitiveLess>;

  explicit DbManager(ManagerComponents components);
  ~DbManager();

  DbManager(const DbManager&)            = delete;
  DbManager& operator=(const DbManager&) = delete;

  lifecycle::DbState State() const {
    return state_;
  }
  int Version() const {
    return version_;
  }
  lifecycle::DbState InitialState() const {
    return initial_state_;
  }
  int InitialVersion() const {
    return initial_version_;
  }

  bool IsReady() const;
  bool IsInitialized() const;

  // -1 without an upgrader.
  int MinVersion();
  int MaxVersion();

  bool SupportsBackup() const;
  bool SupportsRestore() const;
  bool SupportsCleanup() const;
  bool SupportsUpgrade() const;
  bool SupportsReadOnly() const;
  bool SupportsScripts() const;

  bool CanUpgrade();

  // Closes first when already initialized. Detection failures end in
  // DamagedOrInvalid instead of throwing.
  void Initialize();
  void Close();

  // Require a ready state. Return nullptr when the provider fails.
  std::unique_ptr<db::Connection>  CreateConnection(bool read_only);
  std::unique_ptr<db::Transaction> CreateTransaction(bool read_only, std::optional<db::IsolationLevel> isolation = std::nullopt);

  batch::Batch CreateBatch() const {
    return batch::Batch();
  }

  /*
    Runs every command in order on one connection, or one transaction when
    any command requires it. Stops at the first failing command; commands
    after it stay unexecuted. A transaction is committed only when every
    command succeeded, otherwise it is released uncommitted.
  */
  bool ExecuteBatch(batch::Batch& batch, bool read_only = false, bool redetect_after = false);

  // Callable in any state. nullopt when no locator is configured or the name is unknown.
  std::optional<batch::Batch> GetBatch(const std::string& name, const std::optional<std::string>& separator = std::nullopt);
  locator::NameSet            GetBatchNames() const;
  BatchMap                    GetBatches(const std::optional<std::string>& separator = std::nullopt);

  bool Upgrade(int target_version);
  bool UpgradeToLatest();

  bool Backup(const std::string& target);
  bool Restore(const std::string& source);
  bool Cleanup();

  void OnStateChanged(StateListener listener);
  void OnVersionChanged(VersionListener listener);

  db::ConnectionProvider& Provider() {
    return *components_.provider;
  }

  std::string ToString() const;

 private:
  friend class Collaborator;

  bool RunBatch(batch::Batch& batch, bool read_only, bool redetect_after);

  void DetectStateAndVersion();
  void SetStateAndVersion(lifecycle::DbState state, int version);

  void RequireReady(const char* operation) const;
  void RequireReadyOrNew(const char* operation) const;
  void RequireInitialized(const char* operation) const;

  ManagerComponents components_;

  lifecycle::DbState state_           = lifecycle::DbState::kUninitialized;
  int                version_         = -1;
  lifecycle::DbState initial_state_   = lifecycle::DbState::kUninitialized;
  int                initial_version_ = -1;

  std::vector<StateListener>   state_listeners_;
  std::vector<VersionListener> version_listeners_;
};

} // namespace dbmgr::core
