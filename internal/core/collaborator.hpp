#pragma once

#include "internal/batch/batch.hpp"

namespace dbmgr::core {

class DbManager;

/*
  Base of every pluggable manager collaborator (detector, upgrader,
  backup, cleanup).

  Collaborators run while the manager is not yet ready (detection, the
  first upgrade step from New), so they get a batch channel that skips
  the lifecycle guard of DbManager::ExecuteBatch.
*/
class Collaborator {
 public:
  virtual ~Collaborator() = default;

 protected:
  static bool RunBatch(DbManager& manager, batch::Batch& batch, bool read_only, bool redetect_after);
};

} // namespace dbmgr::core
