#pragma once

#include <optional>

#include "internal/core/collaborator.hpp"
#include "internal/lifecycle/db_state.hpp"

namespace dbmgr::versioning {

/*
  Raw detection outcome.

  success=false or version < 0 means damaged. state is set only when the
  detector is authoritative; otherwise the manager derives it.
*/
struct DetectionResult {
  bool                              success = false;
  std::optional<lifecycle::DbState> state;
  int                               version = -1;
};

class VersionDetector : public core::Collaborator {
 public:
  virtual DetectionResult Detect(core::DbManager& manager) = 0;
};

} // namespace dbmgr::versioning
