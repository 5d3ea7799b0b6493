#pragma once

#include "internal/core/collaborator.hpp"

namespace dbmgr::cleanup {

class CleanupProcessor : public core::Collaborator {
 public:
  virtual bool Cleanup(core::DbManager& manager) = 0;
};

} // namespace dbmgr::cleanup
