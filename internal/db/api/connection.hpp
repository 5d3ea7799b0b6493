#pragma once

#include <string>

#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_value.hpp"

namespace dbmgr::db {

/*
  An open database connection.

  Owned exclusively by whoever created it. Closing happens in the
  destructor. Execute throws on any driver failure; the error text
  is the backend's own message.
*/

class Connection {
 public:
  virtual ~Connection() = default;

  virtual bool IsReadOnly() const = 0;

  // Runs one script (possibly several statements) and collects its output.
  virtual sql::Values Execute(const std::string& script, ExecutionType type, const sql::ParameterSet& parameters) = 0;
};

} // namespace dbmgr::db
