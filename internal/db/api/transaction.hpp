#pragma once

#include <optional>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/types.hpp"

namespace dbmgr::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if neither committed nor rolled back
  - The transaction owns its connection; commands run through ConnectionHandle()

  SQLite: BEGIN DEFERRED / BEGIN IMMEDIATE
  Postgres: pqxx::work
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  // true until Commit() or Rollback()
  virtual bool IsActive() const = 0;

  virtual Connection& ConnectionHandle() = 0;

  virtual std::optional<IsolationLevel> Isolation() const = 0;
};

} // namespace dbmgr::db
