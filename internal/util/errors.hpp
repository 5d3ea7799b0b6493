#pragma once

#include <stdexcept>
#include <string>

namespace dbmgr::util {

/*
  Central error types.

  Precondition violations are raised before any side effect happens.
  Driver-level failures are reported as db::Result and translated here
  by ThrowIfError.
*/

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotSupported : public std::runtime_error {
 public:
  explicit NotSupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OutOfRange : public std::out_of_range {
 public:
  explicit OutOfRange(const std::string& msg) : std::out_of_range(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

// Transaction requirement or isolation level disagreement inside a batch.
class ConflictingRequirement : public std::runtime_error {
 public:
  explicit ConflictingRequirement(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A command without exactly one of script/code. Programming error.
class InvalidCommand : public std::logic_error {
 public:
  explicit InvalidCommand(const std::string& msg) : std::logic_error(msg) {
  }
};

class BatchError : public std::runtime_error {
 public:
  explicit BatchError(const std::string& msg) : std::runtime_error("database batch execution failed: " + msg) {
  }
};

} // namespace dbmgr::util
