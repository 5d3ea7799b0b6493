#include "db_state.hpp"

namespace dbmgr::lifecycle {

std::string_view ToString(DbState state) {
  switch (state) {
    case DbState::kUninitialized:
      return "Uninitialized";
    case DbState::kReadyNew:
      return "ReadyNew";
    case DbState::kReadyOld:
      return "ReadyOld";
    case DbState::kReadyUnknown:
      return "ReadyUnknown";
    case DbState::kNew:
      return "New";
    case DbState::kUnavailable:
      return "Unavailable";
    case DbState::kTooOld:
      return "TooOld";
    case DbState::kTooNew:
      return "TooNew";
    case DbState::kDamagedOrInvalid:
      return "DamagedOrInvalid";
  }
  return "Unknown";
}

bool IsReady(DbState state) {
  return state == DbState::kReadyNew || state == DbState::kReadyOld || state == DbState::kReadyUnknown;
}

DerivedState DeriveState(bool                   detected,
                         std::optional<DbState> raw_state,
                         int                    raw_version,
                         int                    min_version,
                         int                    max_version,
                         bool                   supports_upgrade) {
  if (!detected || raw_version < 0 || raw_state == DbState::kDamagedOrInvalid) {
    return {DbState::kDamagedOrInvalid, -1};
  }

  if (raw_state) {
    return {*raw_state, raw_version};
  }

  if (supports_upgrade) {
    if (raw_version == 0) {
      return {DbState::kNew, raw_version};
    }
    if (raw_version < min_version) {
      return {DbState::kTooOld, raw_version};
    }
    if (raw_version < max_version) {
      return {DbState::kReadyOld, raw_version};
    }
    if (raw_version == max_version) {
      return {DbState::kReadyNew, raw_version};
    }
    if (raw_version > max_version) {
      return {DbState::kTooNew, raw_version};
    }
    return {DbState::kReadyUnknown, raw_version};
  }

  if (raw_version == 0) {
    return {DbState::kUnavailable, raw_version};
  }
  return {DbState::kReadyUnknown, raw_version};
}

} // namespace dbmgr::lifecycle
