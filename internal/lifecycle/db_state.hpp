#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace dbmgr::lifecycle {

enum class DbState : std::uint8_t {
  kUninitialized = 0,
  kReadyNew = 1,
  kReadyOld = 2,
  kReadyUnknown = 3,
  kNew = 4,
  kUnavailable = 5,
  kTooOld = 6,
  kTooNew = 7,
  kDamagedOrInvalid = 8,
};

std::string_view ToString(DbState state);

// ReadyNew, ReadyOld or ReadyUnknown.
bool IsReady(DbState state);

struct DerivedState {
  DbState state   = DbState::kUninitialized;
  int     version = -1;

  bool operator==(const DerivedState& other) const {
    return state == other.state && version == other.version;
  }
};

/*
  Maps a raw detection outcome to the canonical state.

  1. detection failed, raw_version < 0 or raw_state DamagedOrInvalid
     -> (DamagedOrInvalid, -1)
  2. raw_state given -> passed through with raw_version
  3. supports_upgrade:
       0 -> New, < min -> TooOld, [min, max) -> ReadyOld,
       == max -> ReadyNew, > max -> TooNew
  4. otherwise: 0 -> Unavailable, else ReadyUnknown
*/
DerivedState DeriveState(bool                   detected,
                         std::optional<DbState> raw_state,
                         int                    raw_version,
                         int                    min_version,
                         int                    max_version,
                         bool                   supports_upgrade);

} // namespace dbmgr::lifecycle
