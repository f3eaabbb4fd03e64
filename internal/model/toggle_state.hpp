#pragma once

#include <cstdint>

namespace modsync::model {

/*
  Per-key state of an optimistic enable/disable.

  kSynced      value came from a full listing
  kPending     local value applied, service call in flight
  kConfirmed   service accepted; value stays a hint until the next listing
  kRolledBack  service rejected; previous value restored
*/
enum class ToggleState : std::uint8_t {
  kSynced     = 0,
  kPending    = 1,
  kConfirmed  = 2,
  kRolledBack = 3,
};

constexpr bool CanTransition(ToggleState from, ToggleState to) {
  switch (to) {
    case ToggleState::kSynced:
      // a listing always wins
      return true;
    case ToggleState::kPending:
      return from != ToggleState::kPending;
    case ToggleState::kConfirmed:
    case ToggleState::kRolledBack:
      return from == ToggleState::kPending;
  }
  return false;
}

constexpr const char* ToString(ToggleState state) {
  switch (state) {
    case ToggleState::kSynced:
      return "synced";
    case ToggleState::kPending:
      return "pending";
    case ToggleState::kConfirmed:
      return "confirmed";
    case ToggleState::kRolledBack:
      return "rolled_back";
  }
  return "unknown";
}

} // namespace modsync::model
