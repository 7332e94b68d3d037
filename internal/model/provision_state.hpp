#pragma once

#include <cstdint>

namespace cloudstrap::model {

/*
  Orchestrator lifecycle.

      kInit -> kNetworkReady -> [kComputeReady] -> [kDatabaseReady] -> kDone
        \___________\_______________\__________________\-> kFailed -> kCleanedUp
*/
enum class ProvisionState : std::uint8_t {
  kInit          = 0,
  kNetworkReady  = 1,
  kComputeReady  = 2,
  kDatabaseReady = 3,
  kDone          = 4,
  kFailed        = 5,
  kCleanedUp     = 6,
};

constexpr bool IsTerminal(ProvisionState state) {
  return state == ProvisionState::kDone || state == ProvisionState::kCleanedUp;
}

constexpr bool CanTransition(ProvisionState from, ProvisionState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == ProvisionState::kFailed) {
    return to == ProvisionState::kCleanedUp;
  }
  if (to == ProvisionState::kFailed) {
    return true;
  }
  if (to == ProvisionState::kCleanedUp || to == ProvisionState::kInit) {
    return false;
  }
  if (from == ProvisionState::kInit) {
    return to == ProvisionState::kNetworkReady;
  }

  // Optional stages may be skipped but never revisited.
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr const char* ToString(ProvisionState state) {
  switch (state) {
    case ProvisionState::kInit:
      return "INIT";
    case ProvisionState::kNetworkReady:
      return "NETWORK_READY";
    case ProvisionState::kComputeReady:
      return "COMPUTE_READY";
    case ProvisionState::kDatabaseReady:
      return "DATABASE_READY";
    case ProvisionState::kDone:
      return "DONE";
    case ProvisionState::kFailed:
      return "FAILED";
    case ProvisionState::kCleanedUp:
      return "CLEANED_UP";
  }
  return "UNKNOWN";
}

} // namespace cloudstrap::model
