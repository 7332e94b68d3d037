#pragma once

namespace cloudstrap::util {

/*
  Process-wide cooperative interrupt flag.

  The CLI signal handler calls RequestInterrupt(); blocking waits call
  ThrowIfInterrupted() between sleep slices so the interrupt surfaces as an
  ordinary exception on the provisioning path.
*/

void RequestInterrupt();
void ClearInterrupt();
bool InterruptRequested();

// Throws util::Interrupted when an interrupt is pending.
void ThrowIfInterrupted();

} // namespace cloudstrap::util
