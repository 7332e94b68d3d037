#include "interrupt.hpp"

#include <csignal>

#include "errors.hpp"

namespace cloudstrap::util {
namespace {

volatile std::sig_atomic_t g_interrupted = 0;

} // namespace

void RequestInterrupt() {
  g_interrupted = 1;
}

void ClearInterrupt() {
  g_interrupted = 0;
}

bool InterruptRequested() {
  return g_interrupted != 0;
}

void ThrowIfInterrupted() {
  if (InterruptRequested()) {
    throw Interrupted("interrupted by signal");
  }
}

} // namespace cloudstrap::util
