#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/interrupt.hpp"

namespace cloudstrap::provision {

struct PollOptions {
  std::chrono::milliseconds interval{10000};
  std::chrono::milliseconds max_wait{300000};
};

// Upper bound on one uninterruptible sleep.
inline constexpr std::chrono::milliseconds kSleepSlice{250};

/*
  Calls `probe()` until it yields a value.

  probe() returns std::optional<T>; std::nullopt means "not ready yet".
  Sleeps min(interval, remaining) between probes and probes once more at the
  deadline, so ProvisioningTimeout is raised no earlier than max_wait and at
  most one probe after it. A pending interrupt raises util::Interrupted
  between sleep slices.
*/
template <typename Probe>
auto PollUntil(std::string_view what, const PollOptions& options, Probe&& probe) ->
    typename std::invoke_result_t<Probe&>::value_type {
  using Steady     = std::chrono::steady_clock;
  const auto start = Steady::now();

  while (true) {
    util::ThrowIfInterrupted();

    if (auto result = probe()) {
      return std::move(*result);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Steady::now() - start);
    if (elapsed >= options.max_wait) {
      throw util::ProvisioningTimeout(std::string(what) + " not ready after " + std::to_string(elapsed.count()) + " ms");
    }

    const auto wake = Steady::now() + std::min(options.interval, options.max_wait - elapsed);
    for (auto now = Steady::now(); now < wake; now = Steady::now()) {
      std::this_thread::sleep_for(std::min<Steady::duration>(kSleepSlice, wake - now));
      util::ThrowIfInterrupted();
    }
  }
}

} // namespace cloudstrap::provision
