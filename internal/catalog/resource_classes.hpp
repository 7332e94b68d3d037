#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cloudstrap::catalog {

/*
  Resource-class tables.

  Both ladders are ordered by capacity; a request maps to the first row
  whose ceilings cover it, so a larger request never maps to a smaller
  class.
*/

struct ComputeClass {
  std::string instance_class;
  bool        gpu_enabled = false;
};

// Empty or "none" gpu_class selects the CPU ladder. Matching is
// case-insensitive; an unknown accelerator maps to the smallest GPU tier.
ComputeClass MapResourceClass(std::uint32_t cpu_cores, std::uint32_t memory_gb, std::string_view gpu_class);

// Database memory tier in MB.
std::uint32_t MapDatabaseClass(std::uint32_t cpu_cores, std::uint32_t memory_mb);

} // namespace cloudstrap::catalog
