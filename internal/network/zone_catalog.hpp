#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"

namespace cloudstrap::network {

/*
  Ordered candidate zones for a region.

  Lookup order: config `zones` override, built-in table, then the
  `<region>-1`, `<region>-2`, `<region>-3` convention.
*/
std::vector<std::string> CandidateZones(const std::string& region, const cloudstrap::runtime::config::RuntimeConfig& config);

} // namespace cloudstrap::network
