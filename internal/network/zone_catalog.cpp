#include "zone_catalog.hpp"

#include <map>

namespace cloudstrap::network {
namespace {

const std::map<std::string, std::vector<std::string>>& BuiltinZones() {
  static const std::map<std::string, std::vector<std::string>> kZones = {
      {"ap-guangzhou", {"ap-guangzhou-3", "ap-guangzhou-4", "ap-guangzhou-6", "ap-guangzhou-7"}},
      {"ap-shanghai", {"ap-shanghai-2", "ap-shanghai-3", "ap-shanghai-4", "ap-shanghai-5"}},
      {"ap-beijing", {"ap-beijing-3", "ap-beijing-4", "ap-beijing-5", "ap-beijing-6", "ap-beijing-7"}},
      {"ap-chengdu", {"ap-chengdu-1", "ap-chengdu-2"}},
      {"ap-nanjing", {"ap-nanjing-1", "ap-nanjing-2", "ap-nanjing-3"}},
      {"ap-hongkong", {"ap-hongkong-2", "ap-hongkong-3"}},
      {"ap-singapore", {"ap-singapore-1", "ap-singapore-2", "ap-singapore-3"}},
  };
  return kZones;
}

} // namespace

std::vector<std::string> CandidateZones(const std::string& region, const cloudstrap::runtime::config::RuntimeConfig& config) {
  auto configured = config.zones().find(region);
  if (configured != config.zones().end() && configured->second.zones_size() > 0) {
    return {configured->second.zones().begin(), configured->second.zones().end()};
  }

  auto builtin = BuiltinZones().find(region);
  if (builtin != BuiltinZones().end()) {
    return builtin->second;
  }

  return {region + "-1", region + "-2", region + "-3"};
}

} // namespace cloudstrap::network
