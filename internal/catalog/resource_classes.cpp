#include "resource_classes.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace cloudstrap::catalog {
namespace {

struct GpuRow {
  const char* accelerator;
  const char* instance_class;
};

constexpr std::array<GpuRow, 4> kGpuTable{{
    {"t4", "GN7.2XLARGE32"},
    {"v100", "GN8.4XLARGE64"},
    {"a10", "GN7.5XLARGE80"},
    {"a100", "GN7.20XLARGE320"},
}};

constexpr const char* kDefaultGpuClass = "GN7.2XLARGE32";

struct CpuRow {
  std::uint32_t cpu;
  std::uint32_t memory_gb;
  const char*   instance_class;
};

constexpr std::array<CpuRow, 5> kCpuLadder{{
    {2, 4, "S5.MEDIUM4"},
    {2, 8, "S5.LARGE8"},
    {4, 16, "S5.2XLARGE16"},
    {8, 32, "S5.4XLARGE32"},
    {16, 64, "S5.8XLARGE64"},
}};

constexpr const char* kLargestCpuClass = "S5.16XLARGE128";

struct DatabaseRow {
  std::uint32_t cpu;
  std::uint32_t memory_mb;
  std::uint32_t tier_mb;
};

constexpr std::array<DatabaseRow, 5> kDatabaseLadder{{
    {1, 1000, 1000},
    {1, 2000, 2000},
    {2, 4000, 4000},
    {4, 8000, 8000},
    {8, 16000, 16000},
}};

constexpr std::uint32_t kLargestDatabaseTier = 16000;

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

ComputeClass MapResourceClass(std::uint32_t cpu_cores, std::uint32_t memory_gb, std::string_view gpu_class) {
  const std::string gpu = Lower(gpu_class);
  if (!gpu.empty() && gpu != "none") {
    for (const auto& row : kGpuTable) {
      if (gpu == row.accelerator) {
        return {row.instance_class, true};
      }
    }
    return {kDefaultGpuClass, true};
  }

  for (const auto& row : kCpuLadder) {
    if (cpu_cores <= row.cpu && memory_gb <= row.memory_gb) {
      return {row.instance_class, false};
    }
  }
  return {kLargestCpuClass, false};
}

std::uint32_t MapDatabaseClass(std::uint32_t cpu_cores, std::uint32_t memory_mb) {
  for (const auto& row : kDatabaseLadder) {
    if (cpu_cores <= row.cpu && memory_mb <= row.memory_mb) {
      return row.tier_mb;
    }
  }
  return kLargestDatabaseTier;
}

} // namespace cloudstrap::catalog
