#include "internal/catalog/resource_classes.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using cloudstrap::catalog::MapDatabaseClass;
using cloudstrap::catalog::MapResourceClass;

int CpuRank(const std::string& instance_class) {
  static const std::vector<std::string> kOrder = {"S5.MEDIUM4",   "S5.LARGE8",    "S5.2XLARGE16",
                                                  "S5.4XLARGE32", "S5.8XLARGE64", "S5.16XLARGE128"};
  for (std::size_t i = 0; i < kOrder.size(); ++i) {
    if (kOrder[i] == instance_class) {
      return static_cast<int>(i);
    }
  }
  assert(false && "unknown instance class");
  return -1;
}

void TestCpuLadderRows() {
  assert(MapResourceClass(2, 4, "").instance_class == "S5.MEDIUM4");
  assert(MapResourceClass(1, 1, "").instance_class == "S5.MEDIUM4");
  assert(MapResourceClass(2, 8, "").instance_class == "S5.LARGE8");
  assert(MapResourceClass(4, 16, "").instance_class == "S5.2XLARGE16");
  assert(MapResourceClass(3, 5, "").instance_class == "S5.2XLARGE16");
  assert(MapResourceClass(8, 32, "").instance_class == "S5.4XLARGE32");
  assert(MapResourceClass(16, 64, "").instance_class == "S5.8XLARGE64");
  assert(MapResourceClass(32, 128, "").instance_class == "S5.16XLARGE128");
  assert(MapResourceClass(17, 4, "").instance_class == "S5.16XLARGE128");
  assert(!MapResourceClass(2, 4, "none").gpu_enabled);
}

void TestCpuLadderIsMonotone() {
  for (std::uint32_t cpu = 1; cpu <= 24; ++cpu) {
    for (std::uint32_t mem = 1; mem <= 96; ++mem) {
      const int rank = CpuRank(MapResourceClass(cpu, mem, "").instance_class);
      assert(CpuRank(MapResourceClass(cpu + 1, mem, "").instance_class) >= rank);
      assert(CpuRank(MapResourceClass(cpu, mem + 1, "").instance_class) >= rank);
    }
  }
}

void TestGpuTable() {
  auto t4 = MapResourceClass(2, 4, "T4");
  assert(t4.instance_class == "GN7.2XLARGE32");
  assert(t4.gpu_enabled);
  assert(MapResourceClass(2, 4, "v100").instance_class == "GN8.4XLARGE64");
  assert(MapResourceClass(2, 4, "A10").instance_class == "GN7.5XLARGE80");
  assert(MapResourceClass(2, 4, "a100").instance_class == "GN7.20XLARGE320");

  auto unknown = MapResourceClass(64, 512, "H100");
  assert(unknown.instance_class == "GN7.2XLARGE32");
  assert(unknown.gpu_enabled);

  assert(!MapResourceClass(2, 4, "NONE").gpu_enabled);
}

void TestDatabaseLadder() {
  assert(MapDatabaseClass(1, 1000) == 1000);
  assert(MapDatabaseClass(1, 1500) == 2000);
  assert(MapDatabaseClass(2, 1000) == 4000);
  assert(MapDatabaseClass(2, 4000) == 4000);
  assert(MapDatabaseClass(4, 8000) == 8000);
  assert(MapDatabaseClass(8, 16000) == 16000);
  assert(MapDatabaseClass(64, 256000) == 16000);

  for (std::uint32_t cpu = 1; cpu <= 12; ++cpu) {
    for (std::uint32_t mem = 500; mem <= 20000; mem += 500) {
      const auto tier = MapDatabaseClass(cpu, mem);
      assert(MapDatabaseClass(cpu + 1, mem) >= tier);
      assert(MapDatabaseClass(cpu, mem + 500) >= tier);
    }
  }
}

} // namespace

int main() {
  TestCpuLadderRows();
  TestCpuLadderIsMonotone();
  TestGpuTable();
  TestDatabaseLadder();

  std::cout << "cloudstrap_unit_resource_classes: pass\n";
  return 0;
}
