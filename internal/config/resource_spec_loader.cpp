#include "resource_spec_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <algorithm>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace cloudstrap::config {
namespace {

constexpr const char* kDefaultRegion = "ap-guangzhou";

constexpr std::uint32_t kDefaultComputeCores  = 2;
constexpr std::uint32_t kDefaultComputeMemory = 4;
constexpr std::uint32_t kDefaultComputeDisk   = 50;

constexpr std::uint32_t kDefaultDatabaseCores   = 2;
constexpr std::uint32_t kDefaultDatabaseMemory  = 4000;
constexpr std::uint32_t kDefaultDatabaseStorage = 100;
constexpr const char*   kDefaultEngineVersion   = "8.0";

constexpr std::array<const char*, 3> kEngineVersions = {"5.6", "5.7", "8.0"};

cloudstrap::spec::v1::ResourceSpec FromYaml(const YAML::Node& yaml) {
  cloudstrap::spec::v1::ResourceSpec spec;
  try {
    ConfigLoader::YamlToMessage(yaml, &spec);
  } catch (const std::runtime_error& e) {
    throw util::InvalidResourceSpec(e.what());
  }
  ApplyResourceSpecDefaults(&spec);
  return spec;
}

} // namespace

cloudstrap::spec::v1::ResourceSpec LoadResourceSpec(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidResourceSpec("Failed to load resource spec " + path + ": " + e.what());
  }
  return FromYaml(yaml);
}

cloudstrap::spec::v1::ResourceSpec ParseResourceSpec(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidResourceSpec(std::string("Failed to parse resource spec: ") + e.what());
  }
  return FromYaml(yaml);
}

void ApplyResourceSpecDefaults(cloudstrap::spec::v1::ResourceSpec* spec) {
  if (spec->region().empty()) {
    spec->set_region(kDefaultRegion);
  }

  if (spec->has_compute()) {
    auto* c = spec->mutable_compute();
    if (c->cpu_cores() == 0) c->set_cpu_cores(kDefaultComputeCores);
    if (c->memory_gb() == 0) c->set_memory_gb(kDefaultComputeMemory);
    if (c->disk_gb() == 0) c->set_disk_gb(kDefaultComputeDisk);
  }

  if (spec->has_database()) {
    auto* d = spec->mutable_database();
    if (d->cpu_cores() == 0) d->set_cpu_cores(kDefaultDatabaseCores);
    if (d->memory_mb() == 0) d->set_memory_mb(kDefaultDatabaseMemory);
    if (d->storage_gb() == 0) d->set_storage_gb(kDefaultDatabaseStorage);
    if (d->engine_version().empty()) d->set_engine_version(kDefaultEngineVersion);
  }
}

void ValidateResourceSpec(const cloudstrap::spec::v1::ResourceSpec& spec, std::uint32_t min_disk_gb) {
  if (spec.region().empty()) {
    throw util::InvalidResourceSpec("region is required");
  }

  if (spec.has_compute()) {
    const auto& c = spec.compute();
    if (c.cpu_cores() == 0 || c.memory_gb() == 0) {
      throw util::InvalidResourceSpec("compute cpu_cores and memory_gb must be positive");
    }
    if (c.disk_gb() < min_disk_gb) {
      throw util::InvalidResourceSpec("compute disk_gb " + std::to_string(c.disk_gb()) + " is below the minimum of " +
                                      std::to_string(min_disk_gb));
    }
  }

  if (spec.has_database()) {
    const auto& d = spec.database();
    if (d.cpu_cores() == 0 || d.memory_mb() == 0 || d.storage_gb() == 0) {
      throw util::InvalidResourceSpec("database cpu_cores, memory_mb and storage_gb must be positive");
    }
    const bool known = std::any_of(kEngineVersions.begin(), kEngineVersions.end(),
                                   [&](const char* v) { return d.engine_version() == v; });
    if (!known) {
      throw util::InvalidResourceSpec("unsupported database engine_version " + d.engine_version());
    }
  }
}

} // namespace cloudstrap::config
