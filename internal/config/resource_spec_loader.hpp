#pragma once

#include <cstdint>
#include <string>

#include "spec/resource_spec.pb.h"

namespace cloudstrap::config {

/*
  ResourceSpec files are JSON or YAML (JSON is valid YAML) and go through the
  same YAML -> JSON -> protobuf path as the runtime config.
*/
cloudstrap::spec::v1::ResourceSpec LoadResourceSpec(const std::string& path);
cloudstrap::spec::v1::ResourceSpec ParseResourceSpec(const std::string& text);

// Fills zero-valued fields: region ap-guangzhou, compute 2 cores / 4 GB /
// 50 GB, database 2 cores / 4000 MB / 100 GB / engine 8.0.
void ApplyResourceSpecDefaults(cloudstrap::spec::v1::ResourceSpec* spec);

// Throws util::InvalidResourceSpec.
void ValidateResourceSpec(const cloudstrap::spec::v1::ResourceSpec& spec, std::uint32_t min_disk_gb);

} // namespace cloudstrap::config
