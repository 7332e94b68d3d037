#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/provisioned_resources.hpp"
#include "spec/resource_spec.pb.h"

namespace cloudstrap::session {

/*
  A snapshot is an ordered list of "Key: value" lines.

  Stage files are append-only; when a file is re-parsed, later lines win for
  scalar keys and repeated "Security Group" lines accumulate.
*/
using Snapshot = std::vector<std::pair<std::string, std::string>>;

Snapshot SnapshotOf(const cloudstrap::spec::v1::ResourceSpec& spec);
Snapshot SnapshotOf(const model::ProvisionedResources& resources);

// Applies one "Key: value" line to `resources`; unknown keys and empty values are ignored.
void ApplySnapshotLine(const std::string& key, const std::string& value, model::ProvisionedResources& resources);

// Reads one stage file into `resources`. Returns false if the file cannot be opened.
bool ParseStageFile(const std::filesystem::path& path, model::ProvisionedResources& resources);

} // namespace cloudstrap::session
