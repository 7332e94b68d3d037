#include "snapshot.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace cloudstrap::session {
namespace {

constexpr const char* kSubnetPrefix = "Subnet[";

void Put(Snapshot& out, const char* key, const std::string& value) {
  if (!value.empty()) {
    out.emplace_back(key, value);
  }
}

void Put(Snapshot& out, const char* key, std::uint32_t value) {
  if (value != 0) {
    out.emplace_back(key, std::to_string(value));
  }
}

model::ComputeRecord& Compute(model::ProvisionedResources& r) {
  if (!r.compute) {
    r.compute.emplace();
  }
  return *r.compute;
}

model::DatabaseRecord& Database(model::ProvisionedResources& r) {
  if (!r.database) {
    r.database.emplace();
  }
  return *r.database;
}

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

} // namespace

Snapshot SnapshotOf(const cloudstrap::spec::v1::ResourceSpec& spec) {
  Snapshot out;
  Put(out, "Region", spec.region());
  if (spec.has_compute()) {
    const auto& c = spec.compute();
    Put(out, "Compute CPU Cores", c.cpu_cores());
    Put(out, "Compute Memory GB", c.memory_gb());
    Put(out, "Compute Disk GB", c.disk_gb());
    Put(out, "Compute GPU", c.gpu_class().empty() ? std::string("none") : c.gpu_class());
  }
  if (spec.has_database()) {
    const auto& d = spec.database();
    Put(out, "Database CPU Cores", d.cpu_cores());
    Put(out, "Database Memory MB", d.memory_mb());
    Put(out, "Database Storage GB", d.storage_gb());
    Put(out, "Database Engine", d.engine_version());
  }
  return out;
}

Snapshot SnapshotOf(const model::ProvisionedResources& resources) {
  Snapshot out;
  Put(out, "Region", resources.region);
  Put(out, "Network ID", resources.network_id);
  for (const auto& [zone, subnet_id] : resources.subnets) {
    out.emplace_back(kSubnetPrefix + zone + "]", subnet_id);
  }
  for (const auto& id : resources.firewall_ruleset_ids) {
    out.emplace_back("Security Group", id);
  }
  if (resources.compute) {
    const auto& c = *resources.compute;
    Put(out, "Instance ID", c.instance_id);
    Put(out, "Zone", c.zone);
    Put(out, "Instance Class", c.instance_class);
    Put(out, "GPU Enabled", c.gpu_enabled ? std::string("yes") : std::string("no"));
    Put(out, "Public IP", c.public_ip);
    Put(out, "Private IP", c.private_ip);
    Put(out, "SSH Key", c.private_key_path);
    Put(out, "Login Account", c.login_account);
  }
  if (resources.database) {
    const auto& d = *resources.database;
    Put(out, "Database Instance ID", d.instance_id);
    Put(out, "Database Zone", d.zone);
    Put(out, "Database Host", d.host);
    Put(out, "Database Port", d.port);
    Put(out, "Database Username", d.username);
    Put(out, "Database Password", d.password);
  }
  return out;
}

void ApplySnapshotLine(const std::string& key, const std::string& value, model::ProvisionedResources& r) {
  if (value.empty()) {
    return;
  }

  if (key == "Region") {
    r.region = value;
  } else if (key == "Network ID") {
    r.network_id = value;
  } else if (key.rfind(kSubnetPrefix, 0) == 0 && key.size() > 8 && key.back() == ']') {
    r.subnets[key.substr(7, key.size() - 8)] = value;
  } else if (key == "Security Group") {
    if (std::find(r.firewall_ruleset_ids.begin(), r.firewall_ruleset_ids.end(), value) == r.firewall_ruleset_ids.end()) {
      r.firewall_ruleset_ids.push_back(value);
    }
  } else if (key == "Instance ID") {
    Compute(r).instance_id = value;
  } else if (key == "Zone") {
    Compute(r).zone = value;
  } else if (key == "Instance Class") {
    Compute(r).instance_class = value;
  } else if (key == "GPU Enabled") {
    Compute(r).gpu_enabled = value == "yes";
  } else if (key == "Public IP") {
    Compute(r).public_ip = value;
  } else if (key == "Private IP") {
    Compute(r).private_ip = value;
  } else if (key == "SSH Key") {
    Compute(r).private_key_path = value;
  } else if (key == "Login Account") {
    Compute(r).login_account = value;
  } else if (key == "Database Instance ID") {
    Database(r).instance_id = value;
  } else if (key == "Database Zone") {
    Database(r).zone = value;
  } else if (key == "Database Host") {
    Database(r).host = value;
  } else if (key == "Database Port") {
    Database(r).port = static_cast<std::uint32_t>(std::strtoul(value.c_str(), nullptr, 10));
  } else if (key == "Database Username") {
    Database(r).username = value;
  } else if (key == "Database Password") {
    Database(r).password = value;
  }
}

bool ParseStageFile(const std::filesystem::path& path, model::ProvisionedResources& resources) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }

  std::string line;
  while (std::getline(in, line)) {
    const auto sep = line.find(": ");
    if (sep == std::string::npos) {
      continue;
    }
    ApplySnapshotLine(Trim(line.substr(0, sep)), Trim(line.substr(sep + 2)), resources);
  }
  return true;
}

} // namespace cloudstrap::session
