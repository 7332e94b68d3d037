#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cloudstrap::model {

struct ComputeRecord {
  std::string instance_id;
  std::string zone;
  std::string instance_class;
  std::string public_ip;
  std::string private_ip;
  std::string private_key_path;
  std::string login_account;
  bool        gpu_enabled = false;
};

struct DatabaseRecord {
  std::string   instance_id;
  std::string   zone;
  std::string   host;
  std::uint32_t port = 0;
  std::string   username;
  std::string   password;
};

/*
  Ledger of one provisioning run.

  Only ids confirmed by a successful provider response are written here, and
  fields only ever accumulate. The compensator tears down whatever is present.
*/
struct ProvisionedResources {
  std::string                        region;
  std::string                        network_id;
  std::map<std::string, std::string> subnets; // zone -> subnet id
  std::vector<std::string>           firewall_ruleset_ids;
  std::optional<ComputeRecord>       compute;
  std::optional<DatabaseRecord>      database;

  bool Empty() const {
    return network_id.empty() && subnets.empty() && firewall_ruleset_ids.empty() && !compute && !database;
  }
};

/*
  What the external remote-setup step needs to open a shell on the node.
*/
struct RemoteAccess {
  std::string public_address;
  std::string private_key_path;
  std::string login_account;
};

} // namespace cloudstrap::model
