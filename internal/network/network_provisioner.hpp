#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/model/provisioned_resources.hpp"
#include "internal/provider/cloud_provider.hpp"

namespace cloudstrap::network {

/*
  Zones that actually received a subnet, in candidate order. This is the
  authoritative zone set for every later placement.
*/
struct NetworkLayout {
  std::string                        network_id;
  std::vector<std::string>           zones;
  std::map<std::string, std::string> subnets; // zone -> subnet id
};

enum class FirewallPurpose {
  kCompute,  // allow all, both directions
  kDatabase, // TCP ingress on the database port only
};

const char* ToString(FirewallPurpose purpose);

struct NetworkSettings {
  std::string   cidr_block    = "10.0.0.0/16";
  std::string   name_prefix   = "cloudstrap";
  std::uint32_t database_port = 3306;
};

// Per-zone /24 inside the network block: index 0 -> "a.b.1.0/24".
std::string SubnetCidr(const std::string& network_cidr, std::size_t zone_index);

class NetworkProvisioner {
 public:
  NetworkProvisioner(provider::CloudProviderPtr provider, NetworkSettings settings);

  /*
    Creates the network and one subnet per zone. A zone whose subnet fails is
    skipped; NetworkProvisioningFailed is thrown when none succeeds. Ids are
    written to `ledger` as the provider confirms them.
  */
  NetworkLayout CreateNetwork(const std::string& region, const std::vector<std::string>& zones,
                              model::ProvisionedResources& ledger);

  // The ruleset id is recorded before its policies are attached.
  std::string CreateFirewallRuleset(FirewallPurpose purpose, model::ProvisionedResources& ledger);

 private:
  provider::CloudProviderPtr provider_;
  NetworkSettings            settings_;
};

} // namespace cloudstrap::network
