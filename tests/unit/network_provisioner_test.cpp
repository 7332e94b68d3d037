#include "internal/network/network_provisioner.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_cloud_provider.hpp"
#include "internal/network/zone_catalog.hpp"

namespace {

using cloudstrap::model::ProvisionedResources;
using cloudstrap::network::FirewallPurpose;
using cloudstrap::network::NetworkProvisioner;
using cloudstrap::network::NetworkSettings;
using cloudstrap::testing::FakeCloudProvider;
using cloudstrap::util::ProviderErrorKind;

void TestSubnetCidrs() {
  using cloudstrap::network::SubnetCidr;
  assert(SubnetCidr("10.0.0.0/16", 0) == "10.0.1.0/24");
  assert(SubnetCidr("10.0.0.0/16", 2) == "10.0.3.0/24");
  assert(SubnetCidr("172.16.0.0/16", 0) == "172.16.1.0/24");

  bool threw = false;
  try {
    SubnetCidr("garbage", 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestOneSubnetPerZone() {
  auto               fake = std::make_shared<FakeCloudProvider>();
  NetworkProvisioner provisioner(fake, NetworkSettings{});
  ProvisionedResources ledger;

  auto layout = provisioner.CreateNetwork("ap-test", {"ap-test-1", "ap-test-2"}, ledger);

  assert(!layout.network_id.empty());
  assert(ledger.network_id == layout.network_id);
  assert((layout.zones == std::vector<std::string>{"ap-test-1", "ap-test-2"}));
  assert(ledger.subnets.size() == 2);
  assert(fake->CountCalls("CreateSubnet:ap-test-1:10.0.1.0/24") == 1);
  assert(fake->CountCalls("CreateSubnet:ap-test-2:10.0.2.0/24") == 1);
}

void TestFailedZoneIsSkipped() {
  auto fake = std::make_shared<FakeCloudProvider>();
  fake->subnet_failures["ap-test-1"] = ProviderErrorKind::kInvalidZone;

  NetworkProvisioner   provisioner(fake, NetworkSettings{});
  ProvisionedResources ledger;
  auto                 layout = provisioner.CreateNetwork("ap-test", {"ap-test-1", "ap-test-2"}, ledger);

  assert((layout.zones == std::vector<std::string>{"ap-test-2"}));
  assert(ledger.subnets.count("ap-test-1") == 0);
  assert(ledger.subnets.count("ap-test-2") == 1);
}

void TestNoSubnetsFailsButKeepsNetworkInLedger() {
  auto fake = std::make_shared<FakeCloudProvider>();
  fake->subnet_failures["ap-test-1"] = ProviderErrorKind::kOther;

  NetworkProvisioner   provisioner(fake, NetworkSettings{});
  ProvisionedResources ledger;
  bool                 threw = false;
  try {
    provisioner.CreateNetwork("ap-test", {"ap-test-1"}, ledger);
  } catch (const cloudstrap::util::NetworkProvisioningFailed&) {
    threw = true;
  }
  assert(threw);
  assert(!ledger.network_id.empty());
}

void TestComputeRulesetAllowsBothDirections() {
  auto                 fake = std::make_shared<FakeCloudProvider>();
  NetworkProvisioner   provisioner(fake, NetworkSettings{});
  ProvisionedResources ledger;

  const auto id = provisioner.CreateFirewallRuleset(FirewallPurpose::kCompute, ledger);

  assert((ledger.firewall_ruleset_ids == std::vector<std::string>{id}));
  assert(fake->policies.size() == 2);
  assert(fake->policies[0].second.ingress.size() == 1);
  assert(fake->policies[0].second.egress.empty());
  assert(fake->policies[1].second.egress.size() == 1);
  assert(fake->policies[1].second.ingress.empty());
}

void TestDatabaseRulesetOpensOnlyDatabasePort() {
  auto            fake = std::make_shared<FakeCloudProvider>();
  NetworkSettings settings;
  settings.database_port = 3307;
  NetworkProvisioner   provisioner(fake, settings);
  ProvisionedResources ledger;

  provisioner.CreateFirewallRuleset(FirewallPurpose::kDatabase, ledger);

  assert(fake->policies.size() == 1);
  const auto& rules = fake->policies[0].second.ingress;
  assert(rules.size() == 1);
  assert(rules[0].protocol == "TCP");
  assert(rules[0].port == "3307");
}

void TestZoneCatalog() {
  using cloudstrap::network::CandidateZones;
  cloudstrap::runtime::config::RuntimeConfig config;

  auto guangzhou = CandidateZones("ap-guangzhou", config);
  assert(guangzhou.size() == 4);
  assert(guangzhou.front() == "ap-guangzhou-3");

  auto unknown = CandidateZones("eu-frankfurt", config);
  assert((unknown == std::vector<std::string>{"eu-frankfurt-1", "eu-frankfurt-2", "eu-frankfurt-3"}));

  (*config.mutable_zones())["ap-guangzhou"].add_zones("ap-guangzhou-7");
  assert((CandidateZones("ap-guangzhou", config) == std::vector<std::string>{"ap-guangzhou-7"}));
}

} // namespace

int main() {
  TestSubnetCidrs();
  TestOneSubnetPerZone();
  TestFailedZoneIsSkipped();
  TestNoSubnetsFailsButKeepsNetworkInLedger();
  TestComputeRulesetAllowsBothDirections();
  TestDatabaseRulesetOpensOnlyDatabasePort();
  TestZoneCatalog();

  std::cout << "cloudstrap_unit_network_provisioner: pass\n";
  return 0;
}
