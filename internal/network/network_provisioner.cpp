#include "network_provisioner.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/interrupt.hpp"

namespace cloudstrap::network {

const char* ToString(FirewallPurpose purpose) {
  switch (purpose) {
    case FirewallPurpose::kCompute:
      return "compute";
    case FirewallPurpose::kDatabase:
      return "database";
  }
  return "unknown";
}

std::string SubnetCidr(const std::string& network_cidr, std::size_t zone_index) {
  const auto slash = network_cidr.find('/');
  const auto base  = network_cidr.substr(0, slash);

  std::istringstream in(base);
  std::string        octet;
  std::string        prefix;
  for (int i = 0; i < 2; ++i) {
    if (!std::getline(in, octet, '.') || octet.empty()) {
      throw std::invalid_argument("Malformed network CIDR: " + network_cidr);
    }
    prefix += octet + ".";
  }
  if (zone_index + 1 > 255) {
    throw std::invalid_argument("Too many zones for one network");
  }
  return prefix + std::to_string(zone_index + 1) + ".0/24";
}

NetworkProvisioner::NetworkProvisioner(provider::CloudProviderPtr provider, NetworkSettings settings)
    : provider_(std::move(provider)), settings_(std::move(settings)) {
}

NetworkLayout NetworkProvisioner::CreateNetwork(const std::string& region, const std::vector<std::string>& zones,
                                                model::ProvisionedResources& ledger) {
  observability::SpanScope span("provision.network");
  span.SetAttribute("region", region);

  NetworkLayout layout;
  layout.network_id = provider_->CreateNetwork(settings_.name_prefix + "-vpc", settings_.cidr_block);
  ledger.network_id = layout.network_id;

  CLOUDSTRAP_LOG_INFO("Network created", {observability::StringField("network_id", layout.network_id),
                                          observability::StringField("cidr", settings_.cidr_block)});

  for (std::size_t i = 0; i < zones.size(); ++i) {
    util::ThrowIfInterrupted();
    const auto& zone = zones[i];
    const auto  cidr = SubnetCidr(settings_.cidr_block, i);
    try {
      auto subnet_id = provider_->CreateSubnet(layout.network_id, settings_.name_prefix + "-subnet-" + zone, cidr, zone);
      ledger.subnets[zone] = subnet_id;
      layout.subnets[zone] = subnet_id;
      layout.zones.push_back(zone);
      CLOUDSTRAP_LOG_INFO("Subnet created", {observability::StringField("zone", zone),
                                             observability::StringField("subnet_id", subnet_id),
                                             observability::StringField("cidr", cidr)});
    } catch (const util::ProviderError& e) {
      CLOUDSTRAP_LOG_WARN("Subnet creation failed, skipping zone",
                          {observability::StringField("zone", zone), observability::StringField("code", e.code()),
                           observability::StringField("error", e.what())});
    }
  }

  if (layout.zones.empty()) {
    throw util::NetworkProvisioningFailed("No subnet could be created in any zone of " + region);
  }

  span.SetAttribute("subnets", static_cast<std::int64_t>(layout.zones.size()));
  return layout;
}

std::string NetworkProvisioner::CreateFirewallRuleset(FirewallPurpose purpose, model::ProvisionedResources& ledger) {
  observability::SpanScope span("provision.firewall");
  span.SetAttribute("purpose", ToString(purpose));

  const std::string name = settings_.name_prefix + "-" + ToString(purpose) + "-sg";
  const std::string id   = provider_->CreateFirewallRuleset(name, std::string("cloudstrap ") + ToString(purpose) + " access");
  ledger.firewall_ruleset_ids.push_back(id);

  CLOUDSTRAP_LOG_INFO("Security group created",
                      {observability::StringField("purpose", ToString(purpose)), observability::StringField("id", id)});

  if (purpose == FirewallPurpose::kCompute) {
    provider::FirewallPolicySet ingress;
    ingress.ingress.push_back({"ALL", "ALL", "0.0.0.0/0", "allow all inbound"});
    provider_->AddFirewallPolicies(id, ingress);

    provider::FirewallPolicySet egress;
    egress.egress.push_back({"ALL", "ALL", "0.0.0.0/0", "allow all outbound"});
    provider_->AddFirewallPolicies(id, egress);
  } else {
    provider::FirewallPolicySet ingress;
    ingress.ingress.push_back({"TCP", std::to_string(settings_.database_port), "0.0.0.0/0", "database access"});
    provider_->AddFirewallPolicies(id, ingress);
  }

  return id;
}

} // namespace cloudstrap::network
