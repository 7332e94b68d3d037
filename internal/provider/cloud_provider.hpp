#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudstrap::provider {

/*
  Cloud provider abstraction.

  One synchronous call per provider action. Implementations translate every
  provider-side failure into util::ProviderError with a classified kind;
  callers never look at provider message text.

  Implementations:
    TENCENT  → signed JSON-over-HTTPS (CVM, VPC, CDB APIs)
    tests    → scripted in-memory fake
*/

struct FirewallRule {
  std::string protocol;   // "ALL", "TCP", ...
  std::string port;       // "ALL" or a single port
  std::string cidr_block; // "0.0.0.0/0"
  std::string description;
};

struct FirewallPolicySet {
  std::vector<FirewallRule> ingress;
  std::vector<FirewallRule> egress;
};

struct InstanceLaunchRequest {
  std::string              zone;
  std::string              instance_class;
  std::string              image_id;
  std::string              name;
  std::string              network_id;
  std::string              subnet_id;
  std::vector<std::string> firewall_ruleset_ids;
  std::uint32_t            disk_gb = 0;
  std::string              disk_type;
  std::uint32_t            bandwidth_mbps = 0;
  std::string              user_data_base64;
};

struct InstanceStatus {
  std::string state; // provider state, "RUNNING" once booted
  std::string public_ip;
  std::string private_ip;
};

struct DatabaseLaunchRequest {
  std::string              zone;
  std::string              region;
  std::uint32_t            memory_mb  = 0;
  std::uint32_t            storage_gb = 0;
  std::string              engine_version;
  std::string              name;
  std::string              network_id;
  std::string              subnet_id;
  std::vector<std::string> firewall_ruleset_ids;
  std::uint32_t            port = 0;
  std::string              root_password;
};

struct DatabaseStatus {
  int           status_code = -1; // 1 = running
  std::string   host;
  std::uint32_t port = 0;
};

class CloudProvider {
 public:
  virtual ~CloudProvider() = default;

  // ------------------------------------------------------------------
  // Network
  // ------------------------------------------------------------------
  virtual std::string CreateNetwork(const std::string& name, const std::string& cidr_block) = 0;
  virtual std::string CreateSubnet(const std::string& network_id, const std::string& name, const std::string& cidr_block,
                                   const std::string& zone)                                 = 0;
  virtual std::string CreateFirewallRuleset(const std::string& name, const std::string& description) = 0;

  /*
    Attach policies to an existing ruleset. Providers may require ingress and
    egress in separate calls; callers pass one direction per call.
  */
  virtual void AddFirewallPolicies(const std::string& ruleset_id, const FirewallPolicySet& policies) = 0;

  // ------------------------------------------------------------------
  // Compute
  // ------------------------------------------------------------------
  virtual std::string                   RunInstance(const InstanceLaunchRequest& request) = 0;
  virtual std::optional<InstanceStatus> DescribeInstance(const std::string& instance_id) = 0;

  // ------------------------------------------------------------------
  // Database
  // ------------------------------------------------------------------
  virtual std::string                   CreateDatabaseInstance(const DatabaseLaunchRequest& request) = 0;
  virtual std::optional<DatabaseStatus> DescribeDatabaseInstance(const std::string& instance_id) = 0;

  // ------------------------------------------------------------------
  // Teardown
  // ------------------------------------------------------------------
  virtual void TerminateInstance(const std::string& instance_id) = 0;

  // Databases are isolated (recoverable for a grace window), not hard-deleted.
  virtual void IsolateDatabaseInstance(const std::string& instance_id) = 0;

  virtual void DeleteFirewallRuleset(const std::string& ruleset_id) = 0;
  virtual void DeleteSubnet(const std::string& subnet_id)           = 0;
  virtual void DeleteNetwork(const std::string& network_id)         = 0;
};

using CloudProviderPtr = std::shared_ptr<CloudProvider>;

} // namespace cloudstrap::provider
