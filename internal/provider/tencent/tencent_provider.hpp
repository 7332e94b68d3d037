#pragma once

#include <string>
#include <string_view>

#include "internal/provider/cloud_provider.hpp"
#include "internal/provider/http/http_transport.hpp"
#include "internal/provider/tencent/json_helpers.hpp"
#include "internal/provider/tencent/tc3_signer.hpp"
#include "internal/util/errors.hpp"

namespace cloudstrap::provider::tencent {

/*
  Maps a Tencent Cloud error code onto the provider-neutral taxonomy.

    ResourceInsufficient* / ResourcesSoldOut* / *TradeError* / *SoldOut* → capacity
    *InvalidZone*                                                        → invalid zone
    *NotFound* / *InstanceStateTerminat* / *Isolated* / *Isolating*      → not found
    AuthFailure*                                                         → auth
*/
util::ProviderErrorKind ClassifyErrorCode(std::string_view code);

/*
  CloudProvider over Tencent Cloud API 3.0.

  VPC and security groups go to the "vpc" service, instances to "cvm",
  databases to "cdb". Each call is one signed POST; a Response.Error in the
  body is raised as ProviderError with the classified kind.
*/
class TencentProvider final : public CloudProvider {
 public:
  TencentProvider(Tc3Credentials credentials, std::string region, std::string endpoint_suffix,
                  http::HttpTransportPtr transport);

  std::string CreateNetwork(const std::string& name, const std::string& cidr_block) override;
  std::string CreateSubnet(const std::string& network_id, const std::string& name, const std::string& cidr_block,
                           const std::string& zone) override;
  std::string CreateFirewallRuleset(const std::string& name, const std::string& description) override;
  void        AddFirewallPolicies(const std::string& ruleset_id, const FirewallPolicySet& policies) override;

  std::string                   RunInstance(const InstanceLaunchRequest& request) override;
  std::optional<InstanceStatus> DescribeInstance(const std::string& instance_id) override;

  std::string                   CreateDatabaseInstance(const DatabaseLaunchRequest& request) override;
  std::optional<DatabaseStatus> DescribeDatabaseInstance(const std::string& instance_id) override;

  void TerminateInstance(const std::string& instance_id) override;
  void IsolateDatabaseInstance(const std::string& instance_id) override;
  void DeleteFirewallRuleset(const std::string& ruleset_id) override;
  void DeleteSubnet(const std::string& subnet_id) override;
  void DeleteNetwork(const std::string& network_id) override;

 private:
  // Returns the "Response" object of a successful call.
  json::Struct Call(std::string_view service, std::string_view version, std::string_view action,
                    const json::Struct& body);

  // Throws ProviderError(kOther) when a confirmed id is missing from the response.
  static std::string RequireString(const json::Struct& response, std::string_view path, std::string_view action);

  Tc3Credentials         credentials_;
  std::string            region_;
  std::string            endpoint_suffix_;
  http::HttpTransportPtr transport_;
};

} // namespace cloudstrap::provider::tencent
