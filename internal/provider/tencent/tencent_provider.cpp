#include "tencent_provider.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace cloudstrap::provider::tencent {
namespace {

constexpr std::string_view kCvm = "cvm";
constexpr std::string_view kVpc = "vpc";
constexpr std::string_view kCdb = "cdb";

constexpr std::string_view kCvmVersion = "2017-03-12";
constexpr std::string_view kVpcVersion = "2017-03-12";
constexpr std::string_view kCdbVersion = "2017-03-20";

constexpr int kDatabaseGoodsNum = 1;

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool Contains(std::string_view s, std::string_view needle) {
  return s.find(needle) != std::string_view::npos;
}

json::Value RuleList(const std::vector<FirewallRule>& rules) {
  std::vector<json::Value> out;
  out.reserve(rules.size());
  for (const auto& rule : rules) {
    out.push_back(json::Object({
        {"Protocol", json::String(rule.protocol)},
        {"Port", json::String(rule.port)},
        {"CidrBlock", json::String(rule.cidr_block)},
        {"Action", json::String("ACCEPT")},
        {"PolicyDescription", json::String(rule.description)},
    }));
  }
  return json::List(std::move(out));
}

} // namespace

util::ProviderErrorKind ClassifyErrorCode(std::string_view code) {
  if (StartsWith(code, "ResourceInsufficient") || StartsWith(code, "ResourcesSoldOut") || Contains(code, "TradeError") ||
      Contains(code, "SoldOut")) {
    return util::ProviderErrorKind::kCapacityExhausted;
  }
  if (Contains(code, "InvalidZone")) {
    return util::ProviderErrorKind::kInvalidZone;
  }
  // A resource already being released is as good as gone for teardown.
  if (Contains(code, "NotFound") || Contains(code, "InstanceStateTerminat") || Contains(code, "Isolated") ||
      Contains(code, "Isolating")) {
    return util::ProviderErrorKind::kNotFound;
  }
  if (StartsWith(code, "AuthFailure")) {
    return util::ProviderErrorKind::kAuthFailure;
  }
  return util::ProviderErrorKind::kOther;
}

TencentProvider::TencentProvider(Tc3Credentials credentials, std::string region, std::string endpoint_suffix,
                                 http::HttpTransportPtr transport)
    : credentials_(std::move(credentials)), region_(std::move(region)), endpoint_suffix_(std::move(endpoint_suffix)),
      transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("TencentProvider requires a transport");
  }
  if (endpoint_suffix_.empty()) {
    endpoint_suffix_ = "tencentcloudapi.com";
  }
}

json::Struct TencentProvider::Call(std::string_view service, std::string_view version, std::string_view action,
                                   const json::Struct& body) {
  observability::SpanScope span("tencent." + std::string(action));
  span.SetAttribute("service", service);

  Tc3Request request;
  request.service   = std::string(service);
  request.host      = std::string(service) + "." + endpoint_suffix_;
  request.action    = std::string(action);
  request.version   = std::string(version);
  request.region    = region_;
  request.payload   = json::ToJson(body);
  request.timestamp = static_cast<std::int64_t>(util::ToUnixSeconds(util::Now()));

  http::HttpRequest http_request;
  http_request.host    = request.host;
  http_request.headers = SignRequest(credentials_, request);
  http_request.body    = request.payload;

  const http::HttpResponse http_response = transport_->Post(http_request);

  json::Struct parsed;
  try {
    parsed = json::Parse(http_response.body);
  } catch (const util::ProviderError&) {
    if (http_response.status < 200 || http_response.status >= 300) {
      throw util::ProviderError(util::ProviderErrorKind::kTransport, "HttpStatus",
                                std::string(action) + " failed with HTTP " + std::to_string(http_response.status));
    }
    throw;
  }

  const json::Value* response = json::Find(parsed, "Response");
  if (response == nullptr || !response->has_struct_value()) {
    throw util::ProviderError(util::ProviderErrorKind::kTransport, "MalformedResponse",
                              std::string(action) + " returned no Response object");
  }

  const json::Struct& result     = response->struct_value();
  const std::string   request_id = json::GetString(result, "RequestId");
  const std::string   code       = json::GetString(result, "Error.Code");
  if (!code.empty()) {
    const auto kind = ClassifyErrorCode(code);
    span.RecordException(code);
    CLOUDSTRAP_LOG_WARN("Provider call failed", {observability::StringField("action", action),
                                                 observability::StringField("code", code),
                                                 observability::StringField("kind", util::ToString(kind)),
                                                 observability::StringField("request_id", request_id)});
    throw util::ProviderError(kind, code, code + ": " + json::GetString(result, "Error.Message"), request_id);
  }

  CLOUDSTRAP_LOG_INFO("Provider call", {observability::StringField("action", action),
                                        observability::StringField("request_id", request_id)});
  return result;
}

std::string TencentProvider::RequireString(const json::Struct& response, std::string_view path, std::string_view action) {
  std::string value = json::GetString(response, path);
  if (value.empty()) {
    throw util::ProviderError(util::ProviderErrorKind::kOther, "MissingField",
                              std::string(action) + " response lacks " + std::string(path),
                              json::GetString(response, "RequestId"));
  }
  return value;
}

// ------------------------------------------------------------------
// Network
// ------------------------------------------------------------------

std::string TencentProvider::CreateNetwork(const std::string& name, const std::string& cidr_block) {
  auto response = Call(kVpc, kVpcVersion, "CreateVpc",
                       json::MakeStruct({{"VpcName", json::String(name)}, {"CidrBlock", json::String(cidr_block)}}));
  return RequireString(response, "Vpc.VpcId", "CreateVpc");
}

std::string TencentProvider::CreateSubnet(const std::string& network_id, const std::string& name,
                                          const std::string& cidr_block, const std::string& zone) {
  auto response = Call(kVpc, kVpcVersion, "CreateSubnet",
                       json::MakeStruct({{"VpcId", json::String(network_id)},
                                         {"SubnetName", json::String(name)},
                                         {"CidrBlock", json::String(cidr_block)},
                                         {"Zone", json::String(zone)}}));
  return RequireString(response, "Subnet.SubnetId", "CreateSubnet");
}

std::string TencentProvider::CreateFirewallRuleset(const std::string& name, const std::string& description) {
  auto response = Call(kVpc, kVpcVersion, "CreateSecurityGroup",
                       json::MakeStruct({{"GroupName", json::String(name)}, {"GroupDescription", json::String(description)}}));
  return RequireString(response, "SecurityGroup.SecurityGroupId", "CreateSecurityGroup");
}

void TencentProvider::AddFirewallPolicies(const std::string& ruleset_id, const FirewallPolicySet& policies) {
  json::Struct policy_set;
  if (!policies.ingress.empty()) {
    (*policy_set.mutable_fields())["Ingress"] = RuleList(policies.ingress);
  }
  if (!policies.egress.empty()) {
    (*policy_set.mutable_fields())["Egress"] = RuleList(policies.egress);
  }

  json::Value policy_value;
  *policy_value.mutable_struct_value() = std::move(policy_set);

  Call(kVpc, kVpcVersion, "CreateSecurityGroupPolicies",
       json::MakeStruct({{"SecurityGroupId", json::String(ruleset_id)}, {"SecurityGroupPolicySet", policy_value}}));
}

// ------------------------------------------------------------------
// Compute
// ------------------------------------------------------------------

std::string TencentProvider::RunInstance(const InstanceLaunchRequest& request) {
  auto body = json::MakeStruct({
      {"InstanceChargeType", json::String("POSTPAID_BY_HOUR")},
      {"Placement", json::Object({{"Zone", json::String(request.zone)}})},
      {"InstanceType", json::String(request.instance_class)},
      {"ImageId", json::String(request.image_id)},
      {"SystemDisk", json::Object({{"DiskType", json::String(request.disk_type)},
                                   {"DiskSize", json::Number(request.disk_gb)}})},
      {"InternetAccessible", json::Object({{"InternetChargeType", json::String("TRAFFIC_POSTPAID_BY_HOUR")},
                                           {"InternetMaxBandwidthOut", json::Number(request.bandwidth_mbps)},
                                           {"PublicIpAssigned", json::Bool(true)}})},
      {"VirtualPrivateCloud", json::Object({{"VpcId", json::String(request.network_id)},
                                            {"SubnetId", json::String(request.subnet_id)}})},
      {"InstanceName", json::String(request.name)},
      {"SecurityGroupIds", json::StringList(request.firewall_ruleset_ids)},
      {"InstanceCount", json::Number(1)},
  });
  if (!request.user_data_base64.empty()) {
    (*body.mutable_fields())["UserData"] = json::String(request.user_data_base64);
  }

  auto response = Call(kCvm, kCvmVersion, "RunInstances", body);
  return RequireString(response, "InstanceIdSet.0", "RunInstances");
}

std::optional<InstanceStatus> TencentProvider::DescribeInstance(const std::string& instance_id) {
  auto response = Call(kCvm, kCvmVersion, "DescribeInstances",
                       json::MakeStruct({{"InstanceIds", json::StringList({instance_id})}}));
  if (json::Find(response, "InstanceSet.0") == nullptr) {
    return std::nullopt;
  }

  InstanceStatus status;
  status.state      = json::GetString(response, "InstanceSet.0.InstanceState");
  status.public_ip  = json::GetString(response, "InstanceSet.0.PublicIpAddresses.0");
  status.private_ip = json::GetString(response, "InstanceSet.0.PrivateIpAddresses.0");
  return status;
}

// ------------------------------------------------------------------
// Database
// ------------------------------------------------------------------

std::string TencentProvider::CreateDatabaseInstance(const DatabaseLaunchRequest& request) {
  auto response = Call(kCdb, kCdbVersion, "CreateDBInstanceHour",
                       json::MakeStruct({
                           {"GoodsNum", json::Number(kDatabaseGoodsNum)},
                           {"Memory", json::Number(request.memory_mb)},
                           {"Volume", json::Number(request.storage_gb)},
                           {"Zone", json::String(request.zone)},
                           {"MasterRegion", json::String(request.region)},
                           {"UniqVpcId", json::String(request.network_id)},
                           {"UniqSubnetId", json::String(request.subnet_id)},
                           {"ProjectId", json::Number(0)},
                           {"InstanceRole", json::String("master")},
                           {"EngineVersion", json::String(request.engine_version)},
                           {"InstanceName", json::String(request.name)},
                           {"SecurityGroup", json::StringList(request.firewall_ruleset_ids)},
                           {"ProtectMode", json::Number(0)},
                           {"DeployMode", json::Number(0)},
                           {"Port", json::Number(request.port)},
                           {"Password", json::String(request.root_password)},
                       }));
  return RequireString(response, "InstanceIds.0", "CreateDBInstanceHour");
}

std::optional<DatabaseStatus> TencentProvider::DescribeDatabaseInstance(const std::string& instance_id) {
  auto response = Call(kCdb, kCdbVersion, "DescribeDBInstances",
                       json::MakeStruct({{"InstanceIds", json::StringList({instance_id})}}));
  if (json::GetNumber(response, "TotalCount") <= 0 || json::Find(response, "Items.0") == nullptr) {
    return std::nullopt;
  }

  DatabaseStatus status;
  status.status_code = static_cast<int>(json::GetNumber(response, "Items.0.Status", -1));
  status.host        = json::GetString(response, "Items.0.Vip");
  status.port        = static_cast<std::uint32_t>(json::GetNumber(response, "Items.0.Vport"));
  return status;
}

// ------------------------------------------------------------------
// Teardown
// ------------------------------------------------------------------

void TencentProvider::TerminateInstance(const std::string& instance_id) {
  Call(kCvm, kCvmVersion, "TerminateInstances", json::MakeStruct({{"InstanceIds", json::StringList({instance_id})}}));
}

void TencentProvider::IsolateDatabaseInstance(const std::string& instance_id) {
  Call(kCdb, kCdbVersion, "IsolateDBInstance", json::MakeStruct({{"InstanceId", json::String(instance_id)}}));
}

void TencentProvider::DeleteFirewallRuleset(const std::string& ruleset_id) {
  Call(kVpc, kVpcVersion, "DeleteSecurityGroup", json::MakeStruct({{"SecurityGroupId", json::String(ruleset_id)}}));
}

void TencentProvider::DeleteSubnet(const std::string& subnet_id) {
  Call(kVpc, kVpcVersion, "DeleteSubnet", json::MakeStruct({{"SubnetId", json::String(subnet_id)}}));
}

void TencentProvider::DeleteNetwork(const std::string& network_id) {
  Call(kVpc, kVpcVersion, "DeleteVpc", json::MakeStruct({{"VpcId", json::String(network_id)}}));
}

} // namespace cloudstrap::provider::tencent
