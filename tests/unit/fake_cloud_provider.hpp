#pragma once

#include <algorithm>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/provider/cloud_provider.hpp"
#include "internal/util/errors.hpp"

namespace cloudstrap::testing {

/*
  Scripted in-memory provider.

  Per-zone failures and status sequences are configured up front; every call
  is appended to `calls` as "<Action>[:<detail>]". Resources live in `live`
  until deleted; deleting an unknown id raises kNotFound like the real API.
*/
class FakeCloudProvider : public provider::CloudProvider {
 public:
  // zone -> failure kind
  std::map<std::string, util::ProviderErrorKind> subnet_failures;
  std::map<std::string, util::ProviderErrorKind> instance_failures;
  std::map<std::string, util::ProviderErrorKind> database_failures;
  std::optional<util::ProviderErrorKind>         network_failure;
  std::string                                    network_failure_message; // replaces the default message when set

  // Consumed front to back; once empty, resources report ready.
  std::deque<std::optional<provider::InstanceStatus>> instance_statuses;
  std::deque<std::optional<provider::DatabaseStatus>> database_statuses;
  bool                                                instance_never_ready = false;

  // Ids whose deletion fails with kOther.
  std::set<std::string> failing_deletes;

  std::vector<std::string>                      calls;
  std::set<std::string>                         live;
  std::vector<provider::InstanceLaunchRequest>  launches;
  std::vector<provider::DatabaseLaunchRequest>  database_launches;
  std::vector<std::pair<std::string, provider::FirewallPolicySet>> policies;

  static util::ProviderError Error(util::ProviderErrorKind kind) {
    return util::ProviderError(kind, std::string("Fake.") + util::ToString(kind), std::string("fake ") + util::ToString(kind));
  }

  std::size_t CountCalls(const std::string& prefix) const {
    return static_cast<std::size_t>(std::count_if(calls.begin(), calls.end(), [&](const std::string& c) {
      return c.rfind(prefix, 0) == 0;
    }));
  }

  std::string CreateNetwork(const std::string&, const std::string& cidr_block) override {
    calls.push_back("CreateNetwork:" + cidr_block);
    if (network_failure) {
      if (!network_failure_message.empty()) {
        throw util::ProviderError(*network_failure, "Fake.network", network_failure_message);
      }
      throw Error(*network_failure);
    }
    return Allocate("vpc");
  }

  std::string CreateSubnet(const std::string&, const std::string&, const std::string& cidr_block,
                           const std::string& zone) override {
    calls.push_back("CreateSubnet:" + zone + ":" + cidr_block);
    FailIfScripted(subnet_failures, zone);
    return Allocate("subnet");
  }

  std::string CreateFirewallRuleset(const std::string& name, const std::string&) override {
    calls.push_back("CreateFirewallRuleset:" + name);
    return Allocate("sg");
  }

  void AddFirewallPolicies(const std::string& ruleset_id, const provider::FirewallPolicySet& set) override {
    calls.push_back("AddFirewallPolicies:" + ruleset_id);
    policies.emplace_back(ruleset_id, set);
  }

  std::string RunInstance(const provider::InstanceLaunchRequest& request) override {
    calls.push_back("RunInstance:" + request.zone);
    launches.push_back(request);
    FailIfScripted(instance_failures, request.zone);
    return Allocate("ins");
  }

  std::optional<provider::InstanceStatus> DescribeInstance(const std::string& instance_id) override {
    calls.push_back("DescribeInstance:" + instance_id);
    if (instance_never_ready) {
      return provider::InstanceStatus{"PENDING", "", ""};
    }
    if (!instance_statuses.empty()) {
      auto next = instance_statuses.front();
      instance_statuses.pop_front();
      return next;
    }
    return provider::InstanceStatus{"RUNNING", "203.0.113.10", "10.0.1.5"};
  }

  std::string CreateDatabaseInstance(const provider::DatabaseLaunchRequest& request) override {
    calls.push_back("CreateDatabaseInstance:" + request.zone);
    database_launches.push_back(request);
    FailIfScripted(database_failures, request.zone);
    return Allocate("cdb");
  }

  std::optional<provider::DatabaseStatus> DescribeDatabaseInstance(const std::string& instance_id) override {
    calls.push_back("DescribeDatabaseInstance:" + instance_id);
    if (!database_statuses.empty()) {
      auto next = database_statuses.front();
      database_statuses.pop_front();
      return next;
    }
    return provider::DatabaseStatus{1, "10.0.1.20", 3306};
  }

  void TerminateInstance(const std::string& id) override {
    Release("TerminateInstance", id);
  }
  void IsolateDatabaseInstance(const std::string& id) override {
    Release("IsolateDatabaseInstance", id);
  }
  void DeleteFirewallRuleset(const std::string& id) override {
    Release("DeleteFirewallRuleset", id);
  }
  void DeleteSubnet(const std::string& id) override {
    Release("DeleteSubnet", id);
  }
  void DeleteNetwork(const std::string& id) override {
    Release("DeleteNetwork", id);
  }

 private:
  std::string Allocate(const std::string& kind) {
    std::string id = kind + "-" + std::to_string(++next_id_);
    live.insert(id);
    return id;
  }

  void FailIfScripted(const std::map<std::string, util::ProviderErrorKind>& failures, const std::string& zone) const {
    auto it = failures.find(zone);
    if (it != failures.end()) {
      throw Error(it->second);
    }
  }

  void Release(const std::string& action, const std::string& id) {
    calls.push_back(action + ":" + id);
    if (failing_deletes.count(id) != 0) {
      throw Error(util::ProviderErrorKind::kOther);
    }
    if (live.erase(id) == 0) {
      throw Error(util::ProviderErrorKind::kNotFound);
    }
  }

  int next_id_ = 0;
};

} // namespace cloudstrap::testing
