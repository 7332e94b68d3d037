#include "session_cleanup.hpp"

#include "internal/observability/logging.hpp"

namespace cloudstrap::cleanup {

std::vector<std::string> DescribePlan(const model::ProvisionedResources& resources, const CleanupOptions& options) {
  std::vector<std::string> plan;

  if (options.scope != CleanupScope::kLocalOnly) {
    if (resources.compute && !resources.compute->instance_id.empty()) {
      plan.push_back("terminate instance " + resources.compute->instance_id);
    }
    if (resources.database && !resources.database->instance_id.empty()) {
      plan.push_back("isolate database " + resources.database->instance_id);
    }
    for (const auto& id : resources.firewall_ruleset_ids) {
      plan.push_back("delete security group " + id);
    }
    for (const auto& [zone, id] : resources.subnets) {
      plan.push_back("delete subnet " + id + " (" + zone + ")");
    }
    if (!resources.network_id.empty()) {
      plan.push_back("delete network " + resources.network_id);
    }
  }

  if (options.scope != CleanupScope::kCloudOnly) {
    plan.push_back(options.keep_logs ? "remove local key pair, keep stage logs" : "remove local session directory");
  }
  return plan;
}

CleanupResult CleanupSession(session::SessionStore& store, const session::Session& session,
                             const CleanupOptions& options, const ProviderFactory& provider_factory,
                             std::chrono::milliseconds grace) {
  CleanupResult result;
  result.resources = store.RecoverResources(session);

  if (options.dry_run) {
    return result;
  }

  bool cloud_clean = true;
  if (options.scope != CleanupScope::kLocalOnly && !result.resources.Empty()) {
    Compensator compensator(provider_factory(result.resources.region), grace);
    result.report = compensator.Teardown(result.resources);
    cloud_clean   = result.report->Complete();
  }

  if (options.scope == CleanupScope::kCloudOnly) {
    return result;
  }

  if (!cloud_clean) {
    CLOUDSTRAP_LOG_WARN("Keeping local session files until cloud cleanup succeeds",
                        {observability::StringField("session", session.id)});
    return result;
  }

  result.local_removed = store.RemoveSession(session, options.keep_logs);
  return result;
}

} // namespace cloudstrap::cleanup
