#include "compensator.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace cloudstrap::cleanup {

const char* ToString(TeardownOutcome outcome) {
  switch (outcome) {
    case TeardownOutcome::kDeleted:
      return "deleted";
    case TeardownOutcome::kAlreadyGone:
      return "already_gone";
    case TeardownOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

std::size_t TeardownReport::FailureCount() const {
  return static_cast<std::size_t>(std::count_if(steps.begin(), steps.end(), [](const TeardownStep& step) {
    return step.outcome == TeardownOutcome::kFailed;
  }));
}

Compensator::Compensator(provider::CloudProviderPtr provider, std::chrono::milliseconds grace)
    : provider_(std::move(provider)), grace_(grace) {
}

template <typename Fn>
void Compensator::RunStep(TeardownReport& report, const char* resource, const std::string& id, Fn&& fn) {
  TeardownStep step;
  step.resource = resource;
  step.id       = id;

  try {
    fn();
    step.outcome = TeardownOutcome::kDeleted;
    CLOUDSTRAP_LOG_INFO("Resource released",
                        {observability::StringField("resource", resource), observability::StringField("id", id)});
  } catch (const util::ProviderError& e) {
    if (e.kind() == util::ProviderErrorKind::kNotFound) {
      step.outcome = TeardownOutcome::kAlreadyGone;
      CLOUDSTRAP_LOG_INFO("Resource already gone",
                          {observability::StringField("resource", resource), observability::StringField("id", id)});
    } else {
      step.outcome = TeardownOutcome::kFailed;
      step.error   = e.what();
    }
  } catch (const std::exception& e) {
    step.outcome = TeardownOutcome::kFailed;
    step.error   = e.what();
  }

  if (step.outcome == TeardownOutcome::kFailed) {
    CLOUDSTRAP_LOG_ERROR("Resource release failed", {observability::StringField("resource", resource),
                                                     observability::StringField("id", id),
                                                     observability::StringField("error", step.error)});
  }
  report.steps.push_back(std::move(step));
}

TeardownReport Compensator::Teardown(const model::ProvisionedResources& resources) {
  observability::SpanScope span("cleanup.teardown");
  TeardownReport           report;

  const bool has_instance = resources.compute && !resources.compute->instance_id.empty();
  const bool has_database = resources.database && !resources.database->instance_id.empty();

  if (has_instance) {
    const auto& id = resources.compute->instance_id;
    RunStep(report, "instance", id, [&] { provider_->TerminateInstance(id); });
  }

  if (has_database) {
    const auto& id = resources.database->instance_id;
    RunStep(report, "database", id, [&] { provider_->IsolateDatabaseInstance(id); });
  }

  if ((has_instance || has_database) && grace_.count() > 0) {
    CLOUDSTRAP_LOG_INFO("Waiting for instances to release network attachments",
                        {observability::IntField("grace_ms", grace_.count())});
    std::this_thread::sleep_for(grace_);
  }

  for (const auto& id : resources.firewall_ruleset_ids) {
    RunStep(report, "security_group", id, [&] { provider_->DeleteFirewallRuleset(id); });
  }

  for (const auto& subnet : resources.subnets) {
    const auto& id = subnet.second;
    RunStep(report, "subnet", id, [&] { provider_->DeleteSubnet(id); });
  }

  if (!resources.network_id.empty()) {
    RunStep(report, "network", resources.network_id, [&] { provider_->DeleteNetwork(resources.network_id); });
  }

  span.SetAttribute("failures", static_cast<std::int64_t>(report.FailureCount()));
  if (report.Complete()) {
    CLOUDSTRAP_LOG_INFO("Teardown complete", {observability::IntField("steps", static_cast<std::int64_t>(report.steps.size()))});
  } else {
    CLOUDSTRAP_LOG_WARN("Teardown partially failed",
                        {observability::IntField("failures", static_cast<std::int64_t>(report.FailureCount()))});
  }
  return report;
}

} // namespace cloudstrap::cleanup
