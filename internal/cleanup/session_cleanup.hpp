#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/cleanup/compensator.hpp"
#include "internal/model/provisioned_resources.hpp"
#include "internal/provider/cloud_provider.hpp"
#include "internal/session/session_store.hpp"

namespace cloudstrap::cleanup {

enum class CleanupScope {
  kAll,
  kCloudOnly,
  kLocalOnly,
};

struct CleanupOptions {
  CleanupScope scope     = CleanupScope::kAll;
  bool         keep_logs = false;
  bool         dry_run   = true;
};

struct CleanupResult {
  model::ProvisionedResources   resources;
  std::optional<TeardownReport> report;
  bool                          local_removed = false;
};

// Builds a provider bound to the region recorded in the session.
using ProviderFactory = std::function<provider::CloudProviderPtr(const std::string& region)>;

// Human-readable list of what a cleanup would release.
std::vector<std::string> DescribePlan(const model::ProvisionedResources& resources, const CleanupOptions& options);

/*
  Cleans up one recorded session.

  Cloud resources are recovered from the stage files and torn down; local
  files are removed only when every cloud step succeeded (or the scope is
  local only), so a failed teardown can be retried later. With dry_run the
  plan is computed and nothing is touched.
*/
CleanupResult CleanupSession(session::SessionStore& store, const session::Session& session,
                             const CleanupOptions& options, const ProviderFactory& provider_factory,
                             std::chrono::milliseconds grace);

} // namespace cloudstrap::cleanup
