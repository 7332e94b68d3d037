#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/core/orchestrator.hpp"
#include "internal/provider/cloud_provider.hpp"
#include "internal/session/session_store.hpp"

namespace cloudstrap::factory {

/*
  Application

  Owns the long-lived components of one CLI invocation.
*/
struct Application {
  std::shared_ptr<session::SessionStore> store;
  std::shared_ptr<core::Orchestrator>    orchestrator;
};

/*
  Composition root. The ONLY place that knows concrete provider types and
  resolves config zero values to their defaults.
*/

// Resolves credentials from the environment; throws util::CredentialsMissing.
provider::CloudProviderPtr BuildProvider(const cloudstrap::runtime::config::RuntimeConfig& config, const std::string& region);

std::shared_ptr<session::SessionStore> BuildSessionStore(const cloudstrap::runtime::config::RuntimeConfig& config);

std::chrono::milliseconds TeardownGrace(const cloudstrap::runtime::config::RuntimeConfig& config);
std::uint32_t             MinDiskGb(const cloudstrap::runtime::config::RuntimeConfig& config);

// Wires the orchestrator around an already-built provider.
Application Build(const cloudstrap::runtime::config::RuntimeConfig& config, provider::CloudProviderPtr provider);

} // namespace cloudstrap::factory
