#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/provisioned_resources.hpp"
#include "internal/provider/cloud_provider.hpp"

namespace cloudstrap::cleanup {

enum class TeardownOutcome {
  kDeleted,
  kAlreadyGone,
  kFailed,
};

const char* ToString(TeardownOutcome outcome);

struct TeardownStep {
  std::string     resource; // "instance", "database", "security_group", "subnet", "network"
  std::string     id;
  TeardownOutcome outcome = TeardownOutcome::kDeleted;
  std::string     error;
};

struct TeardownReport {
  std::vector<TeardownStep> steps;

  std::size_t FailureCount() const;

  // False is the "partial cleanup" status: at least one resource may remain.
  bool Complete() const {
    return FailureCount() == 0;
  }
};

/*
  Best-effort teardown of a ledger in dependency order:

    instance -> database -> grace wait -> security groups -> subnets -> network

  The grace wait only happens when an instance or database was present, so
  their network attachments are released before the network objects go.
  Each call is isolated: a failure is logged and recorded and the next step
  still runs. "Not found" counts as already gone, so Teardown is safe to run
  again on the same ledger. Never throws.
*/
class Compensator {
 public:
  Compensator(provider::CloudProviderPtr provider, std::chrono::milliseconds grace);

  TeardownReport Teardown(const model::ProvisionedResources& resources);

 private:
  template <typename Fn>
  void RunStep(TeardownReport& report, const char* resource, const std::string& id, Fn&& fn);

  provider::CloudProviderPtr provider_;
  std::chrono::milliseconds  grace_;
};

} // namespace cloudstrap::cleanup
