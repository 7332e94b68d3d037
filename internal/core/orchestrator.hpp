#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/cleanup/compensator.hpp"
#include "internal/compute/compute_provisioner.hpp"
#include "internal/credentials/credentials.hpp"
#include "internal/database/database_provisioner.hpp"
#include "internal/model/provision_state.hpp"
#include "internal/model/provisioned_resources.hpp"
#include "internal/network/network_provisioner.hpp"
#include "internal/session/session_store.hpp"
#include "spec/resource_spec.pb.h"

namespace cloudstrap::core {

struct OrchestratorSettings {
  std::chrono::milliseconds compute_max_wait{300000};
  std::chrono::milliseconds database_max_wait{600000};
  std::uint32_t             min_disk_gb = 20;
};

struct ProvisioningResult {
  session::Session                   session;
  model::ProvisionedResources        resources;
  std::optional<model::RemoteAccess> remote_access; // set when compute was requested
};

using KeypairGenerator = std::function<credentials::Keypair(const std::string& dest_dir)>;

/*
  Drives one provisioning run.

  Stages run strictly in order: network, then compute and database when
  requested. The ledger is snapshotted to the session after every stage and
  as soon as an instance or security group exists.

  Any exception moves the run to FAILED: an error snapshot is written, the
  compensator tears down everything in the ledger, the state becomes
  CLEANED_UP, and the original exception is rethrown.
*/
class Orchestrator {
 public:
  Orchestrator(cloudstrap::runtime::config::RuntimeConfig config, OrchestratorSettings settings,
               std::shared_ptr<session::SessionStore> store, std::shared_ptr<network::NetworkProvisioner> network,
               std::shared_ptr<compute::ComputeProvisioner> compute, std::shared_ptr<database::DatabaseProvisioner> database,
               std::shared_ptr<cleanup::Compensator> compensator, KeypairGenerator keypair_generator = credentials::GenerateKeypair);

  ProvisioningResult Provision(const cloudstrap::spec::v1::ResourceSpec& spec);

  model::ProvisionState state() const {
    return state_;
  }

  // Session of the most recent run, including a failed one.
  const std::optional<session::Session>& session() const {
    return session_;
  }

  const model::ProvisionedResources& resources() const {
    return ledger_;
  }

  // Teardown report of the most recent failed run.
  const std::optional<cleanup::TeardownReport>& last_teardown() const {
    return last_teardown_;
  }

 private:
  void Transition(model::ProvisionState to);

  network::NetworkLayout RunNetworkStage(const cloudstrap::spec::v1::ResourceSpec& spec);
  void RunComputeStage(const cloudstrap::spec::v1::ComputeRequest& request, const network::NetworkLayout& layout);
  void RunDatabaseStage(const cloudstrap::spec::v1::DatabaseRequest& request, const network::NetworkLayout& layout);

  void Snapshot(session::Stage stage);
  void HandleFailure(const std::string& reason);

  cloudstrap::runtime::config::RuntimeConfig    config_;
  OrchestratorSettings                          settings_;
  std::shared_ptr<session::SessionStore>        store_;
  std::shared_ptr<network::NetworkProvisioner>  network_;
  std::shared_ptr<compute::ComputeProvisioner>  compute_;
  std::shared_ptr<database::DatabaseProvisioner> database_;
  std::shared_ptr<cleanup::Compensator>         compensator_;
  KeypairGenerator                              keypair_generator_;

  model::ProvisionState                  state_ = model::ProvisionState::kInit;
  std::optional<session::Session>        session_;
  model::ProvisionedResources            ledger_;
  std::optional<cleanup::TeardownReport> last_teardown_;
};

} // namespace cloudstrap::core
