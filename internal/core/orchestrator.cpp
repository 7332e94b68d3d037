#include "orchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/config/resource_spec_loader.hpp"
#include "internal/network/zone_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/interrupt.hpp"

namespace cloudstrap::core {

using model::ProvisionState;

Orchestrator::Orchestrator(cloudstrap::runtime::config::RuntimeConfig config, OrchestratorSettings settings,
                           std::shared_ptr<session::SessionStore> store, std::shared_ptr<network::NetworkProvisioner> network,
                           std::shared_ptr<compute::ComputeProvisioner> compute,
                           std::shared_ptr<database::DatabaseProvisioner> database,
                           std::shared_ptr<cleanup::Compensator> compensator, KeypairGenerator keypair_generator)
    : config_(std::move(config)), settings_(settings), store_(std::move(store)), network_(std::move(network)),
      compute_(std::move(compute)), database_(std::move(database)), compensator_(std::move(compensator)),
      keypair_generator_(std::move(keypair_generator)) {
  if (!store_ || !network_ || !compute_ || !database_ || !compensator_ || !keypair_generator_) {
    throw std::invalid_argument("Orchestrator requires every component");
  }
}

void Orchestrator::Transition(ProvisionState to) {
  if (!model::CanTransition(state_, to)) {
    throw std::logic_error(std::string("Invalid provisioning transition ") + model::ToString(state_) + " -> " +
                           model::ToString(to));
  }
  CLOUDSTRAP_LOG_INFO("Provisioning state", {observability::StringField("from", model::ToString(state_)),
                                             observability::StringField("to", model::ToString(to))});
  state_ = to;
}

void Orchestrator::Snapshot(session::Stage stage) {
  store_->RecordStage(*session_, stage, session::SnapshotOf(ledger_));
}

ProvisioningResult Orchestrator::Provision(const cloudstrap::spec::v1::ResourceSpec& spec) {
  config::ValidateResourceSpec(spec, settings_.min_disk_gb);

  state_ = ProvisionState::kInit;
  ledger_ = model::ProvisionedResources{};
  last_teardown_.reset();
  session_ = store_->CreateSession();

  observability::SpanScope span("provision");
  span.SetAttribute("session", session_->id);
  span.SetAttribute("region", spec.region());

  ledger_.region = spec.region();
  store_->RecordStage(*session_, session::Stage::kSpecification, session::SnapshotOf(spec));

  try {
    util::ThrowIfInterrupted();
    const auto layout = RunNetworkStage(spec);
    Transition(ProvisionState::kNetworkReady);

    if (spec.has_compute()) {
      util::ThrowIfInterrupted();
      RunComputeStage(spec.compute(), layout);
      Transition(ProvisionState::kComputeReady);
    }

    if (spec.has_database()) {
      util::ThrowIfInterrupted();
      RunDatabaseStage(spec.database(), layout);
      Transition(ProvisionState::kDatabaseReady);
    }

    store_->WriteSummary(*session_, ledger_);
    Transition(ProvisionState::kDone);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    HandleFailure(e.what());
    throw;
  }

  ProvisioningResult result;
  result.session   = *session_;
  result.resources = ledger_;
  if (ledger_.compute) {
    result.remote_access = model::RemoteAccess{ledger_.compute->public_ip, ledger_.compute->private_key_path,
                                               ledger_.compute->login_account};
  }

  CLOUDSTRAP_LOG_INFO("Provisioning complete", {observability::StringField("session", session_->id)});
  return result;
}

network::NetworkLayout Orchestrator::RunNetworkStage(const cloudstrap::spec::v1::ResourceSpec& spec) {
  const auto zones = network::CandidateZones(spec.region(), config_);
  auto       layout = network_->CreateNetwork(spec.region(), zones, ledger_);
  Snapshot(session::Stage::kNetwork);
  return layout;
}

void Orchestrator::RunComputeStage(const cloudstrap::spec::v1::ComputeRequest& request, const network::NetworkLayout& layout) {
  const auto keypair = keypair_generator_(session_->dir.string());

  const auto ruleset_id = network_->CreateFirewallRuleset(network::FirewallPurpose::kCompute, ledger_);
  Snapshot(session::Stage::kCompute);

  util::ThrowIfInterrupted();
  const auto instance_id = compute_->CreateInstance(request, layout, ruleset_id, keypair, ledger_);
  Snapshot(session::Stage::kCompute);

  const auto addresses       = compute_->WaitUntilRunning(instance_id, settings_.compute_max_wait);
  ledger_.compute->public_ip  = addresses.public_ip;
  ledger_.compute->private_ip = addresses.private_ip;
  Snapshot(session::Stage::kCompute);
}

void Orchestrator::RunDatabaseStage(const cloudstrap::spec::v1::DatabaseRequest& request, const network::NetworkLayout& layout) {
  const auto ruleset_id = network_->CreateFirewallRuleset(network::FirewallPurpose::kDatabase, ledger_);
  Snapshot(session::Stage::kDatabase);

  util::ThrowIfInterrupted();
  const auto instance = database_->CreateDatabaseInstance(request, layout, ruleset_id, ledger_);
  Snapshot(session::Stage::kDatabase);

  const auto endpoint     = database_->WaitUntilReady(instance.id, settings_.database_max_wait);
  ledger_.database->host = endpoint.host;
  ledger_.database->port = endpoint.port;
  Snapshot(session::Stage::kDatabase);
}

void Orchestrator::HandleFailure(const std::string& reason) {
  const ProvisionState failed_in = state_;
  Transition(ProvisionState::kFailed);

  CLOUDSTRAP_LOG_ERROR("Provisioning failed, cleaning up", {observability::StringField("state", model::ToString(failed_in)),
                                                            observability::StringField("error", reason)});

  // Stage files are one "Key: value" per line; a provider message must not add lines.
  std::string one_line = reason;
  std::replace_if(one_line.begin(), one_line.end(), [](char c) { return c == '\n' || c == '\r'; }, ' ');

  session::Snapshot error_snapshot = {{"Error", one_line}, {"Failed State", model::ToString(failed_in)}};
  const auto        resources      = session::SnapshotOf(ledger_);
  error_snapshot.insert(error_snapshot.end(), resources.begin(), resources.end());
  store_->RecordStage(*session_, session::Stage::kError, error_snapshot);

  last_teardown_ = compensator_->Teardown(ledger_);
  Transition(ProvisionState::kCleanedUp);
}

} // namespace cloudstrap::core
