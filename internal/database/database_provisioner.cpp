#include "database_provisioner.hpp"

#include <utility>

#include "internal/catalog/resource_classes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provision/poller.hpp"
#include "internal/provision/zone_retry.hpp"
#include "internal/util/secrets.hpp"

namespace cloudstrap::database {
namespace {

constexpr int         kStatusRunning = 1;
constexpr const char* kRootUser      = "root";

} // namespace

DatabaseProvisioner::DatabaseProvisioner(provider::CloudProviderPtr provider, DatabaseSettings settings)
    : provider_(std::move(provider)), settings_(std::move(settings)) {
}

DatabaseInstance DatabaseProvisioner::CreateDatabaseInstance(const cloudstrap::spec::v1::DatabaseRequest& request,
                                                             const network::NetworkLayout& layout,
                                                             const std::string& ruleset_id,
                                                             model::ProvisionedResources& ledger) {
  observability::SpanScope span("provision.database");

  const std::uint32_t memory_mb = catalog::MapDatabaseClass(request.cpu_cores(), request.memory_mb());
  span.SetAttribute("memory_mb", static_cast<std::int64_t>(memory_mb));

  provider::DatabaseLaunchRequest launch;
  launch.region               = ledger.region;
  launch.memory_mb            = memory_mb;
  launch.storage_gb           = request.storage_gb();
  launch.engine_version       = request.engine_version();
  launch.name                 = settings_.name_prefix + "-db";
  launch.network_id           = layout.network_id;
  launch.firewall_ruleset_ids = {ruleset_id};
  launch.port                 = settings_.port;
  launch.root_password        = util::GenerateDatabasePassword(settings_.password_prefix);

  CLOUDSTRAP_LOG_INFO("Creating database instance", {observability::IntField("memory_mb", memory_mb),
                                                     observability::IntField("storage_gb", request.storage_gb()),
                                                     observability::StringField("engine", request.engine_version())});

  const auto placement =
      provision::PlaceInFirstAvailableZone("database instance", layout.zones, layout.subnets,
                                           [&](const std::string& zone, const std::string& subnet_id) {
                                             launch.zone      = zone;
                                             launch.subnet_id = subnet_id;
                                             return provider_->CreateDatabaseInstance(launch);
                                           });

  model::DatabaseRecord record;
  record.instance_id = placement.id;
  record.zone        = placement.zone;
  record.port        = settings_.port;
  record.username    = kRootUser;
  record.password    = launch.root_password;
  ledger.database    = std::move(record);

  span.SetAttribute("zone", placement.zone);
  CLOUDSTRAP_LOG_INFO("Database instance created", {observability::StringField("instance_id", placement.id),
                                                    observability::StringField("zone", placement.zone)});
  return DatabaseInstance{placement.id, launch.root_password};
}

DatabaseEndpoint DatabaseProvisioner::WaitUntilReady(const std::string& instance_id, std::chrono::milliseconds max_wait) {
  observability::SpanScope span("provision.database.wait");
  span.SetAttribute("instance_id", instance_id);

  provision::PollOptions options;
  options.interval = settings_.poll_interval;
  options.max_wait = max_wait;

  return provision::PollUntil("database " + instance_id, options, [&]() -> std::optional<DatabaseEndpoint> {
    auto status = provider_->DescribeDatabaseInstance(instance_id);
    if (!status || status->status_code != kStatusRunning || status->host.empty()) {
      CLOUDSTRAP_LOG_INFO("Waiting for database", {observability::StringField("instance_id", instance_id),
                                                   observability::IntField("status", status ? status->status_code : -1)});
      return std::nullopt;
    }
    return DatabaseEndpoint{status->host, status->port != 0 ? status->port : settings_.port};
  });
}

} // namespace cloudstrap::database
