#include "compute_provisioner.hpp"

#include <utility>

#include "internal/catalog/resource_classes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provision/zone_retry.hpp"

namespace cloudstrap::compute {

ComputeProvisioner::ComputeProvisioner(provider::CloudProviderPtr provider, ComputeSettings settings)
    : provider_(std::move(provider)), settings_(std::move(settings)) {
}

std::string ComputeProvisioner::CreateInstance(const cloudstrap::spec::v1::ComputeRequest& request,
                                               const network::NetworkLayout& layout, const std::string& ruleset_id,
                                               const credentials::Keypair& keypair, model::ProvisionedResources& ledger) {
  observability::SpanScope span("provision.compute");

  const auto resource_class = catalog::MapResourceClass(request.cpu_cores(), request.memory_gb(), request.gpu_class());
  span.SetAttribute("instance_class", resource_class.instance_class);

  BootPayloadOptions boot;
  boot.login_account      = settings_.login_account;
  boot.public_key         = keypair.public_key_text;
  boot.install_gpu_driver = resource_class.gpu_enabled;
  boot.gpu                = settings_.gpu;

  provider::InstanceLaunchRequest launch;
  launch.instance_class       = resource_class.instance_class;
  launch.image_id             = settings_.image_id;
  launch.name                 = settings_.name_prefix + "-compute";
  launch.network_id           = layout.network_id;
  launch.firewall_ruleset_ids = {ruleset_id};
  launch.disk_gb              = request.disk_gb();
  launch.disk_type            = settings_.disk_type;
  launch.bandwidth_mbps       = settings_.bandwidth_mbps;
  launch.user_data_base64     = EncodeBootPayload(boot);

  CLOUDSTRAP_LOG_INFO("Launching instance", {observability::StringField("instance_class", resource_class.instance_class),
                                             observability::BoolField("gpu", resource_class.gpu_enabled),
                                             observability::IntField("disk_gb", request.disk_gb())});

  const auto placement =
      provision::PlaceInFirstAvailableZone("compute instance", layout.zones, layout.subnets,
                                           [&](const std::string& zone, const std::string& subnet_id) {
                                             launch.zone      = zone;
                                             launch.subnet_id = subnet_id;
                                             return provider_->RunInstance(launch);
                                           });

  model::ComputeRecord record;
  record.instance_id      = placement.id;
  record.zone             = placement.zone;
  record.instance_class   = resource_class.instance_class;
  record.private_key_path = keypair.private_key_path;
  record.login_account    = settings_.login_account;
  record.gpu_enabled      = resource_class.gpu_enabled;
  ledger.compute          = std::move(record);

  span.SetAttribute("zone", placement.zone);
  CLOUDSTRAP_LOG_INFO("Instance created", {observability::StringField("instance_id", placement.id),
                                           observability::StringField("zone", placement.zone)});
  return placement.id;
}

InstanceAddresses ComputeProvisioner::WaitUntilRunning(const std::string& instance_id, std::chrono::milliseconds max_wait) {
  observability::SpanScope span("provision.compute.wait");
  span.SetAttribute("instance_id", instance_id);

  provision::PollOptions options;
  options.interval = settings_.poll_interval;
  options.max_wait = max_wait;

  return provision::PollUntil("instance " + instance_id, options, [&]() -> std::optional<InstanceAddresses> {
    auto status = provider_->DescribeInstance(instance_id);
    if (!status || status->state != "RUNNING" || status->public_ip.empty()) {
      CLOUDSTRAP_LOG_INFO("Waiting for instance", {observability::StringField("instance_id", instance_id),
                                                   observability::StringField("state", status ? status->state : "UNKNOWN")});
      return std::nullopt;
    }
    return InstanceAddresses{status->public_ip, status->private_ip};
  });
}

} // namespace cloudstrap::compute
