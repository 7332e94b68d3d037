#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/compute/user_data.hpp"
#include "internal/credentials/credentials.hpp"
#include "internal/model/provisioned_resources.hpp"
#include "internal/network/network_provisioner.hpp"
#include "internal/provider/cloud_provider.hpp"
#include "internal/provision/poller.hpp"
#include "spec/resource_spec.pb.h"

namespace cloudstrap::compute {

struct ComputeSettings {
  std::string               name_prefix    = "cloudstrap";
  std::string               image_id       = "img-487zeit5";
  std::string               disk_type      = "CLOUD_PREMIUM";
  std::uint32_t             bandwidth_mbps = 100;
  std::string               login_account  = "ubuntu";
  GpuDriverVersions         gpu;
  std::chrono::milliseconds poll_interval{10000};
};

struct InstanceAddresses {
  std::string public_ip;
  std::string private_ip;
};

class ComputeProvisioner {
 public:
  ComputeProvisioner(provider::CloudProviderPtr provider, ComputeSettings settings);

  /*
    Launches one instance, walking the layout's zones in order.

    Capacity and invalid-zone rejections advance to the next zone; any other
    failure propagates. Throws NoZoneAvailable when every zone rejected the
    launch. On success ledger.compute holds the instance id and zone.
  */
  std::string CreateInstance(const cloudstrap::spec::v1::ComputeRequest& request, const network::NetworkLayout& layout,
                             const std::string& ruleset_id, const credentials::Keypair& keypair,
                             model::ProvisionedResources& ledger);

  // Polls until the instance is RUNNING with a public address.
  InstanceAddresses WaitUntilRunning(const std::string& instance_id, std::chrono::milliseconds max_wait);

 private:
  provider::CloudProviderPtr provider_;
  ComputeSettings            settings_;
};

} // namespace cloudstrap::compute
