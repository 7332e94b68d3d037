#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/model/provisioned_resources.hpp"
#include "internal/network/network_provisioner.hpp"
#include "internal/provider/cloud_provider.hpp"
#include "spec/resource_spec.pb.h"

namespace cloudstrap::database {

struct DatabaseSettings {
  std::string               name_prefix     = "cloudstrap";
  std::uint32_t             port            = 3306;
  std::string               password_prefix = "Cloudstrap@";
  std::chrono::milliseconds poll_interval{10000};
};

struct DatabaseInstance {
  std::string id;
  std::string password;
};

struct DatabaseEndpoint {
  std::string   host;
  std::uint32_t port = 0;
};

class DatabaseProvisioner {
 public:
  DatabaseProvisioner(provider::CloudProviderPtr provider, DatabaseSettings settings);

  /*
    Creates one pay-as-you-go MySQL instance with a freshly generated root
    password, using the same zone fallback as compute. ledger.database holds
    the id, zone, username and password once the provider confirms the id.
  */
  DatabaseInstance CreateDatabaseInstance(const cloudstrap::spec::v1::DatabaseRequest& request,
                                          const network::NetworkLayout& layout, const std::string& ruleset_id,
                                          model::ProvisionedResources& ledger);

  // Polls until the instance reports running and has an address.
  DatabaseEndpoint WaitUntilReady(const std::string& instance_id, std::chrono::milliseconds max_wait);

 private:
  provider::CloudProviderPtr provider_;
  DatabaseSettings           settings_;
};

} // namespace cloudstrap::database
