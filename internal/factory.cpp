#include "factory.hpp"

#include <stdexcept>
#include <utility>

#include "internal/cleanup/compensator.hpp"
#include "internal/compute/compute_provisioner.hpp"
#include "internal/credentials/credentials.hpp"
#include "internal/database/database_provisioner.hpp"
#include "internal/network/network_provisioner.hpp"
#include "internal/provider/http/http_transport.hpp"
#include "internal/provider/tencent/tencent_provider.hpp"

namespace cloudstrap::factory {

using cloudstrap::runtime::config::RuntimeConfig;

namespace {

template <typename T>
T Or(T value, T fallback) {
  return value != T{} ? value : fallback;
}

std::string Or(const std::string& value, const char* fallback) {
  return value.empty() ? std::string(fallback) : value;
}

std::chrono::milliseconds Millis(std::uint64_t value, std::uint64_t fallback) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(Or(value, fallback)));
}

} // namespace

provider::CloudProviderPtr BuildProvider(const RuntimeConfig& config, const std::string& region) {
  const auto& provider_config = config.provider();
  const auto  kind            = Or(provider_config.kind(), "tencent");
  if (kind != "tencent") {
    throw std::runtime_error("Unsupported provider kind: " + kind);
  }

  const auto api_credentials = credentials::ResolveApiCredentials(config.credentials());

  auto transport = std::make_shared<provider::http::BeastHttpsTransport>(
      Millis(provider_config.request_timeout_ms(), 30000));

  return std::make_shared<provider::tencent::TencentProvider>(
      provider::tencent::Tc3Credentials{api_credentials.id, api_credentials.secret}, region,
      Or(provider_config.endpoint_suffix(), "tencentcloudapi.com"), std::move(transport));
}

std::shared_ptr<session::SessionStore> BuildSessionStore(const RuntimeConfig& config) {
  return std::make_shared<session::SessionStore>(config.session().root_path());
}

std::chrono::milliseconds TeardownGrace(const RuntimeConfig& config) {
  return Millis(config.provisioning().teardown_grace_ms(), 30000);
}

std::uint32_t MinDiskGb(const RuntimeConfig& config) {
  return Or<std::uint32_t>(config.provisioning().min_disk_gb(), 20);
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, provider::CloudProviderPtr provider) {
  const auto& p = config.provisioning();

  Application app;
  app.store = BuildSessionStore(config);

  const auto name_prefix   = Or(p.name_prefix(), "cloudstrap");
  const auto poll_interval = Millis(p.poll_interval_ms(), 10000);

  // ------------------------------------------------------------------
  // Provisioners
  // ------------------------------------------------------------------
  network::NetworkSettings network_settings;
  network_settings.cidr_block    = Or(p.network_cidr(), "10.0.0.0/16");
  network_settings.name_prefix   = name_prefix;
  network_settings.database_port = Or<std::uint32_t>(p.database_port(), 3306);

  compute::ComputeSettings compute_settings;
  compute_settings.name_prefix    = name_prefix;
  compute_settings.image_id       = Or(p.image_id(), "img-487zeit5");
  compute_settings.disk_type      = Or(p.system_disk_type(), "CLOUD_PREMIUM");
  compute_settings.bandwidth_mbps = Or<std::uint32_t>(p.internet_bandwidth_mbps(), 100);
  compute_settings.login_account  = Or(p.login_account(), "ubuntu");
  compute_settings.poll_interval  = poll_interval;

  const auto&               gpu = p.gpu_driver();
  const compute::GpuDriverVersions gpu_defaults;
  compute_settings.gpu.driver_version = gpu.driver_version().empty() ? gpu_defaults.driver_version : gpu.driver_version();
  compute_settings.gpu.cuda_version   = gpu.cuda_version().empty() ? gpu_defaults.cuda_version : gpu.cuda_version();
  compute_settings.gpu.cudnn_version  = gpu.cudnn_version().empty() ? gpu_defaults.cudnn_version : gpu.cudnn_version();
  compute_settings.gpu.installer_url  = gpu.installer_url().empty() ? gpu_defaults.installer_url : gpu.installer_url();

  database::DatabaseSettings database_settings;
  database_settings.name_prefix     = name_prefix;
  database_settings.port            = network_settings.database_port;
  database_settings.password_prefix = Or(p.database_password_prefix(), "Cloudstrap@");
  database_settings.poll_interval   = poll_interval;

  auto network_provisioner  = std::make_shared<network::NetworkProvisioner>(provider, network_settings);
  auto compute_provisioner  = std::make_shared<compute::ComputeProvisioner>(provider, compute_settings);
  auto database_provisioner = std::make_shared<database::DatabaseProvisioner>(provider, database_settings);
  auto compensator          = std::make_shared<cleanup::Compensator>(provider, TeardownGrace(config));

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  core::OrchestratorSettings settings;
  settings.compute_max_wait  = Millis(p.compute_max_wait_ms(), 300000);
  settings.database_max_wait = Millis(p.database_max_wait_ms(), 600000);
  settings.min_disk_gb       = MinDiskGb(config);

  app.orchestrator = std::make_shared<core::Orchestrator>(config, settings, app.store, std::move(network_provisioner),
                                                          std::move(compute_provisioner), std::move(database_provisioner),
                                                          std::move(compensator));
  return app;
}

} // namespace cloudstrap::factory
