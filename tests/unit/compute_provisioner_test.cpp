#include "internal/compute/compute_provisioner.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "fake_cloud_provider.hpp"

namespace {

using cloudstrap::compute::ComputeProvisioner;
using cloudstrap::compute::ComputeSettings;
using cloudstrap::model::ProvisionedResources;
using cloudstrap::network::NetworkLayout;
using cloudstrap::testing::FakeCloudProvider;
using cloudstrap::util::ProviderErrorKind;

NetworkLayout ThreeZoneLayout() {
  NetworkLayout layout;
  layout.network_id = "vpc-0";
  layout.zones      = {"z-1", "z-2", "z-3"};
  layout.subnets    = {{"z-1", "s-1"}, {"z-2", "s-2"}, {"z-3", "s-3"}};
  return layout;
}

cloudstrap::credentials::Keypair TestKeypair() {
  return {"/tmp/cloudstrap-test/ssh_key", "/tmp/cloudstrap-test/ssh_key.pub", "ssh-rsa AAAAtest cloudstrap"};
}

cloudstrap::spec::v1::ComputeRequest Request(const std::string& gpu = "") {
  cloudstrap::spec::v1::ComputeRequest request;
  request.set_cpu_cores(4);
  request.set_memory_gb(16);
  request.set_disk_gb(80);
  request.set_gpu_class(gpu);
  return request;
}

ComputeSettings FastSettings() {
  ComputeSettings settings;
  settings.poll_interval = std::chrono::milliseconds(1);
  return settings;
}

void TestZoneFallbackRecordsSecondZone() {
  auto fake = std::make_shared<FakeCloudProvider>();
  fake->instance_failures["z-1"] = ProviderErrorKind::kCapacityExhausted;

  ComputeProvisioner   provisioner(fake, FastSettings());
  ProvisionedResources ledger;
  const auto           id = provisioner.CreateInstance(Request(), ThreeZoneLayout(), "sg-1", TestKeypair(), ledger);

  assert(ledger.compute);
  assert(ledger.compute->instance_id == id);
  assert(ledger.compute->zone == "z-2");
  assert(ledger.compute->instance_class == "S5.2XLARGE16");
  assert(!ledger.compute->gpu_enabled);
  assert(fake->launches.size() == 2);
  assert(fake->launches[1].subnet_id == "s-2");
  assert(fake->launches[1].disk_gb == 80);
  assert(!fake->launches[1].user_data_base64.empty());
}

void TestNonRetryableErrorIsNotRetried() {
  auto fake = std::make_shared<FakeCloudProvider>();
  fake->instance_failures["z-1"] = ProviderErrorKind::kOther;

  ComputeProvisioner   provisioner(fake, FastSettings());
  ProvisionedResources ledger;
  bool                 threw = false;
  try {
    provisioner.CreateInstance(Request(), ThreeZoneLayout(), "sg-1", TestKeypair(), ledger);
  } catch (const cloudstrap::util::ProviderError& e) {
    threw = e.kind() == ProviderErrorKind::kOther;
  }
  assert(threw);
  assert(fake->CountCalls("RunInstance:") == 1);
  assert(!ledger.compute);
}

void TestAllZonesExhausted() {
  auto fake = std::make_shared<FakeCloudProvider>();
  for (const char* zone : {"z-1", "z-2", "z-3"}) {
    fake->instance_failures[zone] = ProviderErrorKind::kCapacityExhausted;
  }

  ComputeProvisioner   provisioner(fake, FastSettings());
  ProvisionedResources ledger;
  bool                 threw = false;
  try {
    provisioner.CreateInstance(Request("T4"), ThreeZoneLayout(), "sg-1", TestKeypair(), ledger);
  } catch (const cloudstrap::util::NoZoneAvailable&) {
    threw = true;
  }
  assert(threw);
  assert(fake->CountCalls("RunInstance:") == 3);
  assert(fake->launches.front().instance_class == "GN7.2XLARGE32");
}

void TestWaitUntilRunning() {
  auto fake = std::make_shared<FakeCloudProvider>();
  fake->instance_statuses.push_back(std::nullopt);
  fake->instance_statuses.push_back(cloudstrap::provider::InstanceStatus{"PENDING", "", ""});
  fake->instance_statuses.push_back(cloudstrap::provider::InstanceStatus{"RUNNING", "198.51.100.7", "10.0.2.9"});

  ComputeProvisioner provisioner(fake, FastSettings());
  const auto         addresses = provisioner.WaitUntilRunning("ins-1", std::chrono::milliseconds(2000));

  assert(addresses.public_ip == "198.51.100.7");
  assert(addresses.private_ip == "10.0.2.9");
  assert(fake->CountCalls("DescribeInstance:") == 3);
}

void TestWaitUntilRunningTimesOut() {
  auto fake                  = std::make_shared<FakeCloudProvider>();
  fake->instance_never_ready = true;

  ComputeProvisioner provisioner(fake, FastSettings());
  bool               threw = false;
  try {
    provisioner.WaitUntilRunning("ins-1", std::chrono::milliseconds(30));
  } catch (const cloudstrap::util::ProvisioningTimeout&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestZoneFallbackRecordsSecondZone();
  TestNonRetryableErrorIsNotRetried();
  TestAllZonesExhausted();
  TestWaitUntilRunning();
  TestWaitUntilRunningTimesOut();

  std::cout << "cloudstrap_unit_compute_provisioner: pass\n";
  return 0;
}
