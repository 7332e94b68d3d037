#include "internal/database/database_provisioner.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "fake_cloud_provider.hpp"

namespace {

using cloudstrap::database::DatabaseProvisioner;
using cloudstrap::database::DatabaseSettings;
using cloudstrap::model::ProvisionedResources;
using cloudstrap::network::NetworkLayout;
using cloudstrap::testing::FakeCloudProvider;
using cloudstrap::util::ProviderErrorKind;

NetworkLayout TwoZoneLayout() {
  NetworkLayout layout;
  layout.network_id = "vpc-0";
  layout.zones      = {"z-1", "z-2"};
  layout.subnets    = {{"z-1", "s-1"}, {"z-2", "s-2"}};
  return layout;
}

cloudstrap::spec::v1::DatabaseRequest Request() {
  cloudstrap::spec::v1::DatabaseRequest request;
  request.set_cpu_cores(2);
  request.set_memory_mb(3000);
  request.set_storage_gb(100);
  request.set_engine_version("8.0");
  return request;
}

DatabaseSettings FastSettings() {
  DatabaseSettings settings;
  settings.poll_interval = std::chrono::milliseconds(1);
  return settings;
}

bool IsPasswordChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '@' || c == '#' ||
         c == '$' || c == '%';
}

void TestCreateRecordsCredentialsAndTier() {
  auto fake = std::make_shared<FakeCloudProvider>();
  fake->database_failures["z-1"] = ProviderErrorKind::kInvalidZone;

  DatabaseProvisioner  provisioner(fake, FastSettings());
  ProvisionedResources ledger;
  ledger.region = "ap-test";

  const auto instance = provisioner.CreateDatabaseInstance(Request(), TwoZoneLayout(), "sg-db", ledger);

  assert(ledger.database);
  assert(ledger.database->instance_id == instance.id);
  assert(ledger.database->zone == "z-2");
  assert(ledger.database->username == "root");
  assert(ledger.database->port == 3306);
  assert(ledger.database->password == instance.password);

  const auto& launch = fake->database_launches.back();
  assert(launch.memory_mb == 4000);
  assert(launch.region == "ap-test");
  assert(launch.subnet_id == "s-2");
  assert(launch.firewall_ruleset_ids.front() == "sg-db");

  const std::string prefix = "Cloudstrap@";
  assert(instance.password.rfind(prefix, 0) == 0);
  assert(instance.password.size() == prefix.size() + 15);
  for (std::size_t i = prefix.size(); i < instance.password.size(); ++i) {
    assert(IsPasswordChar(instance.password[i]));
  }
}

void TestPasswordsDiffer() {
  auto                 fake = std::make_shared<FakeCloudProvider>();
  DatabaseProvisioner  provisioner(fake, FastSettings());
  ProvisionedResources a;
  ProvisionedResources b;
  const auto           first  = provisioner.CreateDatabaseInstance(Request(), TwoZoneLayout(), "sg", a);
  const auto           second = provisioner.CreateDatabaseInstance(Request(), TwoZoneLayout(), "sg", b);
  assert(first.password != second.password);
}

void TestWaitUntilReady() {
  auto fake = std::make_shared<FakeCloudProvider>();
  fake->database_statuses.push_back(cloudstrap::provider::DatabaseStatus{0, "", 0});
  fake->database_statuses.push_back(cloudstrap::provider::DatabaseStatus{1, "", 0});
  fake->database_statuses.push_back(cloudstrap::provider::DatabaseStatus{1, "10.0.2.30", 0});

  DatabaseProvisioner provisioner(fake, FastSettings());
  const auto          endpoint = provisioner.WaitUntilReady("cdb-1", std::chrono::milliseconds(2000));

  assert(endpoint.host == "10.0.2.30");
  assert(endpoint.port == 3306);
  assert(fake->CountCalls("DescribeDatabaseInstance:") == 3);
}

} // namespace

int main() {
  TestCreateRecordsCredentialsAndTier();
  TestPasswordsDiffer();
  TestWaitUntilReady();

  std::cout << "cloudstrap_unit_database_provisioner: pass\n";
  return 0;
}
