#include "internal/config/config_loader.hpp"
#include "internal/config/resource_spec_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cloudstrap_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / name;
  std::ofstream out(file_path);
  out << content;
  out.close();

  return file_path;
}

void TestRuntimeConfigSections() {
  const auto yaml_path = WriteFile("full.yaml",
                                   R"(logging:
  level: debug
session:
  root_path: "/var/lib/cloudstrap"
credentials:
  secret_id_env: MY_ID
  secret_key_env: MY_KEY
provider:
  kind: tencent
  request_timeout_ms: 15000
provisioning:
  network_cidr: "172.16.0.0/16"
  login_account: admin
  poll_interval_ms: 5000
  gpu_driver:
    driver_version: "550.54.15"
zones:
  ap-guangzhou:
    zones: [ap-guangzhou-6, ap-guangzhou-7]
)");

  auto config = cloudstrap::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.session().root_path() == "/var/lib/cloudstrap");
  assert(config.credentials().secret_id_env() == "MY_ID");
  assert(config.provider().request_timeout_ms() == 15000);
  assert(config.provisioning().network_cidr() == "172.16.0.0/16");
  assert(config.provisioning().login_account() == "admin");
  assert(config.provisioning().poll_interval_ms() == 5000);
  assert(config.provisioning().gpu_driver().driver_version() == "550.54.15");
  assert(config.zones().at("ap-guangzhou").zones_size() == 2);
  assert(config.zones().at("ap-guangzhou").zones(1) == "ap-guangzhou-7");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = cloudstrap::config::ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "line1\nline2☃"
)");
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)cloudstrap::config::ConfigLoader::LoadFromYamlString("logging:\n  level: info\nunknown_field: 123\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = cloudstrap::config::ConfigLoader::LoadFromYamlString("");
  assert(config.provisioning().poll_interval_ms() == 0);
  assert(config.zones().empty());
}

void TestResourceSpecFromJsonAppliesDefaults() {
  const auto path = WriteFile("spec.json", R"({
  "region": "ap-shanghai",
  "compute": {"cpu_cores": 8, "memory_gb": 32, "gpu_class": "T4"},
  "database": {"engine_version": "5.7"}
})");

  auto spec = cloudstrap::config::LoadResourceSpec(path.string());
  assert(spec.region() == "ap-shanghai");
  assert(spec.compute().cpu_cores() == 8);
  assert(spec.compute().disk_gb() == 50);
  assert(spec.compute().gpu_class() == "T4");
  assert(spec.database().engine_version() == "5.7");
  assert(spec.database().memory_mb() == 4000);
  assert(spec.database().storage_gb() == 100);

  cloudstrap::config::ValidateResourceSpec(spec, 20);
}

void TestResourceSpecOptionalSections() {
  auto spec = cloudstrap::config::ParseResourceSpec("compute: {}\n");
  assert(spec.region() == "ap-guangzhou");
  assert(spec.has_compute());
  assert(!spec.has_database());
  assert(spec.compute().cpu_cores() == 2);
  assert(spec.compute().memory_gb() == 4);
}

void TestResourceSpecValidation() {
  auto expect_invalid = [](const std::string& text) {
    bool threw = false;
    try {
      auto spec = cloudstrap::config::ParseResourceSpec(text);
      cloudstrap::config::ValidateResourceSpec(spec, 20);
    } catch (const cloudstrap::util::InvalidResourceSpec&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid("compute:\n  disk_gb: 10\n");
  expect_invalid("database:\n  engine_version: \"9.1\"\n");
  expect_invalid("compute:\n  no_such_field: 1\n");
}

} // namespace

int main() {
  TestRuntimeConfigSections();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestEmptyDocumentYieldsDefaults();
  TestResourceSpecFromJsonAppliesDefaults();
  TestResourceSpecOptionalSections();
  TestResourceSpecValidation();

  std::cout << "cloudstrap_unit_config_loader: pass\n";
  return 0;
}
