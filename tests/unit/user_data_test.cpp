#include "internal/compute/user_data.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/secrets.hpp"

namespace {

using cloudstrap::compute::BootPayloadOptions;
using cloudstrap::compute::EncodeBootPayload;
using cloudstrap::compute::RenderBootScript;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

BootPayloadOptions Options(bool gpu) {
  BootPayloadOptions options;
  options.login_account      = "ubuntu";
  options.public_key         = "ssh-rsa AAAAB3Nza cloudstrap";
  options.install_gpu_driver = gpu;
  return options;
}

void TestCpuScriptInstallsKeyAndSudo() {
  const auto script = RenderBootScript(Options(false));
  assert(script.rfind("#!/bin/bash\n", 0) == 0);
  assert(Contains(script, "ssh-rsa AAAAB3Nza cloudstrap' >> /home/ubuntu/.ssh/authorized_keys"));
  assert(Contains(script, "chmod 600 /home/ubuntu/.ssh/authorized_keys"));
  assert(Contains(script, "ubuntu ALL=(ALL) NOPASSWD:ALL"));
  assert(Contains(script, "chmod 440 /etc/sudoers.d/ubuntu"));
  assert(!Contains(script, "auto_install.sh"));
}

void TestGpuScriptStartsDriverInstallInBackground() {
  const auto script = RenderBootScript(Options(true));
  assert(Contains(script, "DRIVER_VERSION=535.161.07"));
  assert(Contains(script, "CUDA_VERSION=12.4.0"));
  assert(Contains(script, "CUDNN_VERSION=8.9.7"));
  assert(Contains(script, "https://mirrors.tencentyun.com/install/GPU/auto_install.sh"));
  assert(Contains(script, "2>&1 &\n"));
}

void TestEncodedPayloadIsBase64OfScript() {
  const auto options = Options(false);
  assert(EncodeBootPayload(options) == cloudstrap::util::Base64Encode(RenderBootScript(options)));
  assert(cloudstrap::util::Base64Encode("abc") == "YWJj");
}

void TestRejectsUnsafeInputs() {
  auto bad_account          = Options(false);
  bad_account.login_account = "root; rm -rf /";
  bool threw                = false;
  try {
    RenderBootScript(bad_account);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  auto bad_key       = Options(false);
  bad_key.public_key = "ssh-rsa AAAA' && reboot '";
  threw              = false;
  try {
    RenderBootScript(bad_key);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCpuScriptInstallsKeyAndSudo();
  TestGpuScriptStartsDriverInstallInBackground();
  TestEncodedPayloadIsBase64OfScript();
  TestRejectsUnsafeInputs();

  std::cout << "cloudstrap_unit_user_data: pass\n";
  return 0;
}
