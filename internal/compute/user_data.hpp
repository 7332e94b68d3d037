#pragma once

#include <string>

namespace cloudstrap::compute {

struct GpuDriverVersions {
  std::string driver_version = "535.161.07";
  std::string cuda_version   = "12.4.0";
  std::string cudnn_version  = "8.9.7";
  std::string installer_url  = "https://mirrors.tencentyun.com/install/GPU/auto_install.sh";
};

struct BootPayloadOptions {
  std::string       login_account = "ubuntu";
  std::string       public_key;
  bool              install_gpu_driver = false;
  GpuDriverVersions gpu;
};

/*
  First-boot shell script: installs the public key for the login account,
  grants passwordless sudo, and (GPU only) starts the unattended driver
  installer in the background so boot is not held up.
*/
std::string RenderBootScript(const BootPayloadOptions& options);

// Base64 of RenderBootScript(), as the provider's user-data field expects.
std::string EncodeBootPayload(const BootPayloadOptions& options);

} // namespace cloudstrap::compute
