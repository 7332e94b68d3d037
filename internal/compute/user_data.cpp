#include "user_data.hpp"

#include <sstream>
#include <stdexcept>

#include "internal/util/secrets.hpp"

namespace cloudstrap::compute {
namespace {

constexpr const char* kGpuInstallInfo = "/tmp/user_define_install_info.ini";

bool IsSafeAccountName(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  for (char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string RenderBootScript(const BootPayloadOptions& options) {
  if (!IsSafeAccountName(options.login_account)) {
    throw std::invalid_argument("Invalid login account name: " + options.login_account);
  }
  if (options.public_key.empty() || options.public_key.find_first_of("'\n") != std::string::npos) {
    throw std::invalid_argument("Public key is empty or contains unsupported characters");
  }

  const std::string& account = options.login_account;
  const std::string  home    = "/home/" + account;

  std::ostringstream s;
  s << "#!/bin/bash\n";
  s << "mkdir -p " << home << "/.ssh\n";
  s << "echo '" << options.public_key << "' >> " << home << "/.ssh/authorized_keys\n";
  s << "chmod 700 " << home << "/.ssh\n";
  s << "chmod 600 " << home << "/.ssh/authorized_keys\n";
  s << "chown -R " << account << ":" << account << " " << home << "/.ssh\n";
  s << "echo '" << account << " ALL=(ALL) NOPASSWD:ALL' > /etc/sudoers.d/" << account << "\n";
  s << "chmod 440 /etc/sudoers.d/" << account << "\n";

  if (options.install_gpu_driver) {
    s << "cat > " << kGpuInstallInfo << " <<'EOF'\n";
    s << "DRIVER_VERSION=" << options.gpu.driver_version << "\n";
    s << "CUDA_VERSION=" << options.gpu.cuda_version << "\n";
    s << "CUDNN_VERSION=" << options.gpu.cudnn_version << "\n";
    s << "EOF\n";
    s << "wget -q -O /tmp/auto_install.sh " << options.gpu.installer_url << "\n";
    s << "chmod +x /tmp/auto_install.sh\n";
    s << "nohup /tmp/auto_install.sh > /var/log/gpu_driver_install.log 2>&1 &\n";
  }

  return s.str();
}

std::string EncodeBootPayload(const BootPayloadOptions& options) {
  return util::Base64Encode(RenderBootScript(options));
}

} // namespace cloudstrap::compute
