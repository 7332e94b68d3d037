#include "credentials.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secrets.hpp"

namespace cloudstrap::credentials {
namespace {

constexpr unsigned    kRsaBits       = 3072;
constexpr const char* kKeyComment    = "cloudstrap";
constexpr const char* kPrivateKeyFile = "ssh_key";
constexpr const char* kPublicKeyFile  = "ssh_key.pub";

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using BnPtr   = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BioPtr  = std::unique_ptr<BIO, decltype(&BIO_free)>;

std::string OpenSslError(const std::string& what) {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return what;
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return what + ": " + buf;
}

std::string ReadEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value != nullptr ? std::string(value) : std::string();
}

void AppendSshString(std::string& out, const std::string& data) {
  const auto len = static_cast<std::uint32_t>(data.size());
  out.push_back(static_cast<char>((len >> 24) & 0xff));
  out.push_back(static_cast<char>((len >> 16) & 0xff));
  out.push_back(static_cast<char>((len >> 8) & 0xff));
  out.push_back(static_cast<char>(len & 0xff));
  out += data;
}

// SSH mpint: big-endian two's complement, leading zero when the high bit is set.
std::string SshMpint(const BIGNUM* bn) {
  std::vector<unsigned char> bytes(static_cast<std::size_t>(BN_num_bytes(bn)));
  BN_bn2bin(bn, bytes.data());
  std::string out;
  if (!bytes.empty() && (bytes.front() & 0x80) != 0) {
    out.push_back('\0');
  }
  out.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  return out;
}

BIGNUM* GetBnParam(const EVP_PKEY* pkey, const char* name) {
  BIGNUM* bn = nullptr;
  if (EVP_PKEY_get_bn_param(pkey, name, &bn) != 1) {
    throw std::runtime_error(OpenSslError(std::string("Failed to read RSA parameter ") + name));
  }
  return bn;
}

std::string OpenSshPublicKey(const EVP_PKEY* pkey) {
  BnPtr n(GetBnParam(pkey, OSSL_PKEY_PARAM_RSA_N), &BN_free);
  BnPtr e(GetBnParam(pkey, OSSL_PKEY_PARAM_RSA_E), &BN_free);

  std::string blob;
  AppendSshString(blob, "ssh-rsa");
  AppendSshString(blob, SshMpint(e.get()));
  AppendSshString(blob, SshMpint(n.get()));

  return std::string("ssh-rsa ") + util::Base64Encode(blob) + " " + kKeyComment;
}

void WritePrivateKey(const std::filesystem::path& path, EVP_PKEY* pkey) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    throw std::runtime_error("Failed to create " + path.string() + ": " + std::strerror(errno));
  }
  // umask can only clear bits; make the mode explicit regardless.
  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
    const int err = errno;
    ::close(fd);
    throw std::runtime_error("Failed to chmod " + path.string() + ": " + std::strerror(err));
  }

  // The BIO owns the descriptor from here on.
  BioPtr bio(BIO_new_fd(fd, BIO_CLOSE), &BIO_free);
  if (!bio) {
    ::close(fd);
    throw std::runtime_error(OpenSslError("Failed to open " + path.string()));
  }

  if (PEM_write_bio_PrivateKey_traditional(bio.get(), pkey, nullptr, nullptr, 0, nullptr, nullptr) != 1 ||
      BIO_flush(bio.get()) != 1) {
    throw std::runtime_error(OpenSslError("Failed to write private key " + path.string()));
  }
}

} // namespace

ApiCredentials ResolveApiCredentials(const cloudstrap::runtime::config::CredentialsConfig& config) {
  const std::string id_env  = config.secret_id_env().empty() ? "TENCENT_SECRET_ID" : config.secret_id_env();
  const std::string key_env = config.secret_key_env().empty() ? "TENCENT_SECRET_KEY" : config.secret_key_env();

  ApiCredentials credentials{ReadEnv(id_env), ReadEnv(key_env)};
  if (credentials.id.empty() || credentials.secret.empty()) {
    throw util::CredentialsMissing("API credentials not set; export " + id_env + " and " + key_env);
  }
  return credentials;
}

Keypair GenerateKeypair(const std::string& dest_dir) {
  std::filesystem::create_directories(dest_dir);

  PkeyPtr pkey(EVP_RSA_gen(kRsaBits), &EVP_PKEY_free);
  if (!pkey) {
    throw std::runtime_error(OpenSslError("RSA key generation failed"));
  }

  Keypair keypair;
  keypair.private_key_path = (std::filesystem::path(dest_dir) / kPrivateKeyFile).string();
  keypair.public_key_path  = (std::filesystem::path(dest_dir) / kPublicKeyFile).string();
  keypair.public_key_text  = OpenSshPublicKey(pkey.get());

  WritePrivateKey(keypair.private_key_path, pkey.get());

  std::ofstream pub(keypair.public_key_path, std::ios::out | std::ios::trunc);
  pub << keypair.public_key_text << "\n";
  if (!pub) {
    throw std::runtime_error("Failed to write public key " + keypair.public_key_path);
  }

  CLOUDSTRAP_LOG_INFO("Key pair generated", {observability::StringField("path", keypair.private_key_path),
                                             observability::IntField("bits", kRsaBits)});
  return keypair;
}

} // namespace cloudstrap::credentials
