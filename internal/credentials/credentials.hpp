#pragma once

#include <string>

#include "config/config.pb.h"

namespace cloudstrap::credentials {

struct ApiCredentials {
  std::string id;
  std::string secret;
};

/*
  Reads the API key pair from the environment variables named in config
  (TENCENT_SECRET_ID / TENCENT_SECRET_KEY by default). Never prompts.

  Throws util::CredentialsMissing when either value is absent or empty.
*/
ApiCredentials ResolveApiCredentials(const cloudstrap::runtime::config::CredentialsConfig& config);

struct Keypair {
  std::string private_key_path;
  std::string public_key_path;
  std::string public_key_text; // "ssh-rsa AAAA... cloudstrap"
};

/*
  Generates an RSA-3072 key pair under `dest_dir`.

  The private key file is created with mode 0600 from the start and must not
  already exist. Throws std::runtime_error on any failure.
*/
Keypair GenerateKeypair(const std::string& dest_dir);

} // namespace cloudstrap::credentials
