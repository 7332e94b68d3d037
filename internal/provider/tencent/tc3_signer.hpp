#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cloudstrap::provider::tencent {

/*
  TC3-HMAC-SHA256 request signing (Tencent Cloud API 3.0).

  Only the POST / application/json form is produced; the signed headers are
  content-type and host.
*/

struct Tc3Credentials {
  std::string secret_id;
  std::string secret_key;
};

struct Tc3Request {
  std::string  service; // "cvm", "vpc", "cdb"
  std::string  host;    // "<service>.tencentcloudapi.com"
  std::string  action;
  std::string  version;
  std::string  region;
  std::string  payload;
  std::int64_t timestamp = 0; // unix seconds
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

std::string HexEncode(std::string_view bytes);
std::string Sha256Hex(std::string_view data);

// Raw (binary) HMAC-SHA256 digest.
std::string HmacSha256(std::string_view key, std::string_view data);

std::string CanonicalRequest(const Tc3Request& request);
std::string Authorization(const Tc3Credentials& credentials, const Tc3Request& request);

// Every header the API expects, Authorization included.
HeaderList SignRequest(const Tc3Credentials& credentials, const Tc3Request& request);

} // namespace cloudstrap::provider::tencent
