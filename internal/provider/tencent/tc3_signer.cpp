#include "tc3_signer.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <ctime>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace cloudstrap::provider::tencent {
namespace {

constexpr const char* kAlgorithm     = "TC3-HMAC-SHA256";
constexpr const char* kContentType   = "application/json; charset=utf-8";
constexpr const char* kSignedHeaders = "content-type;host";

std::string UtcDate(std::int64_t timestamp) {
  return util::FormatUtc(util::Clock::from_time_t(static_cast<std::time_t>(timestamp)), "%Y-%m-%d");
}

} // namespace

std::string HexEncode(std::string_view bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kDigits[c >> 4]);
    out.push_back(kDigits[c & 0x0f]);
  }
  return out;
}

std::string Sha256Hex(std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  unsigned int  len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return HexEncode(std::string_view(reinterpret_cast<const char*>(digest), len));
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()),
           data.size(), digest, &len) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), len);
}

std::string CanonicalRequest(const Tc3Request& request) {
  std::string canonical;
  canonical += "POST\n";
  canonical += "/\n";
  canonical += "\n"; // empty query string
  canonical += "content-type:";
  canonical += kContentType;
  canonical += "\nhost:" + request.host + "\n";
  canonical += "\n";
  canonical += kSignedHeaders;
  canonical += "\n";
  canonical += Sha256Hex(request.payload);
  return canonical;
}

std::string Authorization(const Tc3Credentials& credentials, const Tc3Request& request) {
  const std::string date             = UtcDate(request.timestamp);
  const std::string credential_scope = date + "/" + request.service + "/tc3_request";

  const std::string string_to_sign = std::string(kAlgorithm) + "\n" + std::to_string(request.timestamp) + "\n" +
                                     credential_scope + "\n" + Sha256Hex(CanonicalRequest(request));

  const std::string secret_date    = HmacSha256("TC3" + credentials.secret_key, date);
  const std::string secret_service = HmacSha256(secret_date, request.service);
  const std::string secret_signing = HmacSha256(secret_service, "tc3_request");
  const std::string signature      = HexEncode(HmacSha256(secret_signing, string_to_sign));

  return std::string(kAlgorithm) + " Credential=" + credentials.secret_id + "/" + credential_scope +
         ", SignedHeaders=" + kSignedHeaders + ", Signature=" + signature;
}

HeaderList SignRequest(const Tc3Credentials& credentials, const Tc3Request& request) {
  HeaderList headers;
  headers.emplace_back("Authorization", Authorization(credentials, request));
  headers.emplace_back("Content-Type", kContentType);
  headers.emplace_back("Host", request.host);
  headers.emplace_back("X-TC-Action", request.action);
  headers.emplace_back("X-TC-Timestamp", std::to_string(request.timestamp));
  headers.emplace_back("X-TC-Version", request.version);
  if (!request.region.empty()) {
    headers.emplace_back("X-TC-Region", request.region);
  }
  return headers;
}

} // namespace cloudstrap::provider::tencent
