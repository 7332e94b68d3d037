#include "secrets.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace cloudstrap::util {
namespace {

constexpr std::string_view kPasswordAlphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789@#$%";
constexpr std::size_t      kPasswordRandomLength = 15;

} // namespace

std::string RandomString(std::string_view alphabet, std::size_t length) {
  if (alphabet.empty() || alphabet.size() > 256) {
    throw std::invalid_argument("alphabet size must be in [1, 256]");
  }

  // Largest multiple of alphabet size that fits in a byte; bytes above it are rejected.
  const unsigned limit = 256 - (256 % alphabet.size());

  std::string out;
  out.reserve(length);
  unsigned char buffer[64];
  while (out.size() < length) {
    if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
      throw std::runtime_error("RAND_bytes failed");
    }
    for (unsigned char b : buffer) {
      if (b >= limit) {
        continue;
      }
      out.push_back(alphabet[b % alphabet.size()]);
      if (out.size() == length) {
        break;
      }
    }
  }
  return out;
}

std::string GenerateDatabasePassword(std::string_view prefix) {
  return std::string(prefix) + RandomString(kPasswordAlphabet, kPasswordRandomLength);
}

std::string Base64Encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
  if (written < 0) {
    throw std::runtime_error("base64 encoding failed");
  }
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

} // namespace cloudstrap::util
