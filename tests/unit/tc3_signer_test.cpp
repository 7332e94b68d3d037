#include "internal/provider/tencent/tc3_signer.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace cloudstrap::provider::tencent;

void TestSha256Vectors() {
  assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestHmacRfc4231Case2() {
  const auto mac = HmacSha256("Jefe", "what do ya want for nothing?");
  assert(HexEncode(mac) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

Tc3Request SampleRequest() {
  Tc3Request request;
  request.service   = "cvm";
  request.host      = "cvm.tencentcloudapi.com";
  request.action    = "DescribeInstances";
  request.version   = "2017-03-12";
  request.region    = "ap-guangzhou";
  request.payload   = R"({"Limit":1})";
  request.timestamp = 1551113065; // 2019-02-25 UTC
  return request;
}

void TestCanonicalRequestShape() {
  const auto canonical = CanonicalRequest(SampleRequest());
  const auto expected  = std::string("POST\n/\n\ncontent-type:application/json; charset=utf-8\nhost:cvm.tencentcloudapi.com\n\n"
                                      "content-type;host\n") +
                        Sha256Hex(R"({"Limit":1})");
  assert(canonical == expected);
}

void TestAuthorizationHeader() {
  const Tc3Credentials credentials{"AKIDEXAMPLE", "secret"};
  const auto           auth = Authorization(credentials, SampleRequest());

  const std::string prefix =
      "TC3-HMAC-SHA256 Credential=AKIDEXAMPLE/2019-02-25/cvm/tc3_request, SignedHeaders=content-type;host, Signature=";
  assert(auth.rfind(prefix, 0) == 0);
  assert(auth.size() == prefix.size() + 64);

  // Deterministic for identical input, sensitive to the payload.
  assert(Authorization(credentials, SampleRequest()) == auth);
  auto other    = SampleRequest();
  other.payload = "{}";
  assert(Authorization(credentials, other) != auth);
}

void TestSignedHeaders() {
  const auto headers = SignRequest({"AKIDEXAMPLE", "secret"}, SampleRequest());

  auto find = [&](const std::string& name) -> std::string {
    for (const auto& [k, v] : headers) {
      if (k == name) {
        return v;
      }
    }
    return {};
  };

  assert(find("Authorization").rfind("TC3-HMAC-SHA256 ", 0) == 0);
  assert(find("Content-Type") == "application/json; charset=utf-8");
  assert(find("Host") == "cvm.tencentcloudapi.com");
  assert(find("X-TC-Action") == "DescribeInstances");
  assert(find("X-TC-Timestamp") == "1551113065");
  assert(find("X-TC-Version") == "2017-03-12");
  assert(find("X-TC-Region") == "ap-guangzhou");
}

} // namespace

int main() {
  TestSha256Vectors();
  TestHmacRfc4231Case2();
  TestCanonicalRequestShape();
  TestAuthorizationHeader();
  TestSignedHeaders();

  std::cout << "cloudstrap_unit_tc3_signer: pass\n";
  return 0;
}
