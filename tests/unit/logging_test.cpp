#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using cloudstrap::observability::BoolField;
using cloudstrap::observability::FormatRecord;
using cloudstrap::observability::IntField;
using cloudstrap::observability::StringField;

void TestPlainFieldsStayUnquoted() {
  const auto line = FormatRecord("Network created", {StringField("network_id", "vpc-1"), IntField("zones", 2),
                                                     BoolField("gpu", false)});
  assert(line == "Network created network_id=vpc-1 zones=2 gpu=false");
}

void TestMessageWithoutFields() {
  assert(FormatRecord("Provisioning complete", {}) == "Provisioning complete");
}

void TestProviderMessageIsQuotedOnOneLine() {
  const auto line = FormatRecord("Provisioning failed, cleaning up",
                                 {StringField("error", "boom\nNetwork ID: vpc-x\r\n"), StringField("state", "NETWORK_READY")});
  assert(line.find('\n') == std::string::npos);
  assert(line.find('\r') == std::string::npos);
  assert(line == "Provisioning failed, cleaning up error=\"boom\\nNetwork ID: vpc-x\\r\\n\" state=NETWORK_READY");
}

void TestQuotesEqualsAndEmptyValues() {
  const auto line = FormatRecord("Call", {StringField("detail", "a=\"b\\c\""), StringField("request_id", "")});
  assert(line == "Call detail=\"a=\\\"b\\\\c\\\"\" request_id=\"\"");
}

void TestMultiLineMessageIsFlattened() {
  assert(FormatRecord("first\nsecond", {}) == "first second");
}

} // namespace

int main() {
  TestPlainFieldsStayUnquoted();
  TestMessageWithoutFields();
  TestProviderMessageIsQuotedOnOneLine();
  TestQuotesEqualsAndEmptyValues();
  TestMultiLineMessageIsFlattened();

  std::cout << "cloudstrap_unit_logging: pass\n";
  return 0;
}
