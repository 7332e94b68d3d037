#pragma once

#include <google/protobuf/struct.pb.h>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cloudstrap::provider::tencent::json {

/*
  Request/response bodies are handled as google::protobuf::Struct and
  converted with the protobuf JSON utilities.
*/

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

Value String(std::string_view s);
Value Number(double n);
Value Bool(bool b);
Value StringList(const std::vector<std::string>& items);
Value List(std::vector<Value> items);
Value Object(std::initializer_list<std::pair<std::string_view, Value>> fields);

Struct MakeStruct(std::initializer_list<std::pair<std::string_view, Value>> fields);

std::string ToJson(const Struct& body);

// Throws ProviderError(kTransport) when `text` is not a JSON object.
Struct Parse(const std::string& text);

// Dotted path lookup ("Response.Vpc.VpcId"); numeric segments index lists.
const Value* Find(const Struct& root, std::string_view path);

std::string GetString(const Struct& root, std::string_view path);
double      GetNumber(const Struct& root, std::string_view path, double fallback = 0.0);

} // namespace cloudstrap::provider::tencent::json
