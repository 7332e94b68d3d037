#include "json_helpers.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdlib>

#include "internal/util/errors.hpp"

namespace cloudstrap::provider::tencent::json {

Value String(std::string_view s) {
  Value v;
  v.set_string_value(std::string(s));
  return v;
}

Value Number(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value Bool(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value StringList(const std::vector<std::string>& items) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& item : items) {
    list->add_values()->set_string_value(item);
  }
  return v;
}

Value List(std::vector<Value> items) {
  Value v;
  auto* list = v.mutable_list_value();
  for (auto& item : items) {
    *list->add_values() = std::move(item);
  }
  return v;
}

Value Object(std::initializer_list<std::pair<std::string_view, Value>> fields) {
  Value v;
  *v.mutable_struct_value() = MakeStruct(fields);
  return v;
}

Struct MakeStruct(std::initializer_list<std::pair<std::string_view, Value>> fields) {
  Struct s;
  for (const auto& [key, value] : fields) {
    (*s.mutable_fields())[std::string(key)] = value;
  }
  return s;
}

std::string ToJson(const Struct& body) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(body, &out);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize request body: " + std::string(status.message()));
  }
  return out;
}

Struct Parse(const std::string& text) {
  Struct                                   out;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(text, &out, options);
  if (!status.ok()) {
    throw util::ProviderError(util::ProviderErrorKind::kTransport, "MalformedResponse",
                              "Malformed provider response: " + std::string(status.message()));
  }
  return out;
}

const Value* Find(const Struct& root, std::string_view path) {
  const Struct* current_struct = &root;
  const Value*  current        = nullptr;

  while (!path.empty()) {
    const auto        dot     = path.find('.');
    const std::string segment = std::string(path.substr(0, dot));
    path                      = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

    if (current_struct != nullptr) {
      auto it = current_struct->fields().find(segment);
      if (it == current_struct->fields().end()) {
        return nullptr;
      }
      current = &it->second;
    } else if (current != nullptr && current->has_list_value()) {
      char*      end   = nullptr;
      const long index = std::strtol(segment.c_str(), &end, 10);
      if (end == segment.c_str() || *end != '\0' || index < 0 || index >= current->list_value().values_size()) {
        return nullptr;
      }
      current = &current->list_value().values(static_cast<int>(index));
    } else {
      return nullptr;
    }

    current_struct = current->has_struct_value() ? &current->struct_value() : nullptr;
  }
  return current;
}

std::string GetString(const Struct& root, std::string_view path) {
  const Value* v = Find(root, path);
  if (v == nullptr || v->kind_case() != Value::kStringValue) {
    return {};
  }
  return v->string_value();
}

double GetNumber(const Struct& root, std::string_view path, double fallback) {
  const Value* v = Find(root, path);
  if (v == nullptr || v->kind_case() != Value::kNumberValue) {
    return fallback;
  }
  return v->number_value();
}

} // namespace cloudstrap::provider::tencent::json
