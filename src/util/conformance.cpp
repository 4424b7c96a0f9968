#include "avroinfer/util/conformance.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace avroinfer::util::conformance {
namespace {

void convert(const OrderedJson& schema, const Json& instance, const std::string& path);

std::string branch_key(const OrderedJson& branch) {
  if (branch.is_string()) return branch.get<std::string>();
  if (branch.contains("name")) return branch["name"].get<std::string>();
  if (branch.contains("type") && branch["type"].is_string()) return branch["type"].get<std::string>();
  return {};
}

void handle_union(const OrderedJson& branches, const Json& instance, const std::string& path) {
  // Avro JSON encoding: {"<branch key>": value}
  if (instance.is_object() && instance.size() == 1) {
    const auto& key = instance.begin().key();
    for (const auto& branch : branches) {
      if (branch_key(branch) == key) {
        convert(branch, instance.begin().value(), path + "/" + key);
        return;
      }
    }
  }
  std::string last_error;
  for (const auto& branch : branches) {
    try {
      convert(branch, instance, path);
      return;
    } catch (const ValidationError& e) {
      last_error = e.what();
    }
  }
  throw ValidationError("No union branch matched at " + path + (last_error.empty() ? "" : (": " + last_error)));
}

void handle_number(const std::string& type, const Json& instance, const std::string& path) {
  if (!instance.is_number()) {
    throw ValidationError("Expected " + type + " at " + path);
  }
  if (type == "double") return;
  if (!instance.is_number_integer()) {
    throw ValidationError("Expected integral " + type + " at " + path);
  }
  if (type == "int") {
    bool fits = instance.is_number_unsigned()
                    ? instance.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())
                    : (instance.get<std::int64_t>() >= std::numeric_limits<std::int32_t>::min() &&
                       instance.get<std::int64_t>() <= std::numeric_limits<std::int32_t>::max());
    if (!fits) throw ValidationError("Value out of int range at " + path);
  } else if (instance.is_number_unsigned() &&
             instance.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw ValidationError("Value out of long range at " + path);
  }
}

void handle_primitive(const std::string& type, const Json& instance, const std::string& path) {
  if (type == "null") {
    if (!instance.is_null()) throw ValidationError("Expected null at " + path);
    return;
  }
  if (type == "boolean") {
    if (!instance.is_boolean()) throw ValidationError("Expected boolean at " + path);
    return;
  }
  if (type == "string") {
    if (!instance.is_string()) throw ValidationError("Expected string at " + path);
    return;
  }
  if (type == "int" || type == "long" || type == "double") {
    handle_number(type, instance, path);
    return;
  }
  throw ValidationError("Unknown type '" + type + "' at " + path);
}

void handle_array(const OrderedJson& schema, const Json& instance, const std::string& path) {
  if (!instance.is_array()) {
    throw ValidationError("Expected array at " + path);
  }
  const auto& items = schema.at("items");
  for (size_t i = 0; i < instance.size(); ++i) {
    convert(items, instance[i], path + "/" + std::to_string(i));
  }
}

void handle_record(const OrderedJson& schema, const Json& instance, const std::string& path) {
  if (!instance.is_object()) {
    throw ValidationError("Expected object at " + path);
  }
  const auto& fields = schema.at("fields");
  for (const auto& field : fields) {
    auto key = field.at("name").get<std::string>();
    if (!instance.contains(key)) {
      throw ValidationError("Missing required property: " + key + " at " + path);
    }
    convert(field.at("type"), instance.at(key), path + "/" + key);
  }
  for (const auto& [key, value] : instance.items()) {
    bool known = false;
    for (const auto& field : fields) {
      if (field.at("name") == key) { known = true; break; }
    }
    if (!known) throw ValidationError("Unexpected property: " + key + " at " + path);
  }
}

void convert(const OrderedJson& schema, const Json& instance, const std::string& path) {
  if (schema.is_array()) {
    handle_union(schema, instance, path);
    return;
  }
  if (schema.is_string()) {
    handle_primitive(schema.get<std::string>(), instance, path);
    return;
  }
  if (!schema.is_object() || !schema.contains("type")) {
    throw ValidationError("Malformed schema at " + path);
  }
  const auto& type = schema["type"];
  if (!type.is_string()) {
    convert(type, instance, path);
    return;
  }
  auto t = type.get<std::string>();
  if (t == "record") {
    handle_record(schema, instance, path);
  } else if (t == "array") {
    handle_array(schema, instance, path);
  } else {
    handle_primitive(t, instance, path);
  }
}

} // namespace

void check(const OrderedJson& schema, const Json& instance) {
  convert(schema, instance, "$");
}

bool conforms(const OrderedJson& schema, const Json& instance) {
  try {
    check(schema, instance);
    return true;
  } catch (const ValidationError&) {
    return false;
  }
}

} // namespace avroinfer::util::conformance
