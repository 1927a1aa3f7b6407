#include "internal.hpp"

#include <cmath>
#include <cstdlib>
#include <regex>
#include <set>

namespace completion_repair {

namespace {

using detail::contains_name;
using detail::to_lower;

const std::set<std::string>& schema_type_values() {
  static const std::set<std::string> values = {"string", "number", "integer", "boolean", "object", "array", "null"};
  return values;
}

const std::set<std::string>& schema_meta_properties() {
  static const std::set<std::string> names = {"$schema", "additionalProperties", "required", "enum",      "allOf",
                                              "anyOf",   "oneOf",                "items",    "minLength", "maxLength",
                                              "minimum", "maximum",              "pattern",  "format",    "default"};
  return names;
}

bool has_meta_property(const JsonObject& obj) {
  for (const auto& kv : obj) {
    if (schema_meta_properties().count(kv.first)) return true;
  }
  return false;
}

std::vector<std::string> types_of(const Json* schema) {
  std::vector<std::string> types;
  if (!schema || !schema->is_object()) return types;
  auto it = schema->as_object().find("type");
  if (it == schema->as_object().end()) return types;
  if (it->second.is_string()) {
    types.push_back(to_lower(it->second.as_string()));
  } else if (it->second.is_array()) {
    for (const auto& t : it->second.as_array()) {
      if (t.is_string()) types.push_back(to_lower(t.as_string()));
    }
  }
  return types;
}

const Json* member_schema(const Json* schema, const std::string& key) {
  if (!schema || !schema->is_object()) return nullptr;
  const auto& sch = schema->as_object();
  auto it_props = sch.find("properties");
  if (it_props != sch.end() && it_props->second.is_object()) {
    auto it = it_props->second.as_object().find(key);
    if (it != it_props->second.as_object().end()) return &it->second;
  }
  auto it_ap = sch.find("additionalProperties");
  if (it_ap != sch.end() && it_ap->second.is_object()) return &it_ap->second;
  return nullptr;
}

const Json* items_schema(const Json* schema) {
  if (!schema || !schema->is_object()) return nullptr;
  auto it = schema->as_object().find("items");
  if (it == schema->as_object().end() || !it->second.is_object()) return nullptr;
  return &it->second;
}

bool is_required(const Json* schema, const std::string& key) {
  if (!schema || !schema->is_object()) return false;
  auto it = schema->as_object().find("required");
  if (it == schema->as_object().end() || !it->second.is_array()) return false;
  for (const auto& k : it->second.as_array()) {
    if (k.is_string() && k.as_string() == key) return true;
  }
  return false;
}

bool declares_property(const Json* schema, const std::string& key) {
  if (!schema || !schema->is_object()) return false;
  auto it = schema->as_object().find("properties");
  return it != schema->as_object().end() && it->second.is_object() && it->second.as_object().contains(key);
}

bool contains_name_icase(const std::vector<std::string>& names, const std::string& name) {
  const std::string lower = to_lower(name);
  for (const auto& n : names) {
    if (to_lower(n) == lower) return true;
  }
  return false;
}

// Visits every object reachable from `value` with the schema node describing it.
template <typename Fn>
void for_each_object(Json& value, const Json* schema, size_t depth, size_t max_depth, const Fn& fn) {
  if (depth > max_depth) return;
  if (value.is_object()) {
    fn(value.as_object(), schema);
    for (auto& kv : value.as_object()) {
      for_each_object(kv.second, member_schema(schema, kv.first), depth + 1, max_depth, fn);
    }
  } else if (value.is_array()) {
    const Json* item = items_schema(schema);
    for (auto& elem : value.as_array()) for_each_object(elem, item, depth + 1, max_depth, fn);
  }
}

void add_repair(std::vector<std::string>* repairs, std::string text) {
  if (repairs) repairs->push_back(std::move(text));
}

// { "type": "string", "description": "actual value" }
bool is_primitive_field_definition(const JsonObject& obj) {
  auto it_type = obj.find("type");
  if (it_type == obj.end() || !it_type->second.is_string()) return false;
  if (!schema_type_values().count(it_type->second.as_string())) return false;
  if (!obj.contains("description") || obj.contains("properties")) return false;
  return has_meta_property(obj) || obj.size() <= 3;
}

// { "type": "object", "properties": {...data...}, "required": [...] }
bool is_object_schema_with_data(const JsonObject& obj) {
  auto it_type = obj.find("type");
  if (it_type == obj.end() || !it_type->second.is_string() || it_type->second.as_string() != "object") return false;
  auto it_props = obj.find("properties");
  if (it_props == obj.end() || !it_props->second.is_object()) return false;
  if (!has_meta_property(obj)) return false;
  for (const auto& kv : it_props->second.as_object()) {
    const Json& v = kv.second;
    if (!v.is_object()) return true;
    const auto& vo = v.as_object();
    auto it = vo.find("type");
    if (it == vo.end() || !it->second.is_string() || !schema_type_values().count(it->second.as_string())) return true;
    if (vo.contains("description") || vo.contains("properties")) return true;
  }
  return false;
}

size_t extract_field_values(Json& value, size_t depth, size_t max_depth) {
  if (depth > max_depth) return 0;
  size_t count = 0;
  if (value.is_array()) {
    for (auto& elem : value.as_array()) count += extract_field_values(elem, depth + 1, max_depth);
    return count;
  }
  if (!value.is_object()) return 0;

  const auto& obj = value.as_object();
  if (is_primitive_field_definition(obj)) {
    Json inner = obj.at("description");
    value = std::move(inner);
    return 1 + extract_field_values(value, depth + 1, max_depth);
  }
  if (is_object_schema_with_data(obj)) {
    Json inner = obj.at("properties");
    value = std::move(inner);
    return 1 + extract_field_values(value, depth + 1, max_depth);
  }
  for (auto& kv : value.as_object()) count += extract_field_values(kv.second, depth + 1, max_depth);
  return count;
}

std::optional<double> extract_number(const std::string& text) {
  const std::string t = detail::trim_copy(text);
  if (t.empty() || t.size() > 200) return std::nullopt;

  char* end = nullptr;
  double strict = std::strtod(t.c_str(), &end);
  if (end == t.c_str() + t.size() && std::isfinite(strict) && !detail::is_alpha(t[0])) return strict;

  static const std::regex leading(R"(^(?:~|\xE2\x89\x88)?\s{0,8}(-?\d{1,30}(?:\.\d{1,30})?))");
  static const std::regex embedded(R"(\b(-?\d{1,30}(?:\.\d{1,30})?)\b)");
  std::smatch m;
  if (std::regex_search(t, m, leading) || std::regex_search(t, m, embedded)) {
    double n = std::strtod(m.str(1).c_str(), nullptr);
    if (std::isfinite(n)) return n;
  }
  return std::nullopt;
}

}  // namespace

size_t unwrap_schema_envelopes(Json& value, const Json& schema, const SanitizerConfig& config,
                               std::vector<std::string>* repairs) {
  size_t count = 0;
  if (value.is_object()) {
    const auto& obj = value.as_object();
    auto it_type = obj.find("type");
    auto it_props = obj.find("properties");
    // A schema that really asks for "type"/"properties" keys is describing data, not an envelope.
    bool expected = declares_property(&schema, "type") || declares_property(&schema, "properties");
    if (!expected && it_type != obj.end() && it_props != obj.end() && it_type->second.is_string() &&
        it_type->second.as_string() == "object" && it_props->second.is_object() && !it_props->second.as_object().empty()) {
      Json inner = it_props->second;
      value = std::move(inner);
      add_repair(repairs, "Unwrapped JSON schema envelope around the response data");
      ++count;
    }
  }

  size_t fields = extract_field_values(value, 0, config.max_nesting_depth);
  if (fields > 0) {
    add_repair(repairs, "Extracted " + std::to_string(fields) + " value(s) from schema field definitions");
    count += fields;
  }
  return count;
}

size_t coerce_nulls_to_absent(Json& value, const Json& schema, const SanitizerConfig& config,
                              std::vector<std::string>* repairs) {
  size_t count = 0;
  for_each_object(value, &schema, 0, config.max_nesting_depth, [&](JsonObject& obj, const Json* sch) {
    std::vector<std::string> drop;
    for (const auto& kv : obj) {
      if (!kv.second.is_null() || is_required(sch, kv.first)) continue;
      auto types = types_of(member_schema(sch, kv.first));
      if (types.empty() || contains_name(types, "null")) continue;
      drop.push_back(kv.first);
    }
    for (const auto& key : drop) {
      obj.erase(key);
      add_repair(repairs, "Removed null value for optional property '" + key + "'");
      ++count;
    }
  });
  return count;
}

size_t fix_property_typos(Json& value, const Json& schema, const SanitizerConfig& config,
                          std::vector<std::string>* repairs) {
  size_t count = 0;
  for_each_object(value, &schema, 0, config.max_nesting_depth, [&](JsonObject& obj, const Json* sch) {
    std::vector<std::pair<std::string, std::string>> renames;
    for (const auto& kv : obj) {
      const std::string& key = kv.first;
      auto it_map = config.property_typo_corrections.find(key);
      if (it_map != config.property_typo_corrections.end() && it_map->second != key) {
        renames.emplace_back(key, it_map->second);
        continue;
      }
      if (key.size() < 2 || key.back() != '_') continue;
      std::string stripped = key;
      while (!stripped.empty() && stripped.back() == '_') stripped.pop_back();
      if (stripped.empty()) continue;
      if (declares_property(sch, stripped) || contains_name(config.known_properties, stripped)) {
        renames.emplace_back(key, stripped);
      }
    }
    for (const auto& r : renames) {
      if (obj.rename(r.first, r.second)) {
        add_repair(repairs, "Renamed property '" + r.first + "' to '" + r.second + "'");
        ++count;
      }
    }
  });
  return count;
}

size_t coerce_scalars_to_sequences(Json& value, const Json& schema, const SanitizerConfig& config,
                                   std::vector<std::string>* repairs) {
  size_t count = 0;
  for_each_object(value, &schema, 0, config.max_nesting_depth, [&](JsonObject& obj, const Json* sch) {
    for (auto& kv : obj) {
      if (kv.second.is_array() || kv.second.is_null()) continue;
      auto types = types_of(member_schema(sch, kv.first));
      bool wants_array = contains_name(types, "array");
      if (wants_array) {
        // Leave values that already satisfy an alternative type alone.
        for (const auto& t : types) {
          if (t == "array") continue;
          if ((t == "string" && kv.second.is_string()) || (t == "object" && kv.second.is_object()) ||
              ((t == "number" || t == "integer") && kv.second.is_number()) || (t == "boolean" && kv.second.is_bool())) {
            wants_array = false;
          }
        }
      } else if (types.empty()) {
        wants_array = contains_name_icase(config.array_property_names, kv.first);
      }
      if (!wants_array) continue;
      JsonArray wrapped;
      wrapped.push_back(std::move(kv.second));
      kv.second = Json(std::move(wrapped));
      add_repair(repairs, "Wrapped single value of '" + kv.first + "' in an array");
      ++count;
    }
  });
  return count;
}

size_t coerce_numeric_strings(Json& value, const Json& schema, const SanitizerConfig& config,
                              std::vector<std::string>* repairs) {
  size_t count = 0;
  for_each_object(value, &schema, 0, config.max_nesting_depth, [&](JsonObject& obj, const Json* sch) {
    for (auto& kv : obj) {
      if (!kv.second.is_string()) continue;
      auto types = types_of(member_schema(sch, kv.first));
      bool numeric = false;
      if (types.empty()) {
        numeric = contains_name_icase(config.numeric_properties, kv.first);
      } else if (!contains_name(types, "string")) {
        numeric = contains_name(types, "number") || contains_name(types, "integer");
      }
      if (!numeric) continue;
      auto n = extract_number(kv.second.as_string());
      if (!n) continue;
      add_repair(repairs, "Converted '" + kv.first + "' value \"" + kv.second.as_string() + "\" to number");
      kv.second = Json(*n);
      ++count;
    }
  });
  return count;
}

NormalizeResult normalize_parsed(const Json& value, const Json& schema, const SanitizerConfig& config) {
  NormalizeResult result{value, {}};
  const NormalizerOptions& opts = config.normalizer;
  if (opts.unwrap_schema_envelope) unwrap_schema_envelopes(result.value, schema, config, &result.repairs);
  if (opts.convert_nulls) coerce_nulls_to_absent(result.value, schema, config, &result.repairs);
  if (opts.fix_property_typos) fix_property_typos(result.value, schema, config, &result.repairs);
  if (opts.coerce_sequences) coerce_scalars_to_sequences(result.value, schema, config, &result.repairs);
  if (opts.coerce_numbers) coerce_numeric_strings(result.value, schema, config, &result.repairs);
  return result;
}

}  // namespace completion_repair
