#include "internal.hpp"

#include <cmath>
#include <regex>

namespace completion_repair {

using detail::to_lower;

// ---------------- JSON schema validation (subset) ----------------

static std::optional<double> get_number_field(const JsonObject& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_number()) return std::nullopt;
  return it->second.as_number();
}

static bool matches_type(const Json& value, const std::string& type) {
  if (type == "null") return value.is_null();
  if (type == "boolean") return value.is_bool();
  if (type == "string") return value.is_string();
  if (type == "array") return value.is_array();
  if (type == "object") return value.is_object();
  if (type == "number") return value.is_number();
  if (type == "integer") {
    if (!value.is_number() || !std::isfinite(value.as_number())) return false;
    double ip;
    return std::fabs(std::modf(value.as_number(), &ip)) <= 1e-12;
  }
  return true;
}

// Declared types of a schema node: "type" as a string or an array of strings.
static std::vector<std::string> declared_types(const JsonObject& sch) {
  std::vector<std::string> types;
  auto it = sch.find("type");
  if (it == sch.end()) return types;
  if (it->second.is_string()) {
    types.push_back(to_lower(it->second.as_string()));
  } else if (it->second.is_array()) {
    for (const auto& t : it->second.as_array()) {
      if (t.is_string()) types.push_back(to_lower(t.as_string()));
    }
  }
  return types;
}

namespace {

class Validator {
 public:
  explicit Validator(std::vector<ValidationError>* errors) : errors_(errors) {}

  void check(const Json& value, const Json& schema, const std::string& path) const {
    if (!schema.is_object()) {
      report("schema must be object", path);
      return;
    }
    const auto& sch = schema.as_object();
    check_combinators(value, sch, path);
    check_const_enum(value, sch, path);
    if (!check_type(value, sch, path)) return;
    if (value.is_number()) check_number(value.as_number(), sch, path);
    if (value.is_string()) check_string(value.as_string(), sch, path);
    if (value.is_array()) check_array(value.as_array(), sch, path);
    if (value.is_object()) check_object(value.as_object(), sch, path);
    check_conditional(value, sch, path);
  }

 private:
  std::vector<ValidationError>* errors_;

  // Collects when an error list is attached, otherwise throws.
  void report(const std::string& message, const std::string& path, const std::string& kind = "schema") const {
    if (errors_) {
      errors_->emplace_back(message, path, kind);
      return;
    }
    throw ValidationError(message, path, kind);
  }

  static bool passes(const Json& value, const Json& schema, const std::string& path) {
    std::vector<ValidationError> errors;
    Validator(&errors).check(value, schema, path);
    return errors.empty();
  }

  void check_combinators(const Json& value, const JsonObject& sch, const std::string& path) const {
    auto it_all = sch.find("allOf");
    if (it_all != sch.end() && it_all->second.is_array()) {
      for (const auto& sub : it_all->second.as_array()) {
        if (sub.is_object()) check(value, sub, path);
      }
    }

    auto it_any = sch.find("anyOf");
    if (it_any != sch.end() && it_any->second.is_array()) {
      bool ok = false;
      for (const auto& sub : it_any->second.as_array()) {
        if (sub.is_object() && passes(value, sub, path)) {
          ok = true;
          break;
        }
      }
      if (!ok) report("does not match anyOf", path);
    }

    auto it_one = sch.find("oneOf");
    if (it_one != sch.end() && it_one->second.is_array()) {
      int ok_count = 0;
      for (const auto& sub : it_one->second.as_array()) {
        if (sub.is_object() && passes(value, sub, path)) ok_count++;
      }
      if (ok_count != 1) report("does not match oneOf", path);
    }
  }

  void check_const_enum(const Json& value, const JsonObject& sch, const std::string& path) const {
    auto it_const = sch.find("const");
    if (it_const != sch.end() && !json_equals(value, it_const->second)) report("value does not match const", path);

    auto it_enum = sch.find("enum");
    if (it_enum != sch.end() && it_enum->second.is_array()) {
      bool ok = false;
      for (const auto& v : it_enum->second.as_array()) {
        if (json_equals(value, v)) {
          ok = true;
          break;
        }
      }
      if (!ok) report("value not in enum", path);
    }
  }

  // Returns false when the type is wrong, so type-specific checks are skipped.
  bool check_type(const Json& value, const JsonObject& sch, const std::string& path) const {
    auto types = declared_types(sch);
    if (types.empty()) return true;
    for (const auto& t : types) {
      if (matches_type(value, t)) return true;
    }
    std::string expected = types[0];
    for (size_t i = 1; i < types.size(); ++i) expected += " or " + types[i];
    report("expected " + expected, path, "type");
    return false;
  }

  void check_number(double n, const JsonObject& sch, const std::string& path) const {
    if (auto mn = get_number_field(sch, "minimum")) {
      if (n < *mn) report("number < minimum", path);
    }
    if (auto mx = get_number_field(sch, "maximum")) {
      if (n > *mx) report("number > maximum", path);
    }
    if (auto mn = get_number_field(sch, "exclusiveMinimum")) {
      if (n <= *mn) report("number <= exclusiveMinimum", path);
    }
    if (auto mx = get_number_field(sch, "exclusiveMaximum")) {
      if (n >= *mx) report("number >= exclusiveMaximum", path);
    }
    if (auto mul = get_number_field(sch, "multipleOf")) {
      if (*mul > 0.0) {
        double q = n / *mul;
        if (!std::isfinite(q) || std::fabs(q - std::round(q)) > 1e-9) report("number is not a multipleOf", path);
      }
    }
  }

  void check_string(const std::string& s, const JsonObject& sch, const std::string& path) const {
    if (auto mn = get_number_field(sch, "minLength")) {
      if (static_cast<double>(s.size()) < *mn) report("string shorter than minLength", path);
    }
    if (auto mx = get_number_field(sch, "maxLength")) {
      if (static_cast<double>(s.size()) > *mx) report("string longer than maxLength", path);
    }

    auto it_pat = sch.find("pattern");
    if (it_pat != sch.end() && it_pat->second.is_string()) {
      try {
        std::regex r(it_pat->second.as_string(), std::regex::ECMAScript);
        if (!std::regex_search(s, r)) report("string does not match pattern", path);
      } catch (const std::regex_error&) {
        report("invalid pattern regex", path);
      }
    }

    auto it_fmt = sch.find("format");
    if (it_fmt != sch.end() && it_fmt->second.is_string()) {
      static const std::regex email(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
      static const std::regex uuid(R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)");
      static const std::regex date(R"(^\d{4}-\d{2}-\d{2}$)");
      static const std::regex date_time(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:\d{2})$)");
      const std::string fmt = to_lower(it_fmt->second.as_string());
      if (s.size() <= 512) {
        if (fmt == "email" && !std::regex_match(s, email)) report("string does not match email format", path);
        if (fmt == "uuid" && !std::regex_match(s, uuid)) report("string does not match uuid format", path);
        if (fmt == "date" && !std::regex_match(s, date)) report("string does not match date format", path);
        if (fmt == "date-time" && !std::regex_match(s, date_time)) report("string does not match date-time format", path);
      } else if (fmt == "email" || fmt == "uuid" || fmt == "date" || fmt == "date-time") {
        report("string too long for " + fmt + " format", path);
      }
    }
  }

  void check_array(const JsonArray& arr, const JsonObject& sch, const std::string& path) const {
    if (auto mn = get_number_field(sch, "minItems")) {
      if (static_cast<double>(arr.size()) < *mn) report("array shorter than minItems", path);
    }
    if (auto mx = get_number_field(sch, "maxItems")) {
      if (static_cast<double>(arr.size()) > *mx) report("array longer than maxItems", path);
    }

    auto it_items = sch.find("items");
    if (it_items != sch.end() && it_items->second.is_object()) {
      for (size_t idx = 0; idx < arr.size(); ++idx) {
        check(arr[idx], it_items->second, path + "[" + std::to_string(idx) + "]");
      }
    }

    auto it_contains = sch.find("contains");
    if (it_contains != sch.end() && it_contains->second.is_object()) {
      size_t count = 0;
      for (size_t idx = 0; idx < arr.size(); ++idx) {
        if (passes(arr[idx], it_contains->second, path + "[" + std::to_string(idx) + "]")) ++count;
      }
      size_t min_contains = 1;
      if (auto mn = get_number_field(sch, "minContains")) {
        if (*mn >= 0.0) min_contains = static_cast<size_t>(*mn);
      }
      if (count < min_contains) report("array does not satisfy contains/minContains", path);
      if (auto mx = get_number_field(sch, "maxContains")) {
        if (*mx >= 0.0 && count > static_cast<size_t>(*mx)) report("array exceeds maxContains", path);
      }
    }
  }

  void check_object(const JsonObject& obj, const JsonObject& sch, const std::string& path) const {
    if (auto mn = get_number_field(sch, "minProperties")) {
      if (static_cast<double>(obj.size()) < *mn) report("object has fewer properties than minProperties", path);
    }
    if (auto mx = get_number_field(sch, "maxProperties")) {
      if (static_cast<double>(obj.size()) > *mx) report("object has more properties than maxProperties", path);
    }

    auto it_req = sch.find("required");
    if (it_req != sch.end() && it_req->second.is_array()) {
      for (const auto& k : it_req->second.as_array()) {
        if (k.is_string() && !obj.contains(k.as_string())) {
          report("missing required property: " + k.as_string(), path + "." + k.as_string());
        }
      }
    }

    auto it_dep = sch.find("dependentRequired");
    if (it_dep != sch.end() && it_dep->second.is_object()) {
      for (const auto& dep : it_dep->second.as_object()) {
        if (!obj.contains(dep.first) || !dep.second.is_array()) continue;
        for (const auto& req : dep.second.as_array()) {
          if (req.is_string() && !obj.contains(req.as_string())) {
            report("missing dependentRequired property: " + req.as_string() + " (required by " + dep.first + ")",
                   path + "." + req.as_string());
          }
        }
      }
    }

    auto it_pn = sch.find("propertyNames");
    if (it_pn != sch.end() && it_pn->second.is_object()) {
      for (const auto& kv : obj) {
        if (!passes(Json(kv.first), it_pn->second, path + ".<propertyNames>")) {
          report("property name does not satisfy propertyNames: " + kv.first, path + ".<propertyNames>");
        }
      }
    }

    const JsonObject* props = nullptr;
    auto it_props = sch.find("properties");
    if (it_props != sch.end() && it_props->second.is_object()) props = &it_props->second.as_object();

    bool forbid_additional = false;
    const Json* additional_schema = nullptr;
    auto it_ap = sch.find("additionalProperties");
    if (it_ap != sch.end()) {
      if (it_ap->second.is_bool()) {
        forbid_additional = !it_ap->second.as_bool();
      } else if (it_ap->second.is_object()) {
        additional_schema = &it_ap->second;
      }
    }

    for (const auto& kv : obj) {
      const std::string child = path + "." + kv.first;
      if (props && props->contains(kv.first)) {
        check(kv.second, props->at(kv.first), child);
      } else if (forbid_additional) {
        report("additionalProperties forbidden: " + kv.first, child);
      } else if (additional_schema) {
        check(kv.second, *additional_schema, child);
      }
    }
  }

  void check_conditional(const Json& value, const JsonObject& sch, const std::string& path) const {
    auto it_if = sch.find("if");
    if (it_if == sch.end() || !it_if->second.is_object()) return;
    const char* branch = passes(value, it_if->second, path) ? "then" : "else";
    auto it = sch.find(branch);
    if (it != sch.end() && it->second.is_object()) check(value, it->second, path);
  }
};

void collect_property_names(const Json& schema, std::vector<std::string>& out, size_t depth) {
  if (!schema.is_object() || depth > 64) return;
  const auto& sch = schema.as_object();
  auto it_props = sch.find("properties");
  if (it_props != sch.end() && it_props->second.is_object()) {
    for (const auto& kv : it_props->second.as_object()) {
      if (!detail::contains_name(out, kv.first)) out.push_back(kv.first);
      collect_property_names(kv.second, out, depth + 1);
    }
  }
  for (const char* key : {"items", "additionalProperties", "if", "then", "else"}) {
    auto it = sch.find(key);
    if (it != sch.end()) collect_property_names(it->second, out, depth + 1);
  }
  for (const char* key : {"allOf", "anyOf", "oneOf"}) {
    auto it = sch.find(key);
    if (it == sch.end() || !it->second.is_array()) continue;
    for (const auto& sub : it->second.as_array()) collect_property_names(sub, out, depth + 1);
  }
}

}  // namespace

void validate(const Json& value, const Json& schema, const std::string& path) {
  Validator(nullptr).check(value, schema, path);
}

std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path) {
  std::vector<ValidationError> errors;
  Validator(&errors).check(value, schema, path);
  return errors;
}

void apply_defaults(Json& value, const Json& schema) {
  if (!schema.is_object()) return;
  const auto& sch = schema.as_object();

  if (value.is_object()) {
    auto it_props = sch.find("properties");
    if (it_props != sch.end() && it_props->second.is_object()) {
      for (const auto& kv : it_props->second.as_object()) {
        const Json& prop_schema = kv.second;
        if (!prop_schema.is_object()) continue;

        auto& obj = value.as_object();
        if (!obj.contains(kv.first)) {
          auto it_def = prop_schema.as_object().find("default");
          if (it_def != prop_schema.as_object().end()) obj[kv.first] = it_def->second;
        }
        auto it = obj.find(kv.first);
        if (it != obj.end()) apply_defaults(it->second, prop_schema);
      }
    }
  }

  if (value.is_array()) {
    auto it_items = sch.find("items");
    if (it_items != sch.end() && it_items->second.is_object()) {
      for (auto& elem : value.as_array()) apply_defaults(elem, it_items->second);
    }
  }
}

std::vector<std::string> schema_property_names(const Json& schema) {
  std::vector<std::string> names;
  collect_property_names(schema, names, 0);
  return names;
}

SchemaValidation JsonSchemaValidator::validate(const Json& value, const Json& schema) const {
  SchemaValidation result;
  result.data = value;
  if (fill_defaults_) apply_defaults(result.data, schema);
  result.issues = validate_all(result.data, schema, "$");
  result.success = result.issues.empty();
  return result;
}

const SchemaValidator& default_schema_validator() {
  static const JsonSchemaValidator validator;
  return validator;
}

}  // namespace completion_repair
