#include "completion_repair.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace completion_repair;

static Json person_schema() {
  return parse_json(R"({
    "type": "object",
    "properties": {"name": {"type": "string"}, "age": {"type": "number"}},
    "required": ["name", "age"]
  })");
}

static void test_unwrap_schema_envelope() {
  Json value = parse_json(R"({"type": "object", "properties": {"name": "Ada", "age": 36}})");
  std::vector<std::string> repairs;
  size_t n = unwrap_schema_envelopes(value, person_schema(), SanitizerConfig{}, &repairs);
  assert(n == 1);
  assert(json_equals(value, parse_json(R"({"name": "Ada", "age": 36})")));
  assert(repairs.size() == 1);
  assert(repairs[0] == "Unwrapped JSON schema envelope around the response data");

  // Left alone when the schema itself asks for "type" and "properties".
  Json declared = parse_json(R"({"type": "object", "properties": {"type": {"type": "string"}, "properties": {"type": "object"}}})");
  Json data = parse_json(R"({"type": "object", "properties": {"x": 1}})");
  assert(unwrap_schema_envelopes(data, declared, SanitizerConfig{}, nullptr) == 0);
  assert(data.as_object().contains("properties"));
}

static void test_extract_field_definitions() {
  Json value = parse_json(R"({"name": {"type": "string", "description": "Ada"}, "age": 36})");
  std::vector<std::string> repairs;
  assert(unwrap_schema_envelopes(value, person_schema(), SanitizerConfig{}, &repairs) == 1);
  assert(value.as_object().at("name").as_string() == "Ada");
  assert(repairs.back() == "Extracted 1 value(s) from schema field definitions");
}

static void test_coerce_nulls_to_absent() {
  Json schema = parse_json(R"({
    "type": "object",
    "properties": {
      "name": {"type": "string"},
      "nickname": {"type": "string"},
      "note": {"type": ["string", "null"]}
    },
    "required": ["name"]
  })");
  Json value = parse_json(R"({"name": null, "nickname": null, "note": null, "other": null})");
  std::vector<std::string> repairs;
  assert(coerce_nulls_to_absent(value, schema, SanitizerConfig{}, &repairs) == 1);
  const auto& obj = value.as_object();
  assert(obj.contains("name"));
  assert(!obj.contains("nickname"));
  assert(obj.contains("note"));
  assert(obj.contains("other"));
  assert(repairs[0] == "Removed null value for optional property 'nickname'");
}

static void test_fix_property_typos() {
  Json value = parse_json(R"({"name_": "Ada", "descripton": "x", "misc_": 1})");
  SanitizerConfig config;
  config.property_typo_corrections["descripton"] = "description";
  std::vector<std::string> repairs;
  assert(fix_property_typos(value, person_schema(), config, &repairs) == 2);
  const auto& obj = value.as_object();
  assert(obj.begin()->first == "name");
  assert(obj.contains("description"));
  // Not declared anywhere, so the underscore stays.
  assert(obj.contains("misc_"));
  assert(repairs[0] == "Renamed property 'name_' to 'name'");
}

static void test_coerce_scalars_to_sequences() {
  Json schema = parse_json(R"({
    "type": "object",
    "properties": {
      "tags": {"type": "array", "items": {"type": "string"}},
      "either": {"type": ["string", "array"]}
    }
  })");
  Json value = parse_json(R"({"tags": "x", "either": "y"})");
  assert(coerce_scalars_to_sequences(value, schema, SanitizerConfig{}, nullptr) == 1);
  assert(value.as_object().at("tags").is_array());
  assert(value.as_object().at("tags").as_array()[0].as_string() == "x");
  assert(value.as_object().at("either").is_string());

  // Without a schema the configured names decide.
  SanitizerConfig config;
  config.array_property_names = {"Parameters"};
  Json loose = parse_json(R"({"parameters": {"name": "id"}, "other": "z"})");
  assert(coerce_scalars_to_sequences(loose, Json(), config, nullptr) == 1);
  assert(loose.as_object().at("parameters").is_array());
  assert(loose.as_object().at("other").is_string());
}

static void test_coerce_numeric_strings() {
  Json schema = parse_json(R"({
    "type": "object",
    "properties": {
      "count": {"type": "integer"},
      "hours": {"type": "number"},
      "items": {"type": "number"},
      "unknown": {"type": "number"},
      "label": {"type": "string"},
      "rows": {"type": "array", "items": {"type": "object", "properties": {"n": {"type": "number"}}}}
    }
  })");
  Json value = parse_json(R"({
    "count": "42", "hours": "~ 3.5 hours", "items": "about 12 items", "unknown": "n/a", "label": "7",
    "rows": [{"n": "1"}, {"n": "2"}]
  })");
  std::vector<std::string> repairs;
  assert(coerce_numeric_strings(value, schema, SanitizerConfig{}, &repairs) == 5);
  const auto& obj = value.as_object();
  assert(obj.at("count").as_number() == 42);
  assert(obj.at("hours").as_number() == 3.5);
  assert(obj.at("items").as_number() == 12);
  assert(obj.at("unknown").as_string() == "n/a");
  assert(obj.at("label").as_string() == "7");
  assert(obj.at("rows").as_array()[1].as_object().at("n").as_number() == 2);
  assert(repairs[0] == "Converted 'count' value \"42\" to number");
}

static void test_normalize_parsed_respects_options() {
  Json value = parse_json(R"({"name": "Ada", "age": "36"})");
  NormalizeResult all = normalize_parsed(value, person_schema());
  assert(all.value.as_object().at("age").as_number() == 36);
  assert(all.repairs.size() == 1);

  SanitizerConfig config;
  config.normalizer.coerce_numbers = false;
  NormalizeResult none = normalize_parsed(value, person_schema(), config);
  assert(none.value.as_object().at("age").is_string());
  assert(none.repairs.empty());
}

static void test_parse_and_validate_normalizes_after_failure() {
  LlmContext context;
  context.resource = "people";
  ValidationResult r = parse_and_validate("{\"name\": \"Ada\", \"age\": \"36\"}", person_schema(), context);
  assert(r.success);
  assert(r.data.as_object().at("age").as_number() == 36);
  assert(r.steps.empty());
  assert(r.repairs.size() == 1);
  assert(r.repairs[0] == "Converted 'age' value \"36\" to number");

  // Already valid data is never transformed.
  ValidationResult valid = parse_and_validate("{\"name\": \"Ada\", \"age\": 36}", person_schema(), context);
  assert(valid.success);
  assert(valid.repairs.empty());
}

static void test_parse_and_validate_reports_schema_failure() {
  LlmContext context;
  context.resource = "people";
  ValidationResult r = parse_and_validate("{\"name\": 5}", person_schema(), context);
  assert(!r.success);
  assert(r.error);
  assert(r.error->kind == ErrorDetail::Kind::Validation);
  assert(r.error->message ==
         "LLM response for resource 'people' parsed successfully and applied transforms but still failed schema validation");
  bool age = false;
  for (const auto& issue : r.error->issues) {
    if (issue.path == "$.age") age = true;
  }
  assert(age);
  assert(r.error->cause.find("$.name") != std::string::npos);
}

int main() {
  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("unwrap_schema_envelope", test_unwrap_schema_envelope);
    run("extract_field_definitions", test_extract_field_definitions);
    run("coerce_nulls_to_absent", test_coerce_nulls_to_absent);
    run("fix_property_typos", test_fix_property_typos);
    run("coerce_scalars_to_sequences", test_coerce_scalars_to_sequences);
    run("coerce_numeric_strings", test_coerce_numeric_strings);
    run("normalize_parsed_respects_options", test_normalize_parsed_respects_options);
    run("parse_and_validate_normalizes_after_failure", test_parse_and_validate_normalizes_after_failure);
    run("parse_and_validate_reports_schema_failure", test_parse_and_validate_reports_schema_failure);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
