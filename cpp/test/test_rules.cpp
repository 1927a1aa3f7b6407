#include "completion_repair.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace completion_repair;

static bool has_diagnostic(const SanitizerResult& r, const std::string& needle) {
  for (const auto& d : r.diagnostics) {
    if (d.find(needle) != std::string::npos) return true;
  }
  return false;
}

static void test_quote_unquoted_property_name() {
  SanitizerConfig config;
  auto r = fix_property_names("{name: \"x\", \"b\": 1}", config);
  assert(r.changed);
  assert(r.content == "{\"name\": \"x\", \"b\": 1}");
  assert(has_diagnostic(r, "Quoted unquoted property name 'name'"));

  // Literals in value position are left alone.
  auto literal = fix_property_names("{\"a\": true}", config);
  assert(!literal.changed);
}

static void test_truncated_property_name() {
  SanitizerConfig config;
  auto r = fix_property_names("{\"a\": 1, nam\": \"x\"}", config);
  assert(r.content == "{\"a\": 1, \"name\": \"x\"}");
  assert(has_diagnostic(r, "'nam' -> 'name'"));

  config.property_name_mappings["cla"] = "className";
  auto mapped = fix_property_names("{\"a\": 1, cla\": \"Foo\"}", config);
  assert(mapped.content == "{\"a\": 1, \"className\": \"Foo\"}");
}

static void test_trailing_underscore_property_name() {
  SanitizerConfig config;
  auto r = fix_property_names("{\"name_\": \"x\"}", config);
  assert(r.content == "{\"name\": \"x\"}");

  config.known_properties = {"name_"};
  assert(!fix_property_names("{\"name_\": \"x\"}", config).changed);
}

static void test_property_typo_corrections() {
  SanitizerConfig config;
  assert(!fix_property_names("{\"desciption\": \"x\"}", config).changed);

  config.property_typo_corrections["desciption"] = "description";
  auto r = fix_property_names("{\"desciption\": \"x\"}", config);
  assert(r.content == "{\"description\": \"x\"}");
}

static void test_remove_llm_metadata_properties() {
  SanitizerConfig config;
  auto r = remove_llm_metadata_properties("{\"a\":1, \"extra_thoughts\": \"x\", \"b\":2}", config);
  assert(r.changed);
  assert(r.content == "{\"a\":1, \"b\":2}");
  assert(has_diagnostic(r, "extra_thoughts"));

  // The same name inside a string value is data.
  auto in_string = remove_llm_metadata_properties("{\"note\": \"{\\\"extra_x\\\": 1}\"}", config);
  assert(!in_string.changed);

  // A declared property is never metadata.
  config.known_properties = {"extra_info"};
  assert(!remove_llm_metadata_properties("{\"extra_info\": 1}", config).changed);
}

static void test_metadata_prefixes_keep_user_data() {
  SanitizerConfig config;
  assert(!remove_llm_metadata_properties("{\"a\": 1, \"_id\": \"k\", \"__typename\": \"T\", \"b\": 2}", config).changed);
  assert(!remove_llm_metadata_properties("{\"ai_model\": \"gpt\", \"llm_notes\": \"keep\"}", config).changed);

  auto r = remove_llm_metadata_properties("{\"a\": 1, \"_llm_trace\": [1], \"_ai_score\": 0.5, \"b\": 2}", config);
  assert(r.content == "{\"a\": 1, \"b\": 2}");
  assert(has_diagnostic(r, "'_llm_trace'"));
  assert(has_diagnostic(r, "'_ai_score'"));
}

static void test_extra_attribute_removed() {
  SanitizerConfig config;
  auto r = remove_llm_metadata_properties("{\"x\": [\"a\", \"b\"] extra_text=\"  \"c\": 1}", config);
  assert(r.content == "{\"x\": [\"a\", \"b\"] \"c\": 1}");
  assert(has_diagnostic(r, "Removed extra_text= attribute"));

  auto line = remove_llm_metadata_properties("{\n  \"a\": 1,\n  extra_text=\"note\"\n  \"b\": 2\n}", config);
  assert(line.changed);
  assert(line.content.find("extra_text") == std::string::npos);
  assert(try_parse_json(line.content).value);
}

static void test_stray_commentary_line() {
  SanitizerConfig config;
  const std::string in = "{\n  \"a\": 1,\n  Let me continue with the next field.\n  \"b\": 2\n}";
  auto r = remove_stray_commentary(in, config);
  assert(r.changed);
  assert(r.content == "{\n  \"a\": 1,\n  \"b\": 2\n}");
  assert(try_parse_json(r.content).value);
}

static void test_continuation_marker() {
  SanitizerConfig config;
  auto r = remove_stray_commentary("{\"a\": [1, 2] (to be continued)}", config);
  assert(r.changed);
  assert(r.content == "{\"a\": [1, 2]}");
}

static void test_separator_rules() {
  SanitizerConfig config;
  auto r = fix_separators("{\"a\": undefined, \"b\": NaN}", config);
  assert(r.content == "{\"a\": null, \"b\": null}");

  auto bare = fix_separators("{\"status\": active}", config);
  assert(bare.content == "{\"status\": \"active\"}");

  auto literal = fix_separators("{\"ok\": true, \"v\": null}", config);
  assert(!literal.changed);

  assert(fix_separators("{\"status\": active\"}", config).content == "{\"status\": \"active\"}");
  assert(fix_separators("[\"alpha\", beta\"]", config).content == "[\"alpha\", \"beta\"]");
}

static void test_assignment_operators() {
  SanitizerConfig config;
  auto r = fix_separators("{\"name\" := \"x\", \"b\": 1}", config);
  assert(r.content == "{\"name\": \"x\", \"b\": 1}");
  assert(has_diagnostic(r, "assignment"));

  assert(fix_separators("{\"n\":- \"y\"}", config).content == "{\"n\": \"y\"}");
  // A negative number keeps its sign.
  assert(!fix_separators("{\"n\":-5}", config).changed);
}

static void test_concatenation_chains() {
  SanitizerConfig config;
  auto leading = fix_separators("{\"path\": BASE_PATH + \"/file.ts\", \"b\": 1}", config);
  assert(leading.content == "{\"path\": \"/file.ts\", \"b\": 1}");

  auto mixed = fix_separators("{\"a\": \"x\" + \"y\" + \"z\", \"b\": PREFIX + SUFFIX}", config);
  assert(mixed.content == "{\"a\": \"xyz\", \"b\": \"\"}");
  assert(has_diagnostic(mixed, "Merged 3 concatenated string literals"));

  auto trailing = fix_separators("{\"name\": \"MyClass\" + SUFFIX}", config);
  assert(trailing.content == "{\"name\": \"MyClass\"}");

  // A plus sign inside a string value is data.
  assert(!fix_separators("{\"note\": \"a + b\", \"x\": \"p + q\"}", config).changed);
}

static void test_apply_rule_respects_string_context() {
  SanitizerConfig config;
  ReplacementRule rule{
      "fooToBar",
      regex_pattern("foo"),
      [](const RuleMatch&, const RuleContext&) -> std::optional<RuleEdit> {
        return RuleEdit{"bar", "replaced", std::nullopt};
      },
      true,
  };
  const std::string in = "{\"foo\": 1, \"x\": \"foo\"}";
  assert(!apply_rule(in, rule, config).changed);

  rule.skip_in_string = false;
  auto r = apply_rule(in, rule, config);
  assert(r.content == "{\"bar\": 1, \"x\": \"bar\"}");
  assert(r.diagnostics.size() == 2);
}

static void test_custom_rules_from_config() {
  SanitizerConfig config = sanitizer_config_from_json(parse_json(
      R"({"customReplacementRules": [{"name": "singleQuotes", "pattern": "'([a-z]+)'", "replacement": "\"$1\""}]})"));
  assert(config.custom_rules.size() == 1);
  auto r = apply_custom_rules("{'key': 1}", config);
  assert(r.content == "{\"key\": 1}");
  assert(has_diagnostic(r, "singleQuotes"));

  assert(!apply_custom_rules("{'key': 1}", SanitizerConfig{}).changed);
}

static void test_growing_custom_rule_runs_once() {
  SanitizerConfig config = sanitizer_config_from_json(parse_json(
      R"({"customReplacementRules": [{"name": "dup", "pattern": "a", "replacement": "aa", "skipInString": false}]})"));
  auto r = apply_custom_rules("[\"a\"]", config);
  assert(r.content == "[\"aa\"]");
  assert(r.diagnostics.size() == 1);

  PipelineRun run = sanitize_completion("[\"a\"]", config);
  assert(run.content == "[\"aa\"]");
}

static void test_sanitizer_config_errors() {
  auto expect_config_error = [](const char* doc, const char* needle) {
    try {
      (void)sanitizer_config_from_json(parse_json(doc));
      assert(false && "expected ConfigurationError");
    } catch (const ConfigurationError& e) {
      assert(std::string(e.what()).find(needle) != std::string::npos);
    }
  };
  expect_config_error(R"({"knownProperties": [1]})", "knownProperties");
  expect_config_error(R"({"contextLookback": -1})", "contextLookback");
  expect_config_error(R"({"repetitionsToKeep": 12})", "repetitionsToKeep");
  expect_config_error(R"({"customReplacementRules": [{"name": "x", "pattern": "([", "replacement": ""}]})",
                      "not a valid regex");
  expect_config_error("[]", "JSON object");
  expect_config_error(R"({"maxNestingDepth": 1e30})", "maxNestingDepth");

  SanitizerConfig c = sanitizer_config_from_json(
      parse_json(R"({"minRepetitionsToTruncate": 5, "repetitionsToKeep": 2, "normalizer": {"coerceNumbers": false}})"));
  assert(c.min_repetitions_to_truncate == 5);
  assert(c.repetitions_to_keep == 2);
  assert(!c.normalizer.coerce_numbers);
  assert(c.normalizer.convert_nulls);
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
    run("quote_unquoted_property_name", test_quote_unquoted_property_name);
    run("truncated_property_name", test_truncated_property_name);
    run("trailing_underscore_property_name", test_trailing_underscore_property_name);
    run("property_typo_corrections", test_property_typo_corrections);
    run("remove_llm_metadata_properties", test_remove_llm_metadata_properties);
    run("metadata_prefixes_keep_user_data", test_metadata_prefixes_keep_user_data);
    run("extra_attribute_removed", test_extra_attribute_removed);
    run("stray_commentary_line", test_stray_commentary_line);
    run("continuation_marker", test_continuation_marker);
    run("separator_rules", test_separator_rules);
    run("assignment_operators", test_assignment_operators);
    run("concatenation_chains", test_concatenation_chains);
    run("apply_rule_respects_string_context", test_apply_rule_respects_string_context);
    run("custom_rules_from_config", test_custom_rules_from_config);
    run("growing_custom_rule_runs_once", test_growing_custom_rule_runs_once);
    run("sanitizer_config_errors", test_sanitizer_config_errors);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
