#include "completion_repair.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace completion_repair;

static std::string repeat(const std::string& unit, size_t n) {
  std::string out;
  for (size_t i = 0; i < n; ++i) out += unit;
  return out;
}

static void test_stage_order() {
  PipelineRun run = sanitize_completion("{\"a\": 1}");
  const char* expected[] = {"extractJsonSpan",      "normalizeCharacters", "stripComments",
                            "removeLlmMetadata",    "removeStrayCommentary", "fixPropertyNames",
                            "fixSeparators",        "insertMissingCommas", "removeTrailingCommas",
                            "closeTruncatedStructures", "fixStringCorruption", "customRules"};
  assert(run.steps.size() == 12);
  for (size_t i = 0; i < run.steps.size(); ++i) assert(run.steps[i].sanitizer == expected[i]);
  assert(!run.repaired);
  assert(run.content == "{\"a\": 1}");
}

static void test_code_fence_extraction() {
  PipelineRun run = sanitize_completion("Here is the result:\n```json\n{\"a\": 1}\n```\nThanks!");
  assert(run.repaired);
  assert(run.content == "{\"a\": 1}");
  assert(run.steps[0].changed);
  assert(!run.diagnostics.empty());
  assert(run.diagnostics[0].find("extractJsonSpan: ") == 0);
}

static void test_truncated_object_closes() {
  PipelineRun run = sanitize_completion("{\"name\": \"Ada\", \"tags\": [\"x\", \"y\"");
  auto parsed = try_parse_json(run.content);
  assert(parsed.value);
  assert(parsed.value->as_object().at("tags").as_array().size() == 2);

  PipelineRun literal = sanitize_completion("{\"ok\": tru");
  assert(literal.content == "{\"ok\": true}");
}

static void test_sanitize_is_idempotent() {
  const char* inputs[] = {
      "{\"name\": \"Ada\", \"tags\": [\"x\", \"y\"",
      "```json\n{\"a\": [1, 2,], }\n```",
      "{name: 'Ada', // who\n \"age\": 36,}",
      "{\"a\":1, \"extra_thoughts\": \"x\", \"b\":2,}",
  };
  for (const char* in : inputs) {
    PipelineRun once = sanitize_completion(in);
    PipelineRun twice = sanitize_completion(once.content);
    assert(twice.content == once.content);
    assert(!twice.repaired);
    assert(try_parse_json(once.content).value);
  }
}

static void test_adversarial_input_terminates() {
  PipelineRun run = sanitize_completion(std::string(100000, '{'));
  assert(!run.content.empty());

  LlmContext context;
  context.resource = "adversarial";
  ValidationResult r = parse_and_validate(std::string(100000, '{'), Json(), context);
  assert(!r.success);
  assert(r.error && r.error->kind == ErrorDetail::Kind::Parse);
}

static void test_repeated_run_in_string_terminates() {
  LlmContext context;
  context.resource = "adversarial";
  ValidationResult r = parse_and_validate("{\"a\": \"" + std::string(100000, '}'), Json(), context);
  assert(r.success);
  assert(r.data.as_object().at("a").as_string() == "}}}...");
}

static void test_short_repetition_unchanged() {
  SanitizerConfig config;
  const std::string in = "{\"a\": \"x" + repeat("}", 6) + "\"}";
  assert(!fix_string_corruption(in, config).changed);

  const std::string spaced = "{\"note\": \"}} }} }}\"}";
  PipelineRun run = sanitize_completion(spaced);
  assert(!run.repaired);
  assert(run.content == spaced);
}

static void test_spaced_brace_run_after_closed_string() {
  LlmContext context;
  context.resource = "repetition";
  ValidationResult r =
      parse_and_validate("{\"name\": \"x\", \"purpose\": \"do thing\" } } } } } } } } } } } }", Json(), context);
  assert(r.success);
  const auto& obj = r.data.as_object();
  assert(obj.size() == 2);
  assert(obj.at("name").as_string() == "x");
  assert(obj.at("purpose").as_string() == "do thing");
}

static void test_spaced_brace_run_in_unterminated_string() {
  LlmContext context;
  context.resource = "repetition";
  ValidationResult r =
      parse_and_validate("{\"name\": \"x\", \"purpose\": \"do thing } } } } } } } } } } } }", Json(), context);
  assert(r.success);
  assert(r.data.as_object().at("name").as_string() == "x");
  assert(r.data.as_object().at("purpose").as_string() == "do thing } } }...");
}

static void test_runaway_repetition_in_unterminated_string() {
  LlmContext context;
  context.resource = "repetition";
  ValidationResult r = parse_and_validate("{\"description\": \"Done" + repeat("}", 12), Json(), context);
  assert(r.success);
  assert(r.data.as_object().at("description").as_string() == "Done}}}...");
  bool closed = false;
  bool truncated = false;
  for (const auto& s : r.steps) {
    if (s.sanitizer == "closeTruncatedStructures" && s.changed) closed = true;
    if (s.sanitizer == "fixStringCorruption" && s.changed) truncated = true;
  }
  assert(closed && truncated);
}

static void test_embedded_json_in_string() {
  SanitizerConfig config;
  const std::string in = R"({"description": "Handles requests\",\n  \"name\": \"other\"", "type": "svc"})";
  auto r = fix_string_corruption(in, config);
  assert(r.changed);
  assert(r.content == "{\"description\": \"Handles requests\", \"type\": \"svc\"}");
}

static void test_metadata_removed_through_parse() {
  LlmContext context;
  context.resource = "metadata";
  ValidationResult r = parse_and_validate("{\"a\":1, \"extra_thoughts\": \"x\", \"b\":2,}", Json(), context);
  assert(r.success);
  const auto& obj = r.data.as_object();
  assert(obj.size() == 2);
  assert(!obj.contains("extra_thoughts"));
  bool metadata = false;
  for (const auto& rep : r.repairs) {
    if (rep == "removeLlmMetadata") metadata = true;
  }
  assert(metadata);
}

static void test_unquoted_metadata_object_removed() {
  LlmContext context;
  context.resource = "metadata";
  ValidationResult r = parse_and_validate("{\"a\":1, extra_thoughts: {\"x\": \"y\"}, \"b\":2}", Json(), context);
  assert(r.success);
  const auto& obj = r.data.as_object();
  assert(obj.size() == 2);
  assert(obj.at("a").as_number() == 1);
  assert(obj.at("b").as_number() == 2);
}

static void test_underscore_keys_survive() {
  PipelineRun run = sanitize_completion("{\"a\": 1, \"_id\": \"k\", \"b\": 2,}");
  auto parsed = try_parse_json(run.content);
  assert(parsed.value);
  assert(parsed.value->as_object().size() == 3);
  assert(parsed.value->as_object().at("_id").as_string() == "k");
}

static void test_attribute_and_assignment_repairs() {
  LlmContext context;
  context.resource = "repairs";
  ValidationResult attr = parse_and_validate("{\"x\": [\"a\", \"b\"] extra_text=\"  \"c\": 1}", Json(), context);
  assert(attr.success);
  assert(attr.data.as_object().size() == 2);
  assert(attr.data.as_object().at("c").as_number() == 1);

  ValidationResult assign = parse_and_validate("{\"name\" := \"x\", \"b\": 1}", Json(), context);
  assert(assign.success);
  assert(assign.data.as_object().at("name").as_string() == "x");

  ValidationResult chain = parse_and_validate("{\"path\": BASE_PATH + \"/file.ts\", \"b\": 1}", Json(), context);
  assert(chain.success);
  assert(chain.data.as_object().at("path").as_string() == "/file.ts");
}

static void test_diagnostics_cap() {
  SanitizerConfig config;
  config.max_diagnostics_per_stage = 2;
  PipelineRun run = sanitize_completion("{a: 1, b: 2, c: 3, d: 4, e: 5}", config);
  assert(try_parse_json(run.content).value);
  for (const auto& s : run.steps) {
    if (s.sanitizer != "fixPropertyNames") continue;
    assert(s.changed);
    assert(s.diagnostics.size() == 3);
    assert(s.diagnostics.back() == "... and 3 more");
  }
}

static void test_custom_stage_list() {
  SanitizerPipeline pipeline({{"removeTrailingCommas", remove_trailing_commas}});
  PipelineRun run = pipeline.run("[1, 2,]", SanitizerConfig{});
  assert(run.steps.size() == 1);
  assert(run.content == "[1, 2]");
  assert(run.diagnostics.size() == 1);
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
    run("stage_order", test_stage_order);
    run("code_fence_extraction", test_code_fence_extraction);
    run("truncated_object_closes", test_truncated_object_closes);
    run("sanitize_is_idempotent", test_sanitize_is_idempotent);
    run("adversarial_input_terminates", test_adversarial_input_terminates);
    run("repeated_run_in_string_terminates", test_repeated_run_in_string_terminates);
    run("short_repetition_unchanged", test_short_repetition_unchanged);
    run("runaway_repetition_in_unterminated_string", test_runaway_repetition_in_unterminated_string);
    run("spaced_brace_run_after_closed_string", test_spaced_brace_run_after_closed_string);
    run("spaced_brace_run_in_unterminated_string", test_spaced_brace_run_in_unterminated_string);
    run("embedded_json_in_string", test_embedded_json_in_string);
    run("metadata_removed_through_parse", test_metadata_removed_through_parse);
    run("unquoted_metadata_object_removed", test_unquoted_metadata_object_removed);
    run("underscore_keys_survive", test_underscore_keys_survive);
    run("attribute_and_assignment_repairs", test_attribute_and_assignment_repairs);
    run("diagnostics_cap", test_diagnostics_cap);
    run("custom_stage_list", test_custom_stage_list);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
