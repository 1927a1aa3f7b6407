#include "completion_repair.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace completion_repair;

namespace {

class CountingErrorLogger : public ErrorLogger {
 public:
  void record_parse_failure(const ErrorDetail& error, const std::string& raw, const LlmContext&) noexcept override {
    ++calls;
    last_kind = error.kind;
    last_raw = raw;
  }

  size_t calls{0};
  ErrorDetail::Kind last_kind{ErrorDetail::Kind::Parse};
  std::string last_raw;
};

class RejectingValidator : public SchemaValidator {
 public:
  SchemaValidation validate(const Json& value, const Json&) const override {
    SchemaValidation r;
    r.data = value;
    r.issues.emplace_back("rejected", "$");
    return r;
  }
};

Json person_schema() {
  return parse_json(R"({
    "type": "object",
    "properties": {"name": {"type": "string"}, "age": {"type": "number"}},
    "required": ["name", "age"]
  })");
}

ResponseBase make_base(const std::string& resource) {
  ResponseBase base;
  base.request = "describe " + resource;
  base.context.resource = resource;
  base.model_key = "test-model";
  return base;
}

CompletionOptions json_options() {
  CompletionOptions options;
  options.output_format = OutputFormat::Json;
  options.json_schema = person_schema();
  return options;
}

bool contains(const std::string& haystack, const std::string& needle) { return haystack.find(needle) != std::string::npos; }

}  // namespace

static void test_text_output() {
  std::ostringstream captured;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
  auto test_logger = std::make_shared<spdlog::logger>("completion_repair_test", sink);
  test_logger->set_level(spdlog::level::debug);
  set_logger(test_logger);

  ResponseClassifier classifier(std::make_shared<CountingErrorLogger>());
  CompletionOptions options;
  options.output_format = OutputFormat::Text;

  auto empty = classifier.classify(make_base("notes"), LlmPurpose::Completions, Json("  \n"), options);
  assert(empty.status == ResponseStatus::Invalid);
  assert(empty.error && contains(*empty.error, "empty"));
  assert(contains(captured.str(), "empty TEXT response"));
  assert(contains(captured.str(), "FORMAT_CHECKED -> INVALID"));

  auto hello = classifier.classify(make_base("notes"), LlmPurpose::Completions, Json("hello"), options);
  assert(hello.status == ResponseStatus::Completed);
  assert(hello.generated && hello.generated->as_string() == "hello");
  assert(hello.model_key == "test-model");

  auto number = classifier.classify(make_base("notes"), LlmPurpose::Completions, Json(5), options);
  assert(number.status == ResponseStatus::Invalid);
  assert(*number.error == "Expected string response for TEXT output format");

  set_logger(nullptr);
}

static void test_configuration_errors() {
  ResponseClassifier classifier(std::make_shared<CountingErrorLogger>());

  CompletionOptions json_without_schema;
  json_without_schema.output_format = OutputFormat::Json;
  try {
    (void)classifier.classify(make_base("r"), LlmPurpose::Completions, Json("{}"), json_without_schema);
    assert(false && "expected ConfigurationError");
  } catch (const ConfigurationError& e) {
    assert(contains(e.what(), "no jsonSchema was provided"));
  }

  CompletionOptions text_with_schema;
  text_with_schema.output_format = OutputFormat::Text;
  text_with_schema.json_schema = person_schema();
  try {
    (void)classifier.classify(make_base("r"), LlmPurpose::Completions, Json("hi"), text_with_schema);
    assert(false && "expected ConfigurationError");
  } catch (const ConfigurationError& e) {
    assert(contains(e.what(), "outputFormat is TEXT"));
  }
}

static void test_embeddings_pass_through() {
  ResponseClassifier classifier(std::make_shared<CountingErrorLogger>());
  Json vector = JsonArray{Json(0.25), Json(-1.0)};
  auto r = classifier.classify(make_base("embed"), LlmPurpose::Embeddings, vector, CompletionOptions{});
  assert(r.status == ResponseStatus::Completed);
  assert(json_equals(*r.generated, vector));
}

static void test_parse_failure_is_logged_once() {
  auto errors = std::make_shared<CountingErrorLogger>();
  ResponseClassifier classifier(errors);

  auto r = classifier.classify(make_base("people"), LlmPurpose::Completions, Json("I cannot help with that."),
                               json_options());
  assert(r.status == ResponseStatus::Invalid);
  assert(*r.error ==
         "LLM output could not be parsed: LLM response for resource 'people' contains no JSON structure and appears "
         "to be plain text");
  assert(errors->calls == 1);
  assert(errors->last_raw == "I cannot help with that.");

  auto broken = classifier.classify(make_base("people"), LlmPurpose::Completions, Json("{\"name\": \"Ada\" \"age\"::: }}]"),
                                    json_options());
  assert(broken.status == ResponseStatus::Invalid);
  assert(errors->calls == 2);

  auto not_string = classifier.classify(make_base("people"), LlmPurpose::Completions, Json(JsonObject{{"name", "Ada"}}),
                                        json_options());
  assert(not_string.status == ResponseStatus::Invalid);
  assert(contains(*not_string.error, "is not a string"));
  assert(errors->calls == 3);
  assert(errors->last_raw == "{\"name\":\"Ada\"}");
}

static void test_repaired_completion() {
  auto errors = std::make_shared<CountingErrorLogger>();
  ResponseClassifier classifier(errors);
  auto r = classifier.classify(make_base("people"), LlmPurpose::Completions,
                               Json("Sure!\n```json\n{\"name\": \"Ada\", \"age\": \"36\",}\n```"), json_options());
  assert(r.status == ResponseStatus::Completed);
  assert(r.generated->as_object().at("age").as_number() == 36);
  assert(r.pipeline_steps.size() == 12);
  bool trailing = false;
  for (const auto& s : r.repairs) {
    if (s == "removeTrailingCommas") trailing = true;
  }
  assert(trailing);
  assert(r.repairs.back() == "Converted 'age' value \"36\" to number");
  assert(errors->calls == 0);

  Json doc = to_json(r);
  const auto& obj = doc.as_object();
  assert(obj.at("status").as_string() == "COMPLETED");
  assert(obj.at("context").as_object().at("resource").as_string() == "people");
  assert(obj.at("pipelineSteps").as_array().size() == 12);
  assert(!obj.contains("error"));
}

static void test_injected_validator() {
  auto errors = std::make_shared<CountingErrorLogger>();
  ResponseClassifier classifier(errors, std::make_shared<RejectingValidator>());
  auto r = classifier.classify(make_base("people"), LlmPurpose::Completions, Json("{\"name\": \"Ada\", \"age\": 36}"),
                               json_options());
  assert(r.status == ResponseStatus::Invalid);
  assert(contains(*r.error, "still failed schema validation"));
  assert(contains(*r.error, "($: rejected)"));
  assert(errors->calls == 1);
  assert(errors->last_kind == ErrorDetail::Kind::Validation);
}

static void test_parse_and_validate_messages() {
  LlmContext context;
  context.resource = "r";
  auto empty = parse_and_validate("", person_schema(), context);
  assert(!empty.success);
  assert(empty.error->message == "LLM response for resource 'r' is just an empty string");

  auto unicode = parse_and_validate("{\"name\": \"\xC3(\"}", person_schema(), context);
  assert(unicode.error->message == "LLM response for resource 'r' contains malformed Unicode");

  auto text = parse_and_validate("just words", person_schema(), context);
  assert(text.error->message == "LLM response for resource 'r' contains no JSON structure and appears to be plain text");

  auto primitive = parse_and_validate("[1] 2", Json(), context);
  assert(primitive.success);

  auto unparseable = parse_and_validate("{\"a\" \"b\" \"c\"}", Json(), context);
  assert(!unparseable.success);
  assert(unparseable.error->kind == ErrorDetail::Kind::Parse);
  assert(contains(unparseable.error->message, "cannot be parsed to JSON after all sanitization attempts"));
  assert(contains(unparseable.error->cause, "JSON parse error at offset"));
  assert(unparseable.error->steps.size() == 12);
}

static void test_file_error_logger() {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "completion_repair_file_error_logger_test";
  fs::remove_all(dir);

  auto file_logger = std::make_shared<FileErrorLogger>(dir.string());
  ResponseClassifier classifier(file_logger);
  auto r = classifier.classify(make_base("people/list"), LlmPurpose::Completions, Json("no json here"), json_options());
  assert(r.status == ResponseStatus::Invalid);
  assert(file_logger->recorded() == 1);

  size_t files = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    ++files;
    assert(entry.path().filename().string().rfind("people_list-", 0) == 0);
    std::ifstream in(entry.path());
    std::stringstream body;
    body << in.rdbuf();
    Json doc = parse_json(body.str());
    assert(doc.as_object().at("kind").as_string() == "parse");
    assert(doc.as_object().at("raw").as_string() == "no json here");
  }
  assert(files == 1);
  fs::remove_all(dir);
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
    run("text_output", test_text_output);
    run("configuration_errors", test_configuration_errors);
    run("embeddings_pass_through", test_embeddings_pass_through);
    run("parse_failure_is_logged_once", test_parse_failure_is_logged_once);
    run("repaired_completion", test_repaired_completion);
    run("injected_validator", test_injected_validator);
    run("parse_and_validate_messages", test_parse_and_validate_messages);
    run("file_error_logger", test_file_error_logger);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
