#include "completion_repair.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <sstream>

using namespace completion_repair;

static std::string read_all_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

static std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static Json load_json_file(const std::string& path) {
  // Schema and config files must be strict JSON.
  return parse_json(read_file(path));
}

static void usage() {
  std::cerr
      << "completion_repair_cli <sanitize|parse|classify> [--schema <schema.json>] [--input <file>]\n"
      << "    [--config <config.json>] [--format json|text] [--purpose completions|embeddings]\n"
      << "    [--resource <name>] [--error-dir <dir>] [--verbose]\n"
      << "  Reads a raw completion from --input or stdin and prints the result as JSON to stdout.\n";
}

static Json steps_json(const std::vector<PipelineStep>& steps) {
  JsonArray out;
  for (const auto& s : steps) out.push_back(to_json(s));
  return out;
}

static Json strings_json(const std::vector<std::string>& items) {
  JsonArray out;
  for (const auto& s : items) out.push_back(s);
  return out;
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage();
      return 2;
    }

    std::string mode = argv[1];
    std::string schema_path;
    std::string input_path;
    std::string config_path;
    std::string format = "json";
    std::string purpose = "completions";
    std::string resource = "cli";
    std::string error_dir;
    bool verbose = false;

    for (int i = 2; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--schema" && i + 1 < argc) {
        schema_path = argv[++i];
      } else if (a == "--input" && i + 1 < argc) {
        input_path = argv[++i];
      } else if (a == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (a == "--format" && i + 1 < argc) {
        format = argv[++i];
      } else if (a == "--purpose" && i + 1 < argc) {
        purpose = argv[++i];
      } else if (a == "--resource" && i + 1 < argc) {
        resource = argv[++i];
      } else if (a == "--error-dir" && i + 1 < argc) {
        error_dir = argv[++i];
      } else if (a == "--verbose") {
        verbose = true;
      } else {
        usage();
        return 2;
      }
    }
    if ((format != "json" && format != "text") || (purpose != "completions" && purpose != "embeddings")) {
      usage();
      return 2;
    }

    if (auto log = logger()) log->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);
    Json schema;
    bool has_schema = !schema_path.empty();
    if (has_schema) schema = load_json_file(schema_path);
    SanitizerConfig config;
    if (!config_path.empty()) config = sanitizer_config_from_json(load_json_file(config_path));

    LlmContext context;
    context.resource = resource;

    if (mode == "sanitize") {
      PipelineRun run = sanitize_completion(input, config);
      JsonObject o;
      o["content"] = run.content;
      o["repaired"] = run.repaired;
      o["steps"] = steps_json(run.steps);
      o["diagnostics"] = strings_json(run.diagnostics);
      std::cout << dumps_json(Json(o)) << "\n";
      return 0;
    }

    if (mode == "parse") {
      ValidationResult r = parse_and_validate(input, schema, context, config);
      JsonObject o;
      o["success"] = r.success;
      if (r.success) o["data"] = r.data;
      o["repairs"] = strings_json(r.repairs);
      o["steps"] = steps_json(r.steps);
      if (r.error) {
        JsonArray issues;
        for (const auto& issue : r.error->issues) {
          issues.push_back(JsonObject{{"path", issue.path}, {"message", issue.message}, {"kind", issue.kind}});
        }
        o["error"] = r.error->message;
        if (!r.error->cause.empty()) o["cause"] = r.error->cause;
        o["issues"] = std::move(issues);
        o["diagnostics"] = strings_json(r.error->diagnostics);
      }
      std::cout << dumps_json(Json(o)) << "\n";
      return r.success ? 0 : 1;
    }

    if (mode == "classify") {
      std::shared_ptr<ErrorLogger> error_logger;
      if (error_dir.empty()) {
        error_logger = std::make_shared<LogErrorLogger>();
      } else {
        error_logger = std::make_shared<FileErrorLogger>(error_dir);
      }
      ResponseClassifier classifier(error_logger);

      CompletionOptions options;
      options.output_format = format == "text" ? OutputFormat::Text : OutputFormat::Json;
      if (has_schema) options.json_schema = schema;
      options.sanitizer_config = config;

      ResponseBase base;
      base.request = input_path.empty() ? "stdin" : input_path;
      base.context = context;
      base.model_key = "cli";

      FunctionResponse response = classifier.classify(
          base, purpose == "embeddings" ? LlmPurpose::Embeddings : LlmPurpose::Completions, Json(input), options);
      std::cout << dumps_json(to_json(response)) << "\n";
      return response.status == ResponseStatus::Completed ? 0 : 1;
    }

    usage();
    return 2;
  } catch (const ConfigurationError& e) {
    JsonObject o;
    o["error"] = std::string(e.what());
    o["kind"] = "configuration";
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const ValidationError& e) {
    JsonObject o;
    o["error"] = std::string(e.what());
    o["path"] = e.path;
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
