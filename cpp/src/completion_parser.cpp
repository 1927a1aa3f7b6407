#include "internal.hpp"

#include <spdlog/spdlog.h>

namespace completion_repair {

namespace {

std::string resource_message(const LlmContext& context, const std::string& message) {
  return "LLM response for resource '" + context.resource + "' " + message;
}

ValidationResult parse_failure(const LlmContext& context, const std::string& message, std::string cause = "") {
  ValidationResult result;
  ErrorDetail error;
  error.kind = ErrorDetail::Kind::Parse;
  error.message = resource_message(context, message);
  error.cause = std::move(cause);
  result.error = std::move(error);
  return result;
}

// Rejects truncated multi-byte sequences and stray continuation bytes.
bool is_well_formed_utf8(const std::string& s) {
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t extra = 0;
    if (c < 0x80) {
      extra = 0;
    } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
    } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
      extra = 3;
    } else {
      return false;
    }
    if (i + extra >= s.size()) return false;
    for (size_t k = 1; k <= extra; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
    }
    i += extra + 1;
  }
  return true;
}

// Repairs beyond whitespace trimming and fence stripping are worth a log line.
bool has_significant_repairs(const std::vector<PipelineStep>& steps, const std::vector<std::string>& normalizer_repairs) {
  if (!normalizer_repairs.empty()) return true;
  for (const auto& step : steps) {
    if (step.changed && step.sanitizer != "extractJsonSpan") return true;
  }
  return false;
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

std::string summarize_issues(const std::vector<ValidationError>& issues) {
  std::vector<std::string> parts;
  for (size_t i = 0; i < issues.size() && i < 5; ++i) parts.push_back(issues[i].path + ": " + issues[i].message);
  if (issues.size() > 5) parts.push_back("... and " + std::to_string(issues.size() - 5) + " more");
  return join(parts, "; ");
}

}  // namespace

ValidationResult parse_and_validate(const std::string& raw, const Json& schema, const LlmContext& context,
                                    const SanitizerConfig& config, const SchemaValidator& validator) {
  auto log = logger();

  if (raw.empty()) {
    if (log) log->warn("LLM response is just an empty string (resource '{}')", context.resource);
    return parse_failure(context, "is just an empty string");
  }
  if (!is_well_formed_utf8(raw)) {
    if (log) log->warn("LLM response contains malformed Unicode (resource '{}', {} bytes)", context.resource, raw.size());
    return parse_failure(context, "contains malformed Unicode");
  }
  const std::string trimmed = detail::trim_copy(raw);
  if (trimmed.find_first_of("{[") == std::string::npos) {
    if (log) log->warn("LLM response contains no JSON structure (resource '{}', {} bytes)", context.resource, trimmed.size());
    return parse_failure(context, "contains no JSON structure and appears to be plain text");
  }

  SanitizerConfig effective = config;
  if (!schema.is_null()) {
    for (const auto& name : schema_property_names(schema)) {
      if (!detail::contains_name(effective.known_properties, name)) effective.known_properties.push_back(name);
    }
  }

  ValidationResult result;
  std::vector<std::string> diagnostics;
  JsonParseResult parsed = try_parse_json(trimmed);
  if (!parsed.value) {
    PipelineRun run = sanitize_completion(trimmed, effective);
    result.steps = run.steps;
    diagnostics = run.diagnostics;
    for (const auto& step : run.steps) {
      if (step.changed) result.repairs.push_back(step.sanitizer);
    }
    parsed = try_parse_json(run.content);
    if (!parsed.value) {
      std::vector<std::string> applied;
      for (const auto& step : run.steps) {
        if (step.changed) applied.push_back(step.sanitizer);
      }
      if (log) {
        log->warn("Cannot parse JSON after all sanitization attempts (resource '{}'). {}", context.resource,
                  applied.empty() ? std::string("No sanitization steps applied")
                                  : "Applied sanitization steps: " + join(applied, " -> "));
      }
      ValidationResult failure = parse_failure(context, "cannot be parsed to JSON after all sanitization attempts",
                                               "JSON parse error at offset " + std::to_string(parsed.error_offset) +
                                                   ": " + parsed.error);
      failure.steps = run.steps;
      failure.repairs = result.repairs;
      failure.error->diagnostics = std::move(diagnostics);
      failure.error->steps = std::move(run.steps);
      return failure;
    }
  }

  Json value = std::move(*parsed.value);

  if (schema.is_null()) {
    if (!value.is_object() && !value.is_array()) {
      ValidationResult failure = parse_failure(context, "expected a JSON object or array but received a primitive type or null");
      failure.steps = result.steps;
      failure.error->diagnostics = std::move(diagnostics);
      failure.error->steps = result.steps;
      return failure;
    }
    result.success = true;
    result.data = std::move(value);
    if (log && has_significant_repairs(result.steps, {})) {
      log->info("Applied {} JSON fix(es) for '{}': {}", result.repairs.size(), context.resource, join(result.repairs, ", "));
    }
    return result;
  }

  SchemaValidation checked = validator.validate(value, schema);
  std::vector<std::string> transform_repairs;
  if (!checked.success) {
    NormalizeResult normalized = normalize_parsed(value, schema, effective);
    if (!normalized.repairs.empty()) {
      transform_repairs = std::move(normalized.repairs);
      checked = validator.validate(normalized.value, schema);
    }
  }

  if (!checked.success) {
    if (log) {
      log->warn("Schema validation failed after applying transforms (resource '{}'): {}", context.resource,
                summarize_issues(checked.issues));
    }
    ValidationResult failure;
    failure.steps = result.steps;
    failure.repairs = result.repairs;
    failure.repairs.insert(failure.repairs.end(), transform_repairs.begin(), transform_repairs.end());
    ErrorDetail error;
    error.kind = ErrorDetail::Kind::Validation;
    error.message = resource_message(context, "parsed successfully and applied transforms but still failed schema validation");
    error.cause = summarize_issues(checked.issues);
    error.issues = std::move(checked.issues);
    error.diagnostics = std::move(diagnostics);
    error.steps = result.steps;
    failure.error = std::move(error);
    return failure;
  }

  result.success = true;
  result.data = std::move(checked.data);
  if (log && has_significant_repairs(result.steps, transform_repairs)) {
    std::vector<std::string> all = result.repairs;
    all.insert(all.end(), transform_repairs.begin(), transform_repairs.end());
    log->info("Applied {} JSON fix(es) for '{}': {}", all.size(), context.resource, join(all, ", "));
  }
  result.repairs.insert(result.repairs.end(), transform_repairs.begin(), transform_repairs.end());
  return result;
}

}  // namespace completion_repair
