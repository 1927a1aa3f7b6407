#include "internal.hpp"

#include <spdlog/spdlog.h>

namespace completion_repair {

const char* to_string(ResponseStatus status) {
  switch (status) {
    case ResponseStatus::Completed:
      return "COMPLETED";
    case ResponseStatus::Invalid:
      return "INVALID";
  }
  return "INVALID";
}

namespace {

enum class AttemptState {
  Received,
  PurposeChecked,
  FormatChecked,
  Completed,
  Invalid,
};

const char* state_name(AttemptState s) {
  switch (s) {
    case AttemptState::Received:
      return "RECEIVED";
    case AttemptState::PurposeChecked:
      return "PURPOSE_CHECKED";
    case AttemptState::FormatChecked:
      return "FORMAT_CHECKED";
    case AttemptState::Completed:
      return "COMPLETED";
    case AttemptState::Invalid:
      return "INVALID";
  }
  return "?";
}

// One classification attempt. Terminal states carry the response.
class CompletionAttempt {
 public:
  explicit CompletionAttempt(const ResponseBase& base) {
    response_.request = base.request;
    response_.context = base.context;
    response_.model_key = base.model_key;
  }

  void advance(AttemptState next) {
    if (auto log = logger()) {
      log->debug("completion attempt for '{}': {} -> {}", response_.context.resource, state_name(state_),
                 state_name(next));
    }
    state_ = next;
  }

  FunctionResponse complete(Json generated) {
    advance(AttemptState::Completed);
    response_.status = ResponseStatus::Completed;
    response_.generated = std::move(generated);
    return std::move(response_);
  }

  FunctionResponse invalid(std::string error) {
    advance(AttemptState::Invalid);
    response_.status = ResponseStatus::Invalid;
    response_.error = std::move(error);
    return std::move(response_);
  }

  FunctionResponse& response() { return response_; }

 private:
  AttemptState state_{AttemptState::Received};
  FunctionResponse response_;
};

}  // namespace

ResponseClassifier::ResponseClassifier(std::shared_ptr<ErrorLogger> error_logger,
                                       std::shared_ptr<const SchemaValidator> validator)
    : error_logger_(std::move(error_logger)), validator_(std::move(validator)) {}

FunctionResponse ResponseClassifier::classify(const ResponseBase& base,
                                              LlmPurpose purpose,
                                              const Json& content,
                                              const CompletionOptions& options) const {
  CompletionAttempt attempt(base);
  attempt.advance(AttemptState::PurposeChecked);
  if (purpose == LlmPurpose::Embeddings) return attempt.complete(content);

  attempt.advance(AttemptState::FormatChecked);
  if (options.output_format == OutputFormat::Text) {
    if (options.json_schema) {
      throw ConfigurationError(
          "Configuration error: jsonSchema was provided but outputFormat is TEXT. Use outputFormat JSON when providing "
          "a schema, or remove the jsonSchema for TEXT output.");
    }
    if (!content.is_string()) return attempt.invalid("Expected string response for TEXT output format");
    if (detail::trim_copy(content.as_string()).empty()) {
      if (auto log = logger()) log->warn("LLM returned empty TEXT response (resource '{}')", base.context.resource);
      return attempt.invalid("LLM returned empty TEXT response");
    }
    return attempt.complete(content);
  }

  if (!options.json_schema) {
    throw ConfigurationError(
        "Configuration error: outputFormat is JSON but no jsonSchema was provided. JSON output requires a schema for "
        "type-safe validation.");
  }

  std::string raw;
  ValidationResult result;
  if (content.is_string()) {
    raw = content.as_string();
    const SanitizerConfig config = options.sanitizer_config ? *options.sanitizer_config : SanitizerConfig{};
    const SchemaValidator& validator = validator_ ? *validator_ : default_schema_validator();
    result = parse_and_validate(raw, *options.json_schema, base.context, config, validator);
  } else {
    raw = dumps_json(content);
    ErrorDetail error;
    error.kind = ErrorDetail::Kind::Parse;
    error.message = "LLM response for resource '" + base.context.resource + "' is not a string";
    result.error = std::move(error);
  }

  FunctionResponse& response = attempt.response();
  response.repairs = result.repairs;
  response.pipeline_steps = result.steps;
  if (result.success) return attempt.complete(std::move(result.data));

  const ErrorDetail& error = *result.error;
  response.diagnostics = error.diagnostics;
  if (error_logger_) error_logger_->record_parse_failure(error, raw, base.context);
  std::string message = "LLM output could not be parsed: " + error.message;
  if (!error.cause.empty()) message += " (" + error.cause + ")";
  return attempt.invalid(std::move(message));
}

// ---------------- Serialization ----------------

Json to_json(const PipelineStep& step) {
  JsonArray diagnostics;
  for (const auto& d : step.diagnostics) diagnostics.push_back(d);
  return JsonObject{{"sanitizer", step.sanitizer}, {"changed", step.changed}, {"diagnostics", std::move(diagnostics)}};
}

Json to_json(const FunctionResponse& response) {
  JsonObject context;
  context["resource"] = response.context.resource;
  for (const auto& kv : response.context.attributes) context[kv.first] = kv.second;

  JsonObject out;
  out["status"] = to_string(response.status);
  out["request"] = response.request;
  out["modelKey"] = response.model_key;
  out["context"] = std::move(context);
  if (response.generated) out["generated"] = *response.generated;
  if (response.error) out["error"] = *response.error;

  JsonArray repairs;
  for (const auto& r : response.repairs) repairs.push_back(r);
  out["repairs"] = std::move(repairs);

  JsonArray steps;
  for (const auto& s : response.pipeline_steps) steps.push_back(to_json(s));
  out["pipelineSteps"] = std::move(steps);

  JsonArray diagnostics;
  for (const auto& d : response.diagnostics) diagnostics.push_back(d);
  out["diagnostics"] = std::move(diagnostics);
  return out;
}

}  // namespace completion_repair
