#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace spdlog {
class logger;
}

namespace completion_repair {

// A schema issue (or, from parse_json, a parse failure). Thrown only by the throwing
// convenience entry points; the repair pipeline reports these as data.
struct ValidationError : public std::runtime_error {
  std::string path;
  std::string message;
  std::string kind;  // schema | type | parse
  explicit ValidationError(std::string message, std::string path_ = "$", std::string kind_ = "schema")
      : std::runtime_error(message), path(std::move(path_)), message(std::move(message)), kind(std::move(kind_)) {}

  const char* what() const noexcept override { return message.c_str(); }
};

// Caller defect: JSON output requested without a schema, TEXT output with one, or a
// malformed configuration document. Never retried.
struct ConfigurationError : public std::runtime_error {
  explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// ---------------- Json ----------------

struct Json;
using JsonArray = std::vector<Json>;

// Insertion-ordered mapping. Keys are unique; operator[] appends missing keys.
class JsonObject {
 public:
  using value_type = std::pair<std::string, Json>;
  using iterator = std::vector<value_type>::iterator;
  using const_iterator = std::vector<value_type>::const_iterator;

  JsonObject() = default;
  JsonObject(std::initializer_list<value_type> init);
  // Takes ownership of `items`, whose keys must already be unique.
  explicit JsonObject(std::vector<value_type> items);

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;

  iterator find(const std::string& key);
  const_iterator find(const std::string& key) const;
  bool contains(const std::string& key) const;

  Json& at(const std::string& key);
  const Json& at(const std::string& key) const;
  Json& operator[](const std::string& key);

  std::pair<iterator, bool> emplace(std::string key, Json value);
  size_t erase(const std::string& key);
  // Renames a key in place, keeping its position. Returns false if `from` is missing or `to` exists.
  bool rename(const std::string& from, const std::string& to);

  size_t size() const;
  bool empty() const;

 private:
  std::vector<value_type> items_;
};

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int n) : value(static_cast<double>(n)) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();
};

inline JsonObject::JsonObject(std::initializer_list<value_type> init) {
  for (const auto& kv : init) emplace(kv.first, kv.second);
}
inline JsonObject::JsonObject(std::vector<value_type> items) : items_(std::move(items)) {}
inline JsonObject::iterator JsonObject::begin() { return items_.begin(); }
inline JsonObject::iterator JsonObject::end() { return items_.end(); }
inline JsonObject::const_iterator JsonObject::begin() const { return items_.begin(); }
inline JsonObject::const_iterator JsonObject::end() const { return items_.end(); }
inline size_t JsonObject::size() const { return items_.size(); }
inline bool JsonObject::empty() const { return items_.empty(); }
inline bool JsonObject::contains(const std::string& key) const { return find(key) != end(); }

std::string dumps_json(const Json& value);
bool json_equals(const Json& a, const Json& b);

struct JsonParseResult {
  std::optional<Json> value;
  std::string error;
  size_t error_offset{0};
};

// Strict RFC 8259 parse; duplicate keys keep the last value. Never throws.
JsonParseResult try_parse_json(const std::string& text);

// Same as try_parse_json but throws ValidationError(kind "parse") on failure.
Json parse_json(const std::string& text);

// ---------------- String context ----------------

// True when `position` lies inside a double-quoted string literal, judged by scanning [0, position).
bool is_in_string_at(size_t position, const std::string& content);

// Precomputed is_in_string_at answers for every offset of one buffer.
class StringContextMap {
 public:
  explicit StringContextMap(const std::string& content);

  bool in_string(size_t position) const;
  bool ends_in_string() const { return ends_in_string_; }

 private:
  std::vector<bool> flags_;
  bool ends_in_string_{false};
};

// Whether the innermost unclosed container before `index` (within `lookback` characters) is an array.
bool is_in_array_context(size_t index, const std::string& content, size_t lookback = 500);
bool is_in_object_context(size_t index, const std::string& content, size_t lookback = 500);

// Offset just past the JSON value starting at `start` (after leading whitespace), using a
// brace/bracket/quote balanced scan. nullopt when the value runs off the end of the buffer.
std::optional<size_t> find_json_value_end(const std::string& content, size_t start);

struct StructureState {
  std::string open;  // unclosed '{' / '[' outside strings, outermost first
  bool in_string{false};
};

StructureState scan_structure(const std::string& content);

// ---------------- Repair rules ----------------

struct SanitizerConfig;

struct RuleMatch {
  size_t offset{0};
  size_t length{0};
  // groups[0] is the whole match; unmatched groups are empty.
  std::vector<std::string> groups;

  size_t end() const { return offset + length; }
  const std::string& group(size_t i) const;
};

// Matching facility behind the rules. Implementations must return the leftmost match at or after `from`.
class Pattern {
 public:
  virtual ~Pattern() = default;
  virtual std::optional<RuleMatch> find(const std::string& text, size_t from) const = 0;
};

using PatternPtr = std::shared_ptr<const Pattern>;
using ScanFunction = std::function<std::optional<RuleMatch>(const std::string& text, size_t from)>;

// ECMAScript regex. `required_literal`, when non-empty, must occur at or after the search
// start for a match to be attempted.
PatternPtr regex_pattern(const std::string& expression, std::string required_literal = "", bool icase = false);
PatternPtr scan_pattern(ScanFunction fn);

struct RuleContext {
  const std::string& text;
  const StringContextMap& strings;
  const SanitizerConfig& config;

  // Up to config.context_lookback characters preceding `offset`.
  std::string before(size_t offset) const;
};

struct RuleEdit {
  std::string text;
  std::string diagnostic;
  // Absolute end of the replaced region when a rule consumes past its match.
  std::optional<size_t> end;
};

using ReplaceFunction = std::function<std::optional<RuleEdit>(const RuleMatch& match, const RuleContext& context)>;

struct ReplacementRule {
  std::string name;
  PatternPtr pattern;
  // Returns nullopt to leave the match untouched.
  ReplaceFunction replace;
  bool skip_in_string{true};
};

using RuleSet = std::vector<ReplacementRule>;

// ---------------- Configuration ----------------

struct NormalizerOptions {
  bool unwrap_schema_envelope{true};
  bool convert_nulls{true};
  bool fix_property_typos{true};
  bool coerce_sequences{true};
  bool coerce_numbers{true};
};

struct SanitizerConfig {
  size_t min_repetitions_to_truncate{10};
  size_t repetitions_to_keep{3};
  size_t context_lookback{500};
  size_t property_context_window{150};
  size_t max_fixed_point_passes{50};
  size_t max_structural_passes{80};
  size_t max_nesting_depth{64};
  size_t truncation_safety_buffer{100};
  size_t max_diagnostics_per_stage{20};

  std::vector<std::string> known_properties;
  std::vector<std::string> array_property_names;
  std::vector<std::string> numeric_properties;
  // Truncated fragment -> full property name, consulted before the built-in table.
  std::map<std::string, std::string> property_name_mappings;
  std::map<std::string, std::string> property_typo_corrections;

  RuleSet custom_rules;
  NormalizerOptions normalizer;
};

// Reads camelCase overrides ("minRepetitionsToTruncate", "knownProperties", ...) onto `base`.
SanitizerConfig sanitizer_config_from_json(const Json& doc, SanitizerConfig base = SanitizerConfig{});

// ---------------- Sanitizers ----------------

struct SanitizerResult {
  std::string content;
  bool changed{false};
  std::string description;
  std::vector<std::string> diagnostics;
};

// Runs one rule over the buffer once, left to right.
SanitizerResult apply_rule(const std::string& content, const ReplacementRule& rule, const SanitizerConfig& config);

// Runs every rule in order; with multi_pass, repeats until nothing changes or max_structural_passes.
SanitizerResult apply_rules(const std::string& content,
                            const RuleSet& rules,
                            const SanitizerConfig& config,
                            bool multi_pass = true);

const RuleSet& property_name_rules();
const RuleSet& stray_commentary_rules();
const RuleSet& separator_rules();
const RuleSet& string_corruption_rules();

SanitizerResult extract_json_span(const std::string& content, const SanitizerConfig& config);
SanitizerResult normalize_characters(const std::string& content, const SanitizerConfig& config);
SanitizerResult strip_comments(const std::string& content, const SanitizerConfig& config);
SanitizerResult remove_llm_metadata_properties(const std::string& content, const SanitizerConfig& config);
SanitizerResult remove_stray_commentary(const std::string& content, const SanitizerConfig& config);
SanitizerResult fix_property_names(const std::string& content, const SanitizerConfig& config);
SanitizerResult fix_separators(const std::string& content, const SanitizerConfig& config);
SanitizerResult insert_missing_commas(const std::string& content, const SanitizerConfig& config);
SanitizerResult remove_trailing_commas(const std::string& content, const SanitizerConfig& config);
SanitizerResult close_truncated_structures(const std::string& content, const SanitizerConfig& config);
SanitizerResult fix_string_corruption(const std::string& content, const SanitizerConfig& config);
SanitizerResult apply_custom_rules(const std::string& content, const SanitizerConfig& config);

using SanitizerFunction = std::function<SanitizerResult(const std::string&, const SanitizerConfig&)>;

struct Sanitizer {
  std::string name;
  SanitizerFunction apply;
};

// The declared stage order: structural cleanup first, string-corruption repair last.
const std::vector<Sanitizer>& default_sanitizers();

struct PipelineStep {
  std::string sanitizer;
  bool changed{false};
  std::vector<std::string> diagnostics;
};

struct PipelineRun {
  std::string content;
  bool repaired{false};
  std::vector<PipelineStep> steps;
  // Flattened "<stage>: <diagnostic>" lines, in stage order.
  std::vector<std::string> diagnostics;
};

class SanitizerPipeline {
 public:
  SanitizerPipeline();
  explicit SanitizerPipeline(std::vector<Sanitizer> stages);

  PipelineRun run(const std::string& raw, const SanitizerConfig& config) const;
  const std::vector<Sanitizer>& stages() const { return stages_; }

 private:
  std::vector<Sanitizer> stages_;
};

PipelineRun sanitize_completion(const std::string& raw, const SanitizerConfig& config = SanitizerConfig{});

// ---------------- Schema validation ----------------

// JSON Schema subset: type, enum, const, allOf/anyOf/oneOf, numeric and string bounds,
// pattern, format, items, contains, required, dependentRequired, propertyNames,
// properties, additionalProperties, if/then/else.
void validate(const Json& value, const Json& schema, const std::string& path = "$");
std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path = "$");
void apply_defaults(Json& value, const Json& schema);

// Every property name declared anywhere in the schema, first occurrence order.
std::vector<std::string> schema_property_names(const Json& schema);

struct SchemaValidation {
  bool success{false};
  Json data;
  std::vector<ValidationError> issues;
};

class SchemaValidator {
 public:
  virtual ~SchemaValidator() = default;
  virtual SchemaValidation validate(const Json& value, const Json& schema) const = 0;
};

class JsonSchemaValidator : public SchemaValidator {
 public:
  explicit JsonSchemaValidator(bool fill_defaults = true) : fill_defaults_(fill_defaults) {}
  SchemaValidation validate(const Json& value, const Json& schema) const override;

 private:
  bool fill_defaults_;
};

// ---------------- Post-parse normalization ----------------

struct NormalizeResult {
  Json value;
  std::vector<std::string> repairs;
};

// Applies the enabled transforms in order: schema envelope unwrap, null coercion,
// property typo fix, sequence coercion, numeric coercion.
NormalizeResult normalize_parsed(const Json& value, const Json& schema, const SanitizerConfig& config = SanitizerConfig{});

size_t unwrap_schema_envelopes(Json& value, const Json& schema, const SanitizerConfig& config, std::vector<std::string>* repairs);
size_t coerce_nulls_to_absent(Json& value, const Json& schema, const SanitizerConfig& config, std::vector<std::string>* repairs);
size_t fix_property_typos(Json& value, const Json& schema, const SanitizerConfig& config, std::vector<std::string>* repairs);
size_t coerce_scalars_to_sequences(Json& value, const Json& schema, const SanitizerConfig& config, std::vector<std::string>* repairs);
size_t coerce_numeric_strings(Json& value, const Json& schema, const SanitizerConfig& config, std::vector<std::string>* repairs);

// ---------------- Parse + validate ----------------

struct LlmContext {
  std::string resource;
  std::map<std::string, std::string> attributes;
};

struct ErrorDetail {
  enum class Kind {
    Parse,
    Validation,
  };

  Kind kind{Kind::Parse};
  std::string message;
  std::string cause;
  std::vector<ValidationError> issues;
  std::vector<std::string> diagnostics;
  std::vector<PipelineStep> steps;
};

struct ValidationResult {
  bool success{false};
  Json data;
  std::vector<std::string> repairs;
  std::vector<PipelineStep> steps;
  std::optional<ErrorDetail> error;
};

const SchemaValidator& default_schema_validator();

// Fast-path strict parse, else sanitizer pipeline + parse; then schema validation, and on
// failure post-parse normalization and a second validation. A null schema accepts any
// object or array.
ValidationResult parse_and_validate(const std::string& raw,
                                    const Json& schema,
                                    const LlmContext& context,
                                    const SanitizerConfig& config = SanitizerConfig{},
                                    const SchemaValidator& validator = default_schema_validator());

// ---------------- Logging ----------------

// The library's named spdlog logger ("completion_repair").
std::shared_ptr<spdlog::logger> logger();
void set_logger(std::shared_ptr<spdlog::logger> logger);

class ErrorLogger {
 public:
  virtual ~ErrorLogger() = default;
  virtual void record_parse_failure(const ErrorDetail& error, const std::string& raw, const LlmContext& context) noexcept = 0;
};

// Writes failures to the library logger.
class LogErrorLogger : public ErrorLogger {
 public:
  void record_parse_failure(const ErrorDetail& error, const std::string& raw, const LlmContext& context) noexcept override;
};

// Writes one file per failure into `directory` for later inspection.
class FileErrorLogger : public ErrorLogger {
 public:
  explicit FileErrorLogger(std::string directory);
  void record_parse_failure(const ErrorDetail& error, const std::string& raw, const LlmContext& context) noexcept override;

  size_t recorded() const { return recorded_; }

 private:
  std::string directory_;
  size_t recorded_{0};
};

// ---------------- Response classification ----------------

enum class LlmPurpose {
  Completions,
  Embeddings,
};

enum class OutputFormat {
  Json,
  Text,
};

enum class ResponseStatus {
  Completed,
  Invalid,
};

const char* to_string(ResponseStatus status);

struct ResponseBase {
  std::string request;
  LlmContext context;
  std::string model_key;
};

struct CompletionOptions {
  OutputFormat output_format{OutputFormat::Json};
  std::optional<Json> json_schema;
  std::optional<SanitizerConfig> sanitizer_config;
};

struct FunctionResponse : ResponseBase {
  ResponseStatus status{ResponseStatus::Invalid};
  std::optional<Json> generated;
  std::optional<std::string> error;
  std::vector<std::string> repairs;
  std::vector<PipelineStep> pipeline_steps;
  std::vector<std::string> diagnostics;
};

class ResponseClassifier {
 public:
  explicit ResponseClassifier(std::shared_ptr<ErrorLogger> error_logger,
                              std::shared_ptr<const SchemaValidator> validator = nullptr);

  // Decides acceptability of one completion attempt. Throws ConfigurationError for JSON
  // output without a schema and TEXT output with one; every content problem is INVALID.
  FunctionResponse classify(const ResponseBase& base,
                            LlmPurpose purpose,
                            const Json& content,
                            const CompletionOptions& options) const;

 private:
  std::shared_ptr<ErrorLogger> error_logger_;
  std::shared_ptr<const SchemaValidator> validator_;
};

Json to_json(const FunctionResponse& response);
Json to_json(const PipelineStep& step);

}  // namespace completion_repair
