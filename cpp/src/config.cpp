#include "internal.hpp"

#include <cmath>
#include <limits>

namespace completion_repair {

namespace {

[[noreturn]] void bad_field(const std::string& key, const char* expected) {
  throw ConfigurationError("Configuration error: '" + key + "' must be " + expected);
}

void read_count(const JsonObject& doc, const char* key, size_t& out) {
  auto it = doc.find(key);
  if (it == doc.end()) return;
  if (!it->second.is_number()) bad_field(key, "a non-negative integer");
  double n = it->second.as_number();
  double ip;
  if (!std::isfinite(n) || n < 0.0 || std::modf(n, &ip) != 0.0) bad_field(key, "a non-negative integer");
  if (n >= std::ldexp(1.0, std::numeric_limits<size_t>::digits)) bad_field(key, "a non-negative integer in range");
  out = static_cast<size_t>(n);
}

void read_flag(const JsonObject& doc, const char* key, bool& out) {
  auto it = doc.find(key);
  if (it == doc.end()) return;
  if (!it->second.is_bool()) bad_field(key, "a boolean");
  out = it->second.as_bool();
}

void read_names(const JsonObject& doc, const char* key, std::vector<std::string>& out) {
  auto it = doc.find(key);
  if (it == doc.end()) return;
  if (!it->second.is_array()) bad_field(key, "an array of strings");
  for (const auto& v : it->second.as_array()) {
    if (!v.is_string()) bad_field(key, "an array of strings");
    if (!detail::contains_name(out, v.as_string())) out.push_back(v.as_string());
  }
}

void read_mapping(const JsonObject& doc, const char* key, std::map<std::string, std::string>& out) {
  auto it = doc.find(key);
  if (it == doc.end()) return;
  if (!it->second.is_object()) bad_field(key, "an object of strings");
  for (const auto& kv : it->second.as_object()) {
    if (!kv.second.is_string()) bad_field(key, "an object of strings");
    out[kv.first] = kv.second.as_string();
  }
}

// {"name": "...", "pattern": "...", "replacement": "...", "skipInString": true}
ReplacementRule read_custom_rule(const Json& doc, size_t index) {
  const std::string where = "customReplacementRules[" + std::to_string(index) + "]";
  if (!doc.is_object()) bad_field(where, "an object");
  const auto& obj = doc.as_object();

  auto field = [&](const char* key) -> const std::string& {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_string()) bad_field(where + "." + key, "a string");
    return it->second.as_string();
  };

  ReplacementRule rule;
  rule.name = field("name");
  const std::string& pattern = field("pattern");
  std::string replacement = field("replacement");
  read_flag(obj, "skipInString", rule.skip_in_string);

  try {
    rule.pattern = regex_pattern(pattern);
  } catch (const std::exception& e) {
    throw ConfigurationError("Configuration error: " + where + ".pattern is not a valid regex: " + e.what());
  }

  const std::string name = rule.name;
  rule.replace = [replacement, name](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
    // $0..$9 refer to match groups; $$ is a literal dollar.
    std::string out;
    for (size_t i = 0; i < replacement.size(); ++i) {
      char c = replacement[i];
      if (c == '$' && i + 1 < replacement.size()) {
        char d = replacement[i + 1];
        if (d == '$') {
          out.push_back('$');
          ++i;
          continue;
        }
        if (detail::is_digit(d)) {
          out += m.group(static_cast<size_t>(d - '0'));
          ++i;
          continue;
        }
      }
      out.push_back(c);
    }
    return RuleEdit{out, "Applied custom rule '" + name + "'", std::nullopt};
  };
  return rule;
}

}  // namespace

SanitizerConfig sanitizer_config_from_json(const Json& doc, SanitizerConfig base) {
  if (!doc.is_object()) throw ConfigurationError("Configuration error: sanitizer config must be a JSON object");
  const auto& obj = doc.as_object();

  read_count(obj, "minRepetitionsToTruncate", base.min_repetitions_to_truncate);
  read_count(obj, "repetitionsToKeep", base.repetitions_to_keep);
  read_count(obj, "contextLookback", base.context_lookback);
  read_count(obj, "propertyContextWindow", base.property_context_window);
  read_count(obj, "maxFixedPointPasses", base.max_fixed_point_passes);
  read_count(obj, "maxStructuralPasses", base.max_structural_passes);
  read_count(obj, "maxNestingDepth", base.max_nesting_depth);
  read_count(obj, "truncationSafetyBuffer", base.truncation_safety_buffer);
  read_count(obj, "maxDiagnosticsPerStage", base.max_diagnostics_per_stage);

  read_names(obj, "knownProperties", base.known_properties);
  read_names(obj, "arrayPropertyNames", base.array_property_names);
  read_names(obj, "numericProperties", base.numeric_properties);
  read_mapping(obj, "propertyNameMappings", base.property_name_mappings);
  read_mapping(obj, "propertyTypoCorrections", base.property_typo_corrections);

  auto it_rules = obj.find("customReplacementRules");
  if (it_rules != obj.end()) {
    if (!it_rules->second.is_array()) bad_field("customReplacementRules", "an array");
    const auto& rules = it_rules->second.as_array();
    for (size_t i = 0; i < rules.size(); ++i) base.custom_rules.push_back(read_custom_rule(rules[i], i));
  }

  auto it_norm = obj.find("normalizer");
  if (it_norm != obj.end()) {
    if (!it_norm->second.is_object()) bad_field("normalizer", "an object");
    const auto& n = it_norm->second.as_object();
    read_flag(n, "unwrapSchemaEnvelope", base.normalizer.unwrap_schema_envelope);
    read_flag(n, "convertNulls", base.normalizer.convert_nulls);
    read_flag(n, "fixPropertyTypos", base.normalizer.fix_property_typos);
    read_flag(n, "coerceSequences", base.normalizer.coerce_sequences);
    read_flag(n, "coerceNumbers", base.normalizer.coerce_numbers);
  }

  if (base.repetitions_to_keep == 0 || base.repetitions_to_keep >= base.min_repetitions_to_truncate) {
    throw ConfigurationError("Configuration error: repetitionsToKeep must be between 1 and minRepetitionsToTruncate - 1");
  }
  return base;
}

}  // namespace completion_repair
