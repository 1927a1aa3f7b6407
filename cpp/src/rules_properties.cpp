#include "internal.hpp"

#include <algorithm>

namespace completion_repair {

namespace {

// Fragments left behind when the start or end of a property name is lost.
const std::map<std::string, std::string>& truncated_name_table() {
  static const std::map<std::string, std::string> table = {
      {"na", "name"},
      {"nam", "name"},
      {"typ", "type"},
      {"valu", "value"},
      {"purpo", "purpose"},
      {"purpos", "purpose"},
      {"se", "purpose"},
      {"descr", "description"},
      {"descript", "description"},
      {"descriptio", "description"},
      {"implemen", "implementation"},
      {"param", "parameters"},
      {"paramete", "parameters"},
      {"refere", "references"},
      {"eferences", "references"},
      {"retu", "returnType"},
      {"returnTyp", "returnType"},
  };
  return table;
}

bool is_json_literal(const std::string& word) { return word == "true" || word == "false" || word == "null"; }

// A fragment whose head was cut off is the tail of exactly one known property.
std::optional<std::string> unique_known_completion(const std::string& fragment, const std::vector<std::string>& known) {
  if (fragment.size() < 2) return std::nullopt;
  std::optional<std::string> found;
  for (const auto& name : known) {
    if (name == fragment) return name;
    if (name.size() > fragment.size() && (detail::ends_with(name, fragment) || detail::starts_with(name, fragment))) {
      if (found && *found != name) return std::nullopt;
      found = name;
    }
  }
  return found;
}

std::string resolve_fragment(const std::string& fragment, const SanitizerConfig& config) {
  auto it = config.property_name_mappings.find(fragment);
  if (it != config.property_name_mappings.end()) return it->second;
  if (detail::contains_name(config.known_properties, fragment)) return fragment;
  const auto& table = truncated_name_table();
  auto jt = table.find(fragment);
  if (jt != table.end()) return jt->second;
  if (auto known = unique_known_completion(fragment, config.known_properties)) return *known;
  return fragment;
}

RuleSet build_property_name_rules() {
  RuleSet rules;

  rules.push_back(ReplacementRule{
      "quoteUnquotedPropertyName",
      regex_pattern(R"(([{,][ \t\r\n]{0,64})([A-Za-z_$][A-Za-z0-9_$\-]{0,80})([ \t]{0,16}):)", ":"),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        const std::string& name = m.group(2);
        if (is_json_literal(name)) return std::nullopt;
        if (is_in_array_context(m.offset + 1, ctx.text, ctx.config.context_lookback)) return std::nullopt;
        return RuleEdit{m.group(1) + "\"" + name + "\"" + m.group(3) + ":", "Quoted unquoted property name '" + name + "'",
                        std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "truncatedPropertyName",
      regex_pattern(R"re(([{,][ \t\r\n]{0,64})([A-Za-z_$][A-Za-z0-9_$]{0,60})"([ \t]{0,16}):)re", "\":"),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        const std::string& fragment = m.group(2);
        if (is_in_array_context(m.offset + 1, ctx.text, ctx.config.context_lookback)) return std::nullopt;
        std::string name = resolve_fragment(fragment, ctx.config);
        std::string diag = name == fragment ? "Added missing opening quote to property '" + name + "'"
                                            : "Fixed truncated property name '" + fragment + "' -> '" + name + "'";
        return RuleEdit{m.group(1) + "\"" + name + "\"" + m.group(3) + ":", diag, std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "trailingUnderscorePropertyName",
      regex_pattern(R"re("([A-Za-z$][A-Za-z0-9$]*(?:_[A-Za-z0-9$]+)*)(_+)"([ \t]{0,16}):)re", "_\""),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        const std::string& base = m.group(1);
        const std::string full = base + m.group(2);
        const auto& known = ctx.config.known_properties;
        if (detail::contains_name(known, full)) return std::nullopt;
        if (!known.empty() && !detail::contains_name(known, base)) return std::nullopt;
        return RuleEdit{"\"" + base + "\"" + m.group(3) + ":", "Fixed property name '" + full + "' -> '" + base + "'",
                        std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "propertyNameTypo",
      regex_pattern(R"re("([A-Za-z_$][A-Za-z0-9_$]{0,80})"([ \t]{0,16}):)re", "\":"),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        const auto& typos = ctx.config.property_typo_corrections;
        if (typos.empty()) return std::nullopt;
        auto it = typos.find(m.group(1));
        if (it == typos.end()) return std::nullopt;
        return RuleEdit{"\"" + it->second + "\"" + m.group(2) + ":",
                        "Corrected property name typo '" + m.group(1) + "' -> '" + it->second + "'", std::nullopt};
      },
      true,
  });

  return rules;
}

// ---------------- LLM metadata properties ----------------

bool is_metadata_property(const std::string& name, const SanitizerConfig& config) {
  if (detail::contains_name(config.known_properties, name)) return false;
  std::string lower = detail::to_lower(name);
  static const char* const kPrefixes[] = {"extra_", "_llm_", "_ai_"};
  for (const char* prefix : kPrefixes) {
    const std::string p(prefix);
    if (detail::starts_with(lower, p)) return lower.size() > p.size();
  }
  if (config.known_properties.empty()) return false;
  static const char* const kThinkingWords[] = {"thought", "thinking", "reasoning", "scratchpad"};
  for (const char* w : kThinkingWords) {
    if (lower.find(w) != std::string::npos) return true;
  }
  return false;
}

// `extra_text="..."` written as an attribute between JSON elements.
RuleSet build_metadata_attribute_rules() {
  RuleSet rules;

  // extra_text="  "name": where the attribute's closing quote opens the next key.
  rules.push_back(ReplacementRule{
      "extraAttributeBeforeProperty",
      regex_pattern(R"re(([}\],\n]|^)([ \t]*)(extra_[A-Za-z_$]+)[ \t]*=[ \t]*"[ \t]*"([A-Za-z_$][A-Za-z0-9_$]*"[ \t]*:))re",
                    "extra_"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        return RuleEdit{m.group(1) + m.group(2) + "\"" + m.group(4), "Removed " + m.group(3) + "= attribute",
                        std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "extraAttribute",
      regex_pattern(R"re(([}\],\n]|^)([ \t]*)(extra_[A-Za-z_$]+)[ \t]*=[ \t]*"[^"\n]{0,500}"([ \t]*"|[ \t]*,?[ \t]*\n))re",
                    "extra_"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        const std::string& next = m.group(4);
        // A quote right after the attribute opens the next property.
        std::string keep = !next.empty() && next.back() == '"' ? "\"" : "";
        return RuleEdit{m.group(1) + m.group(2) + keep, "Removed " + m.group(3) + "= attribute", std::nullopt};
      },
      true,
  });
  return rules;
}

const RuleSet& metadata_attribute_rules() {
  static const RuleSet rules = build_metadata_attribute_rules();
  return rules;
}

struct MetadataProperty {
  size_t delimiter;  // '{' or ',' preceding the property
  std::string name;
  size_t value_end;
};

// Parses `<delim> name : value` at `delim`; nullopt when it is not a removable metadata property.
std::optional<MetadataProperty> metadata_property_at(const std::string& s, size_t delim, const SanitizerConfig& config) {
  size_t j = detail::skip_ws(s, delim + 1);
  if (j >= s.size()) return std::nullopt;

  std::string name;
  bool quoted = s[j] == '"';
  size_t after_name;
  if (quoted) {
    size_t end = detail::string_end(s, j);
    if (end == std::string::npos) return std::nullopt;
    name = s.substr(j + 1, end - j - 2);
    after_name = end;
  } else {
    size_t k = j;
    while (k < s.size() && detail::is_ident_char(s[k])) ++k;
    if (k == j) return std::nullopt;
    name = s.substr(j, k - j);
    after_name = k;
  }
  size_t colon = detail::skip_ws(s, after_name);
  if (colon >= s.size() || s[colon] != ':') return std::nullopt;
  if (!is_metadata_property(name, config)) return std::nullopt;

  size_t value_end;
  if (auto end = find_json_value_end(s, colon + 1)) {
    value_end = *end;
  } else if (!quoted) {
    // Unbalanced value behind an unquoted name: fall back to the end of the line.
    size_t nl = s.find_first_of(",\n", colon + 1);
    value_end = nl == std::string::npos ? s.size() : nl;
  } else {
    value_end = s.size();
  }
  return MetadataProperty{delim, name, value_end};
}

}  // namespace

const RuleSet& property_name_rules() {
  static const RuleSet rules = build_property_name_rules();
  return rules;
}

SanitizerResult fix_property_names(const std::string& content, const SanitizerConfig& config) {
  SanitizerResult r = apply_rules(content, property_name_rules(), config);
  if (r.changed) r.description = "Fixed property names";
  return r;
}

SanitizerResult remove_llm_metadata_properties(const std::string& content, const SanitizerConfig& config) {
  SanitizerResult r;
  r.content = content;
  for (const auto& rule : metadata_attribute_rules()) {
    SanitizerResult a = apply_rule(r.content, rule, config);
    if (!a.changed) continue;
    r.changed = true;
    r.content = std::move(a.content);
    for (auto& d : a.diagnostics) r.diagnostics.push_back(std::move(d));
  }

  for (size_t pass = 0; pass < config.max_fixed_point_passes; ++pass) {
    const std::string& cur = r.content;
    StringContextMap strings(cur);
    std::string out;
    size_t copied = 0;
    bool removed_any = false;

    for (size_t i = 0; i < cur.size(); ++i) {
      char c = cur[i];
      if ((c != '{' && c != ',') || strings.in_string(i)) continue;
      auto prop = metadata_property_at(cur, i, config);
      if (!prop) continue;

      size_t after = detail::skip_ws(cur, prop->value_end);
      bool comma_follows = after < cur.size() && cur[after] == ',';
      size_t cut_begin;
      size_t cut_end;
      if (c == ',') {
        // Keep one comma between the neighbours, or none before a closer.
        cut_begin = i;
        cut_end = comma_follows ? after : prop->value_end;
      } else {
        cut_begin = i + 1;
        cut_end = comma_follows ? after + 1 : prop->value_end;
      }

      out.append(cur, copied, cut_begin - copied);
      copied = cut_end;
      removed_any = true;
      r.diagnostics.push_back("Removed LLM metadata property '" + prop->name + "'");
      i = cut_end > 0 ? cut_end - 1 : 0;
    }

    if (!removed_any) break;
    out.append(cur, copied, std::string::npos);
    r.content = std::move(out);
    r.changed = true;
  }

  if (r.changed) {
    r.description = "Removed LLM metadata properties";
    detail::cap_diagnostics(r.diagnostics, config.max_diagnostics_per_stage);
  }
  return r;
}

}  // namespace completion_repair
