#include "internal.hpp"

#include <algorithm>

namespace completion_repair {

namespace {

bool is_json_literal(const std::string& word) { return word == "true" || word == "false" || word == "null"; }

// Splits `+ "a" + IDENT ...` into its operands; literals keep their quotes.
std::vector<std::string> concatenation_operands(const std::string& tail) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < tail.size()) {
    char c = tail[i];
    if (c == '+' || c == ' ' || c == '\t') {
      ++i;
    } else if (c == '"') {
      size_t close = tail.find('"', i + 1);
      if (close == std::string::npos) close = tail.size() - 1;
      out.push_back(tail.substr(i, close - i + 1));
      i = close + 1;
    } else {
      size_t j = i;
      while (j < tail.size() && tail[j] != '+' && tail[j] != ' ' && tail[j] != '\t') ++j;
      out.push_back(tail.substr(i, j - i));
      i = j;
    }
  }
  return out;
}

RuleSet build_separator_rules() {
  RuleSet rules;

  rules.push_back(ReplacementRule{
      "assignmentOperator",
      regex_pattern(R"re(("[^"\n]{1,200}")[ \t]*:(=|-(?![0-9.]))[ \t]*)re", ":"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        return RuleEdit{m.group(1) + ": ", "Fixed assignment syntax " + m.group(1) + ":" + m.group(2) + " -> " + m.group(1) + ":",
                        std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "identifierOnlyConcatenation",
      regex_pattern(
          R"re(("[^"\n]{1,200}"[ \t]*:[ \t]*)([A-Za-z_][A-Za-z0-9_.()]*(?:[ \t]*\+[ \t]*[A-Za-z_][A-Za-z0-9_.()]*)+)(?=[ \t]*[,}\]\r\n]))re",
          "+"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        return RuleEdit{m.group(1) + "\"\"", "Replaced identifier concatenation '" + m.group(2) + "' with empty string",
                        std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "identifierLeadingConcatenation",
      regex_pattern(R"re((:[ \t]*)((?:[A-Za-z_][A-Za-z0-9_.()]*[ \t]*\+[ \t]*)+)("[^"\n]{0,500}"))re", "+"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        return RuleEdit{m.group(1) + m.group(3),
                        "Removed '" + detail::trim_copy(m.group(2)) + "' before string literal " + m.group(3), std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "literalConcatenation",
      regex_pattern(
          R"re(("[^"\n]{0,500}")((?:[ \t]*\+[ \t]*(?:"[^"\n]{0,500}"|[A-Za-z_][A-Za-z0-9_.()]*))+)(?=[ \t]*[,}\]\r\n]))re", "+"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        const std::string& first = m.group(1);
        std::vector<std::string> operands = concatenation_operands(m.group(2));
        bool literals_only = std::all_of(operands.begin(), operands.end(),
                                         [](const std::string& op) { return !op.empty() && op[0] == '"'; });
        if (!literals_only) {
          return RuleEdit{first, "Dropped concatenation after string literal " + first, std::nullopt};
        }
        std::string merged = first.substr(0, first.size() - 1);
        for (const auto& op : operands) merged += op.substr(1, op.size() - 2);
        merged.push_back('"');
        return RuleEdit{merged, "Merged " + std::to_string(operands.size() + 1) + " concatenated string literals",
                        std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "missingOpeningQuoteAfterColon",
      regex_pattern(R"re(("[A-Za-z_$][A-Za-z0-9_$\-]{0,80}"[ \t]{0,8}:[ \t]{0,8})([A-Za-z][^"\n{}\[\],:]{0,200})"([ \t]{0,8}[,}\]\r\n]))re",
                    "\":"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        std::string value = detail::trim_copy(m.group(2));
        if (is_json_literal(value)) return std::nullopt;
        return RuleEdit{m.group(1) + "\"" + m.group(2) + "\"" + m.group(3),
                        "Added missing opening quote to value '" + value + "'", std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "unquotedBareWordValue",
      regex_pattern(R"(("[A-Za-z_$][A-Za-z0-9_$\-]{0,80}"[ \t]{0,8}:[ \t]{0,8})([A-Za-z_][A-Za-z0-9_.\-]{0,100})([ \t]{0,8}[,}\]\r\n]))",
                    "\":"),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        const std::string& word = m.group(2);
        if (is_json_literal(word)) return std::nullopt;
        if (word == "undefined" || word == "NaN") {
          return RuleEdit{m.group(1) + "null" + m.group(3), "Replaced '" + word + "' with null", std::nullopt};
        }
        return RuleEdit{m.group(1) + "\"" + word + "\"" + m.group(3), "Quoted bare word value '" + word + "'",
                        std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "missingOpeningQuoteInArrayElement",
      regex_pattern(R"re(([\[,][ \t\r\n]{0,16})([A-Za-z][A-Za-z0-9_.$/\-]{0,200})"([ \t]{0,8}[,\]\r\n]))re", "\""),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        if (!is_in_array_context(m.offset + 1, ctx.text, ctx.config.context_lookback)) return std::nullopt;
        return RuleEdit{m.group(1) + "\"" + m.group(2) + "\"" + m.group(3),
                        "Added missing opening quote to array element '" + m.group(2) + "'", std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "markerBeforeArrayElement",
      regex_pattern(R"(([\[,][ \t\r\n]{0,16})([*+>]|-(?![0-9])|\xE2\x80\xA2)[ \t]{0,8}(?=["{\[]))"),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        if (!is_in_array_context(m.offset + 1, ctx.text, ctx.config.context_lookback)) return std::nullopt;
        return RuleEdit{m.group(1), "Removed list marker '" + m.group(2) + "' before array element", std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "corruptedArrayElementPrefix",
      regex_pattern(R"(([\[,][ \t\r\n]{0,16})([a-z]{1,3})("[^"\n]{0,200}"[ \t]{0,8}[,\]\r\n]))", "\""),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        const std::string& prefix = m.group(2);
        if (prefix == "n" || prefix == "t" || prefix == "f") {
          // Could be the start of a truncated literal glued to the next element; leave it.
          return std::nullopt;
        }
        if (!is_in_array_context(m.offset + 1, ctx.text, ctx.config.context_lookback)) return std::nullopt;
        return RuleEdit{m.group(1) + m.group(3), "Removed corrupted prefix '" + prefix + "' before array element",
                        std::nullopt};
      },
      true,
  });

  return rules;
}

}  // namespace

const RuleSet& separator_rules() {
  static const RuleSet rules = build_separator_rules();
  return rules;
}

SanitizerResult fix_separators(const std::string& content, const SanitizerConfig& config) {
  SanitizerResult r = apply_rules(content, separator_rules(), config);
  if (r.changed) r.description = "Fixed malformed separators";
  return r;
}

}  // namespace completion_repair
