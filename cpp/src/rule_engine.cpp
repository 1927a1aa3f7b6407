#include "internal.hpp"

#include <algorithm>
#include <regex>

namespace completion_repair {

const std::string& RuleMatch::group(size_t i) const {
  static const std::string empty;
  return i < groups.size() ? groups[i] : empty;
}

std::string RuleContext::before(size_t offset) const {
  size_t end = std::min(offset, text.size());
  size_t start = end > config.context_lookback ? end - config.context_lookback : 0;
  return text.substr(start, end - start);
}

namespace {

class RegexPattern : public Pattern {
 public:
  RegexPattern(const std::string& expression, std::string required_literal, bool icase)
      : re_(expression, icase ? std::regex::ECMAScript | std::regex::icase : std::regex::ECMAScript),
        literal_(std::move(required_literal)) {}

  std::optional<RuleMatch> find(const std::string& text, size_t from) const override {
    if (from > text.size()) return std::nullopt;
    if (!literal_.empty() && text.find(literal_, from) == std::string::npos) return std::nullopt;

    auto flags = std::regex_constants::match_default;
    if (from > 0) flags |= std::regex_constants::match_prev_avail;
    std::smatch m;
    if (!std::regex_search(text.cbegin() + static_cast<std::ptrdiff_t>(from), text.cend(), m, re_, flags)) {
      return std::nullopt;
    }
    RuleMatch out;
    out.offset = from + static_cast<size_t>(m.position(0));
    out.length = static_cast<size_t>(m.length(0));
    out.groups.reserve(m.size());
    for (size_t g = 0; g < m.size(); ++g) {
      out.groups.push_back(m[g].matched ? m[g].str() : std::string());
    }
    return out;
  }

 private:
  std::regex re_;
  std::string literal_;
};

class FunctionPattern : public Pattern {
 public:
  explicit FunctionPattern(ScanFunction fn) : fn_(std::move(fn)) {}

  std::optional<RuleMatch> find(const std::string& text, size_t from) const override {
    if (from > text.size()) return std::nullopt;
    return fn_(text, from);
  }

 private:
  ScanFunction fn_;
};

}  // namespace

PatternPtr regex_pattern(const std::string& expression, std::string required_literal, bool icase) {
  return std::make_shared<RegexPattern>(expression, std::move(required_literal), icase);
}

PatternPtr scan_pattern(ScanFunction fn) { return std::make_shared<FunctionPattern>(std::move(fn)); }

SanitizerResult apply_rule(const std::string& content, const ReplacementRule& rule, const SanitizerConfig& config) {
  SanitizerResult result;
  if (!rule.pattern || !rule.replace) {
    result.content = content;
    return result;
  }

  StringContextMap strings(content);
  RuleContext ctx{content, strings, config};

  std::string out;
  size_t copied = 0;
  size_t pos = 0;
  while (pos <= content.size()) {
    auto m = rule.pattern->find(content, pos);
    if (!m) break;
    size_t next = m->length ? m->end() : m->offset + 1;
    if (rule.skip_in_string && strings.in_string(m->offset)) {
      pos = next;
      continue;
    }

    auto edit = rule.replace(*m, ctx);
    if (!edit) {
      pos = next;
      continue;
    }
    size_t end = std::min(edit->end ? std::max(*edit->end, m->end()) : m->end(), content.size());
    if (content.compare(m->offset, end - m->offset, edit->text) == 0) {
      pos = next;
      continue;
    }

    out.append(content, copied, m->offset - copied);
    out += edit->text;
    copied = end;
    pos = std::max(end, next);
    result.changed = true;
    if (!edit->diagnostic.empty()) result.diagnostics.push_back(std::move(edit->diagnostic));
  }

  if (!result.changed) {
    result.content = content;
    return result;
  }
  out.append(content, copied, std::string::npos);
  result.content = std::move(out);
  return result;
}

SanitizerResult apply_rules(const std::string& content, const RuleSet& rules, const SanitizerConfig& config, bool multi_pass) {
  SanitizerResult result;
  result.content = content;
  size_t max_passes = multi_pass ? std::max<size_t>(config.max_structural_passes, 1) : 1;

  for (size_t pass = 0; pass < max_passes; ++pass) {
    bool changed_this_pass = false;
    for (const auto& rule : rules) {
      SanitizerResult r = apply_rule(result.content, rule, config);
      if (!r.changed) continue;
      changed_this_pass = true;
      result.changed = true;
      result.content = std::move(r.content);
      for (auto& d : r.diagnostics) result.diagnostics.push_back(std::move(d));
    }
    if (!changed_this_pass) break;
  }

  if (result.changed) {
    result.description = "Fixed malformed JSON patterns";
    detail::cap_diagnostics(result.diagnostics, config.max_diagnostics_per_stage);
  }
  return result;
}

SanitizerResult apply_custom_rules(const std::string& content, const SanitizerConfig& config) {
  if (config.custom_rules.empty()) return detail::unchanged(content);
  // One pass only: a replacement may grow the text it matches.
  SanitizerResult r = apply_rules(content, config.custom_rules, config, false);
  if (r.changed) r.description = "Applied custom replacement rules";
  return r;
}

}  // namespace completion_repair
