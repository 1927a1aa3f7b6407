#include "internal.hpp"

#include <regex>

namespace completion_repair {

namespace {

constexpr size_t kMaxUnitLength = 4;
constexpr size_t kMinRunToReport = 3;

bool is_noise_char(char c) {
  switch (c) {
    case '}':
    case ']':
    case ')':
    case '{':
    case '[':
    case '(':
    case ',':
    case ';':
      return true;
    default:
      return false;
  }
}

// A repeatable unit is made of structural noise, whitespace and escaped newlines, and is not
// whitespace alone unless it is a line break.
bool is_repeat_unit(const std::string& unit) {
  if (unit == "\n" || unit == "\r\n" || unit == "\\n" || unit == "\\r\\n") return true;
  bool noise = false;
  for (size_t i = 0; i < unit.size(); ++i) {
    char c = unit[i];
    if (is_noise_char(c)) {
      noise = true;
    } else if (c == '\\' && i + 1 < unit.size() && unit[i + 1] == 'n') {
      noise = true;
      ++i;
    } else if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      return false;
    }
  }
  return noise;
}

size_t count_repeats(const std::string& text, size_t p, size_t unit_len, size_t limit) {
  size_t k = 1;
  while (k < limit && p + (k + 1) * unit_len <= text.size() &&
         text.compare(p + k * unit_len, unit_len, text, p, unit_len) == 0) {
    ++k;
  }
  return k;
}

// Leftmost run of one unit repeated at least kMinRunToReport times. groups: [0] run, [1] unit, [2] count.
std::optional<RuleMatch> find_repetition_run(const std::string& text, size_t from) {
  for (size_t p = from; p < text.size(); ++p) {
    char c = text[p];
    if (!is_noise_char(c) && c != '\\' && c != '\n' && c != '\r') continue;

    size_t best_len = 0;
    size_t best_count = 0;
    for (size_t len = 1; len <= kMaxUnitLength && p + len <= text.size(); ++len) {
      std::string unit = text.substr(p, len);
      if (!is_repeat_unit(unit)) continue;
      size_t k = count_repeats(text, p, len, kMinRunToReport);
      if (k < kMinRunToReport) continue;
      k = count_repeats(text, p, len, text.size());
      if (k * len > best_count * best_len) {
        best_len = len;
        best_count = k;
      }
    }
    if (best_count < kMinRunToReport) continue;

    size_t end = p + best_len * best_count;
    // Swallow a trailing partial unit ("} } }" ends without the final space).
    size_t partial = 0;
    while (partial + 1 < best_len && end + partial < text.size() && text[end + partial] == text[p + partial]) ++partial;
    if (partial > 0 && detail::trim_copy(text.substr(p, partial)) != "") end += partial;

    RuleMatch m;
    m.offset = p;
    m.length = end - p;
    m.groups = {text.substr(p, end - p), text.substr(p, best_len), std::to_string(best_count)};
    return m;
  }
  return std::nullopt;
}

std::string escape_controls(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

// Offset of the unescaped quote closing the string that contains `pos`, or npos.
size_t closing_quote_after(const std::string& text, size_t pos) {
  bool escape = false;
  // `pos` may sit right after a backslash; the map says we are inside a string, so
  // recover escape state from the run of backslashes before it.
  size_t slashes = 0;
  while (slashes < pos && text[pos - 1 - slashes] == '\\') ++slashes;
  escape = slashes % 2 == 1;
  for (size_t i = pos; i < text.size(); ++i) {
    char c = text[i];
    if (escape) {
      escape = false;
    } else if (c == '\\') {
      escape = true;
    } else if (c == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::string closers_for(const std::string& prefix) {
  StructureState st = scan_structure(prefix);
  std::string closers;
  for (auto it = st.open.rbegin(); it != st.open.rend(); ++it) closers.push_back(*it == '{' ? '}' : ']');
  return closers;
}

// Truncates the string at `cut` and closes it; consumes through the original closing
// quote, or closes any open structure when the string never terminated.
RuleEdit close_string_at(const std::string& text, size_t cut, size_t scan_from, std::string replacement,
                         std::string diagnostic) {
  size_t close = closing_quote_after(text, scan_from);
  replacement.push_back('"');
  RuleEdit edit{std::move(replacement), std::move(diagnostic), std::nullopt};
  if (close != std::string::npos) {
    edit.end = close + 1;
  } else {
    std::string closers = closers_for(text.substr(0, cut));
    if (!closers.empty()) edit.text += "\n" + closers;
    edit.end = text.size();
  }
  return edit;
}

std::optional<RuleMatch> find_embedded_json(const std::string& text, size_t from) {
  static const std::regex signature(R"(^\\"[ \t]{0,8},(?:[ \t\r\n]|\\n|\\r|\\t){1,24}\\"[A-Za-z_$][A-Za-z0-9_$]{0,60}\\"[ \t]{0,8}:)");
  size_t q = text.find("\\\"", from);
  while (q != std::string::npos) {
    size_t window_end = std::min(text.size(), q + 200);
    std::string window = text.substr(q, window_end - q);
    std::smatch sm;
    if (std::regex_search(window, sm, signature)) {
      std::string sig = sm.str(0);
      bool newline_form = sig.find('\n') != std::string::npos || sig.find("\\n") != std::string::npos;
      if (newline_form) {
        RuleMatch m;
        m.offset = q;
        m.length = sig.size();
        m.groups = {sig};
        return m;
      }
    }
    q = text.find("\\\"", q + 2);
  }
  return std::nullopt;
}

RuleSet build_string_corruption_rules() {
  RuleSet rules;

  rules.push_back(ReplacementRule{
      "runawayRepetitionInString",
      scan_pattern(find_repetition_run),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        if (!ctx.strings.in_string(m.offset)) return std::nullopt;
        size_t count = std::stoul(m.group(2));
        if (count < ctx.config.min_repetitions_to_truncate) return std::nullopt;

        const std::string& unit = m.group(1);
        std::string kept;
        for (size_t i = 0; i < ctx.config.repetitions_to_keep; ++i) kept += unit;
        while (!kept.empty() && (kept.back() == ' ' || kept.back() == '\t')) kept.pop_back();
        kept = escape_controls(kept);

        std::string diag = "Truncated " + std::to_string(count) + " repetitive '" + escape_controls(detail::trim_copy(unit)) +
                           "' sequences in string value";
        return close_string_at(ctx.text, m.offset, m.end(), kept + "...", diag);
      },
      false,
  });

  rules.push_back(ReplacementRule{
      "embeddedJsonInString",
      scan_pattern(find_embedded_json),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        if (!ctx.strings.in_string(m.offset)) return std::nullopt;
        return close_string_at(ctx.text, m.offset, m.end(), "",
                               "Truncated string value at embedded JSON '" + escape_controls(m.group(0)) + "'");
      },
      false,
  });

  return rules;
}

}  // namespace

const RuleSet& string_corruption_rules() {
  static const RuleSet rules = build_string_corruption_rules();
  return rules;
}

SanitizerResult fix_string_corruption(const std::string& content, const SanitizerConfig& config) {
  SanitizerResult r = apply_rules(content, string_corruption_rules(), config);
  if (r.changed) r.description = "Repaired corrupted string values";
  return r;
}

}  // namespace completion_repair
