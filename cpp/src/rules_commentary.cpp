#include "internal.hpp"

#include <algorithm>
#include <regex>
#include <set>

namespace completion_repair {

namespace detail {

static std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> words;
  std::string cur;
  for (char c : text) {
    if (is_alpha(c) || c == '\'') {
      cur.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else if (!cur.empty()) {
      words.push_back(cur);
      cur.clear();
    }
  }
  if (!cur.empty()) words.push_back(cur);
  return words;
}

static bool has_list_marker(const std::string& t) {
  if (t.size() >= 2 && (t[0] == '-' || t[0] == '*' || t[0] == '+') && t[1] == ' ') return true;
  if (starts_with(t, "\xE2\x80\xA2")) return true;
  size_t i = 0;
  while (i < t.size() && is_digit(t[i])) ++i;
  return i > 0 && i + 1 < t.size() && (t[i] == '.' || t[i] == ')') && t[i + 1] == ' ';
}

bool looks_like_filename(const std::string& text) {
  static const std::regex re(R"(^[A-Za-z0-9_./\\-]{1,200}\.(java|kt|ts|tsx|js|jsx|py|rb|go|rs|c|cc|cpp|h|hpp|cs|php|swift|scala|xml|json|ya?ml|md|txt|sql|gradle|properties)$)",
                             std::regex::ECMAScript | std::regex::icase);
  std::string t = trim_copy(text);
  while (!t.empty() && (t.back() == ',' || t.back() == '.' || t.back() == ':')) {
    std::string shorter = t.substr(0, t.size() - 1);
    if (std::regex_match(shorter, re)) return true;
    t = shorter;
  }
  return t.size() <= 200 && std::regex_match(t, re);
}

bool looks_like_prose(const std::string& text) {
  static const std::set<std::string> kFunctionWords = {
      "the", "a", "an", "is", "are", "was", "were", "be", "been", "this", "that", "these", "those", "of",
      "to", "for", "with", "and", "or", "but", "in", "on", "at", "by", "from", "as", "it", "its", "will",
      "would", "should", "can", "could", "i", "we", "you", "here", "there", "which", "what", "not"};
  static const char* const kContinuations[] = {"i will", "i'll", "i am", "i'm", "let me", "let's", "we will", "we can",
                                               "now ", "next", "here is", "here are", "note", "moving on", "continuing",
                                               "okay", "sure", "also,", "then "};

  std::string t = trim_copy(text);
  if (t.empty() || t.size() > 400) return false;
  if (t.find_first_of("\"{}[]") != std::string::npos) return false;
  if (t == "true" || t == "false" || t == "null") return false;
  if (is_digit(t[0]) && t.find(' ') == std::string::npos) return false;

  if (looks_like_filename(t)) return true;

  // `name: value` is an unquoted property, not prose.
  size_t colon = t.find(':');
  if (colon != std::string::npos && colon > 0) {
    std::string key = t.substr(0, colon);
    bool ident = std::all_of(key.begin(), key.end(), [](char c) { return is_ident_char(c) || c == '-'; });
    if (ident && to_lower(key) != "note") return false;
  }

  bool marker = has_list_marker(t);
  std::vector<std::string> words = split_words(t);
  if (words.empty()) return false;
  if (marker) return true;

  std::string lower = to_lower(t);
  for (const char* phrase : kContinuations) {
    if (starts_with(lower, phrase)) return true;
  }

  char last = t.back();
  bool sentence_end = last == '.' || last == '!' || last == '?';
  if (sentence_end && words.size() >= 2) return true;

  size_t function_words = 0;
  for (const auto& w : words) {
    if (kFunctionWords.count(w)) ++function_words;
  }
  return function_words >= 1 && words.size() >= 3;
}

}  // namespace detail

namespace {

bool is_value_end_char(char c) { return c == '"' || c == '}' || c == ']' || detail::is_alpha(c) || detail::is_digit(c); }

bool is_element_boundary(char c) { return c == ',' || c == '{' || c == '[' || is_value_end_char(c); }

std::string preview(const std::string& text) {
  std::string t = detail::trim_copy(text);
  if (t.size() > 40) t = t.substr(0, 40) + "...";
  return t;
}

// Whole lines sitting between JSON elements. The match covers the line and its newline.
std::optional<RuleMatch> find_standalone_line(const std::string& text, size_t from) {
  size_t ls = from;
  if (ls > 0 && text[ls - 1] != '\n') {
    size_t nl = text.find('\n', ls);
    if (nl == std::string::npos) return std::nullopt;
    ls = nl + 1;
  }
  while (ls < text.size()) {
    size_t le = text.find('\n', ls);
    if (le == std::string::npos) return std::nullopt;
    std::string line = text.substr(ls, le - ls);
    std::string t = detail::trim_copy(line);
    if (!t.empty() && t.find_first_of("\"{}[]") == std::string::npos) {
      size_t prev = detail::prev_non_ws(text, ls);
      size_t next = detail::skip_ws(text, le);
      if (prev != std::string::npos && is_element_boundary(text[prev]) && next < text.size() &&
          std::string("\"{}[]").find(text[next]) != std::string::npos) {
        RuleMatch m;
        m.offset = ls;
        m.length = le + 1 - ls;
        m.groups = {text.substr(ls, m.length), t};
        return m;
      }
    }
    ls = le + 1;
  }
  return std::nullopt;
}

RuleSet build_stray_commentary_rules() {
  RuleSet rules;

  rules.push_back(ReplacementRule{
      "strayCommentaryLine",
      scan_pattern(find_standalone_line),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        if (!detail::looks_like_prose(m.group(1))) return std::nullopt;
        return RuleEdit{"", "Removed stray commentary line: '" + preview(m.group(1)) + "'", std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "commentaryAfterElement",
      regex_pattern(R"(,[ \t]{1,16}([A-Za-z*\-][^"{}\[\]\n]{2,200})(?=\r?\n))", ","),
      [](const RuleMatch& m, const RuleContext& ctx) -> std::optional<RuleEdit> {
        size_t prev = detail::prev_non_ws(ctx.text, m.offset);
        if (prev == std::string::npos || !is_value_end_char(ctx.text[prev])) return std::nullopt;
        const std::string& tail = m.group(1);
        if (tail.find(':') != std::string::npos && !detail::looks_like_filename(tail)) return std::nullopt;
        if (!detail::looks_like_prose(tail)) return std::nullopt;
        return RuleEdit{",", "Removed commentary after element: '" + preview(tail) + "'", std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "strayWordBeforeProperty",
      regex_pattern(R"(([{,][ \t\r\n]{0,16})([A-Za-z]{1,16})[ \t]{0,8}("[A-Za-z_$][A-Za-z0-9_$ \-]{0,80}"[ \t]{0,8}:))",
                    "\""),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        const std::string& word = m.group(2);
        if (word == "true" || word == "false" || word == "null") return std::nullopt;
        return RuleEdit{m.group(1) + m.group(3), "Removed stray text '" + word + "' before property", std::nullopt};
      },
      true,
  });

  rules.push_back(ReplacementRule{
      "continuationMarker",
      regex_pattern(R"([ \t]*(?:\(to be continued\)|to be continued|\[continued\])\.{0,3})", "", true),
      [](const RuleMatch& m, const RuleContext&) -> std::optional<RuleEdit> {
        return RuleEdit{"", "Removed continuation marker '" + detail::trim_copy(m.group(0)) + "'", std::nullopt};
      },
      true,
  });

  return rules;
}

}  // namespace

const RuleSet& stray_commentary_rules() {
  static const RuleSet rules = build_stray_commentary_rules();
  return rules;
}

SanitizerResult remove_stray_commentary(const std::string& content, const SanitizerConfig& config) {
  SanitizerResult r = apply_rules(content, stray_commentary_rules(), config);
  if (r.changed) r.description = "Removed stray commentary";
  return r;
}

}  // namespace completion_repair
