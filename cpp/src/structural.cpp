#include "internal.hpp"

#include <algorithm>

namespace completion_repair {

using detail::is_space;
using detail::skip_ws;

// ---------------- JSON span extraction ----------------

static bool plausible_array_start(const std::string& s, size_t open) {
  size_t j = skip_ws(s, open + 1);
  if (j >= s.size()) return true;
  char c = s[j];
  return c == '{' || c == '[' || c == '"' || c == ']' || c == '-' || detail::is_digit(c) ||
         s.compare(j, 4, "true") == 0 || s.compare(j, 5, "false") == 0 || s.compare(j, 4, "null") == 0;
}

static size_t find_json_start(const std::string& s) {
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '{') return i;
    if (s[i] == '[' && plausible_array_start(s, i)) return i;
  }
  return std::string::npos;
}

SanitizerResult extract_json_span(const std::string& content, const SanitizerConfig& config) {
  SanitizerResult r;
  std::string s = content;

  size_t fence = s.find("```");
  if (fence != std::string::npos) {
    size_t body = s.find('\n', fence);
    if (body != std::string::npos) {
      ++body;
      size_t close = s.find("```", body);
      std::string inner = s.substr(body, close == std::string::npos ? std::string::npos : close - body);
      if (find_json_start(inner) != std::string::npos) {
        s = inner;
        r.diagnostics.push_back(close == std::string::npos ? "Removed unterminated markdown code fence"
                                                           : "Removed markdown code fence");
      }
    }
  }

  size_t start = find_json_start(s);
  if (start == std::string::npos) {
    // Nothing structural to extract; leave the content to the classifier.
    return detail::unchanged(content);
  }
  if (detail::trim_copy(s.substr(0, start)).size() > 0) {
    r.diagnostics.push_back("Removed " + std::to_string(start) + " characters of text before JSON");
  }

  size_t end = s.size();
  if (auto value_end = find_json_value_end(s, start)) {
    size_t tail = skip_ws(s, *value_end);
    if (tail < s.size()) {
      char t = s[tail];
      // A tail that continues the structure means the balanced end was premature.
      if (t != ',' && t != '"' && t != '}' && t != ']' && t != ':') {
        end = *value_end;
        r.diagnostics.push_back("Removed " + std::to_string(s.size() - tail) + " characters of text after JSON");
      }
    }
  }

  std::string out = s.substr(start, end - start);
  while (!out.empty() && is_space(out.back())) out.pop_back();

  r.content = std::move(out);
  r.changed = r.content != content;
  if (r.changed) {
    r.description = "Trimmed and extracted JSON span";
    detail::cap_diagnostics(r.diagnostics, config.max_diagnostics_per_stage);
  } else {
    r.diagnostics.clear();
  }
  return r;
}

// ---------------- Character normalization ----------------

namespace {

constexpr size_t kMaxWhitespaceRun = 64;

bool is_hex(char c) { return detail::is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }

bool at_utf8(const std::string& s, size_t i, const char* seq) {
  return s.compare(i, 3, seq) == 0;
}

bool is_smart_double_quote(const std::string& s, size_t i) {
  return at_utf8(s, i, "\xE2\x80\x9C") || at_utf8(s, i, "\xE2\x80\x9D");
}

bool is_invisible(const std::string& s, size_t i) {
  return at_utf8(s, i, "\xEF\xBB\xBF") || at_utf8(s, i, "\xE2\x80\x8B") || at_utf8(s, i, "\xE2\x80\x8C") ||
         at_utf8(s, i, "\xE2\x80\x8D");
}

// A single quote opens a string only where a JSON string could start.
bool single_quote_opens_string(const std::string& out) {
  size_t p = detail::prev_non_ws(out, out.size());
  if (p == std::string::npos) return true;
  char c = out[p];
  return c == '{' || c == '[' || c == ',' || c == ':';
}

std::optional<size_t> single_quoted_string_end(const std::string& s, size_t open) {
  for (size_t i = open + 1; i < s.size(); ++i) {
    if (s[i] == '\\') {
      ++i;
      continue;
    }
    if (s[i] == '\n') return std::nullopt;
    if (s[i] != '\'') continue;
    size_t j = skip_ws(s, i + 1);
    if (j >= s.size() || s[j] == ':' || s[j] == ',' || s[j] == '}' || s[j] == ']') return i;
  }
  return std::nullopt;
}

}  // namespace

SanitizerResult normalize_characters(const std::string& content, const SanitizerConfig& config) {
  std::string out;
  out.reserve(content.size() + 16);

  size_t smart_quotes = 0;
  size_t invisible = 0;
  size_t control_chars = 0;
  size_t bad_escapes = 0;
  size_t python_literals = 0;
  size_t whitespace_runs = 0;
  size_t single_quoted = 0;

  bool in_str = false;
  bool smart_open = false;
  const size_t n = content.size();

  for (size_t i = 0; i < n;) {
    char c = content[i];

    if (in_str) {
      if (smart_open && is_smart_double_quote(content, i)) {
        out.push_back('"');
        ++smart_quotes;
        in_str = false;
        smart_open = false;
        i += 3;
        continue;
      }
      if (c == '"') {
        out.push_back(c);
        in_str = false;
        smart_open = false;
        ++i;
        continue;
      }
      if (c == '\\') {
        if (i + 1 >= n) {
          out.push_back(c);
          ++i;
          continue;
        }
        char e = content[i + 1];
        if (e == '\'') {
          out.push_back('\'');
          ++bad_escapes;
        } else if (e == 'u') {
          bool ok = i + 5 < n && is_hex(content[i + 2]) && is_hex(content[i + 3]) && is_hex(content[i + 4]) &&
                    is_hex(content[i + 5]);
          if (ok) {
            out.append(content, i, 2);
          } else {
            out += "\\\\u";
            ++bad_escapes;
          }
        } else if (e == '"' || e == '\\' || e == '/' || e == 'b' || e == 'f' || e == 'n' || e == 'r' || e == 't') {
          out.push_back('\\');
          out.push_back(e);
        } else if (static_cast<unsigned char>(e) < 0x20) {
          // Backslash followed by a raw control character: keep the control character, escaped.
          out += detail::json_escape(std::string(1, e));
          ++bad_escapes;
        } else {
          out += "\\\\";
          out.push_back(e);
          ++bad_escapes;
        }
        i += 2;
        continue;
      }
      if (static_cast<unsigned char>(c) < 0x20) {
        out += detail::json_escape(std::string(1, c));
        ++control_chars;
        ++i;
        continue;
      }
      out.push_back(c);
      ++i;
      continue;
    }

    // Outside strings.
    if (is_invisible(content, i)) {
      ++invisible;
      i += 3;
      continue;
    }
    if (is_smart_double_quote(content, i)) {
      out.push_back('"');
      ++smart_quotes;
      in_str = true;
      smart_open = true;
      i += 3;
      continue;
    }
    if (c == '\xC2' && i + 1 < n && content[i + 1] == '\xA0') {
      out.push_back(' ');
      ++invisible;
      i += 2;
      continue;
    }
    if (c == '"') {
      out.push_back(c);
      in_str = true;
      ++i;
      continue;
    }
    if (c == '\'' && single_quote_opens_string(out)) {
      if (auto close = single_quoted_string_end(content, i)) {
        out.push_back('"');
        for (size_t k = i + 1; k < *close; ++k) {
          char q = content[k];
          if (q == '\\' && k + 1 < *close && content[k + 1] == '\'') {
            out.push_back('\'');
            ++k;
          } else if (q == '"') {
            out += "\\\"";
          } else {
            out.push_back(q);
          }
        }
        out.push_back('"');
        ++single_quoted;
        i = *close + 1;
        continue;
      }
    }
    if (is_space(c)) {
      size_t j = i;
      bool newline = false;
      while (j < n && is_space(content[j])) {
        if (content[j] == '\n') newline = true;
        ++j;
      }
      if (j - i > kMaxWhitespaceRun) {
        out.push_back(newline ? '\n' : ' ');
        ++whitespace_runs;
      } else {
        out.append(content, i, j - i);
      }
      i = j;
      continue;
    }
    if (detail::is_ident_start(c)) {
      size_t j = i;
      while (j < n && detail::is_ident_char(content[j])) ++j;
      std::string word = content.substr(i, j - i);
      bool prev_ident = !out.empty() && detail::is_ident_char(out.back());
      if (!prev_ident && (word == "True" || word == "False" || word == "None")) {
        out += word == "True" ? "true" : word == "False" ? "false" : "null";
        ++python_literals;
      } else {
        out += word;
      }
      i = j;
      continue;
    }
    out.push_back(c);
    ++i;
  }

  SanitizerResult r;
  r.changed = out != content;
  r.content = std::move(out);
  if (!r.changed) return r;

  r.description = "Normalized characters";
  auto note = [&](size_t count, const std::string& what) {
    if (count) r.diagnostics.push_back(what + " (" + std::to_string(count) + ")");
  };
  note(invisible, "Removed invisible or non-breaking characters");
  note(smart_quotes, "Converted smart quotes to ASCII quotes");
  note(single_quoted, "Converted single-quoted strings to double quotes");
  note(control_chars, "Escaped control characters inside strings");
  note(bad_escapes, "Repaired invalid escape sequences");
  note(python_literals, "Replaced Python literals with JSON literals");
  note(whitespace_runs, "Collapsed long whitespace runs");
  detail::cap_diagnostics(r.diagnostics, config.max_diagnostics_per_stage);
  return r;
}

// ---------------- Comments ----------------

SanitizerResult strip_comments(const std::string& content, const SanitizerConfig& config) {
  // Removes //... and /*...*/ outside string literals.
  std::string out;
  out.reserve(content.size());

  bool in_str = false;
  bool escape = false;
  bool in_line = false;
  bool in_block = false;
  size_t removed = 0;

  for (size_t i = 0; i < content.size(); ++i) {
    char c = content[i];
    char nx = (i + 1 < content.size()) ? content[i + 1] : '\0';

    if (in_line) {
      if (c == '\n') {
        in_line = false;
        out.push_back(c);
      }
      continue;
    }
    if (in_block) {
      if (c == '*' && nx == '/') {
        in_block = false;
        ++i;
      }
      continue;
    }

    if (in_str) {
      out.push_back(c);
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_str = false;
      }
      continue;
    }

    if (c == '"') {
      in_str = true;
      out.push_back(c);
      continue;
    }

    if (c == '/' && nx == '/') {
      in_line = true;
      ++removed;
      ++i;
      continue;
    }
    if (c == '/' && nx == '*') {
      in_block = true;
      ++removed;
      ++i;
      continue;
    }

    out.push_back(c);
  }

  SanitizerResult r;
  r.changed = removed > 0;
  r.content = r.changed ? std::move(out) : content;
  if (r.changed) {
    r.description = "Removed comments";
    r.diagnostics.push_back("Removed " + std::to_string(removed) + " comment(s) outside strings");
    detail::cap_diagnostics(r.diagnostics, config.max_diagnostics_per_stage);
  }
  return r;
}

// ---------------- Commas ----------------

namespace {

bool starts_value(char c) { return c == '"' || c == '{' || c == '['; }

bool is_scalar_token(const std::string& tok) {
  if (tok == "true" || tok == "false" || tok == "null") return true;
  if (tok.empty()) return false;
  size_t k = tok[0] == '-' ? 1 : 0;
  return k < tok.size() && detail::is_digit(tok[k]);
}

bool has_newline(const std::string& s, size_t from, size_t to) {
  return std::find(s.begin() + static_cast<std::ptrdiff_t>(from), s.begin() + static_cast<std::ptrdiff_t>(to), '\n') !=
         s.begin() + static_cast<std::ptrdiff_t>(to);
}

}  // namespace

SanitizerResult insert_missing_commas(const std::string& content, const SanitizerConfig& config) {
  std::string out;
  out.reserve(content.size() + 16);
  std::string stack;
  char prev_sig = '\0';  // last significant character emitted outside strings
  size_t inserted = 0;
  const size_t n = content.size();

  for (size_t i = 0; i < n;) {
    char c = content[i];
    bool value_ended = false;

    if (c == '"') {
      size_t end = detail::string_end(content, i);
      if (end == std::string::npos) {
        out.append(content, i, std::string::npos);
        break;
      }
      bool may_be_key = !stack.empty() && stack.back() == '{' && (prev_sig == '{' || prev_sig == ',');
      out.append(content, i, end - i);
      i = end;
      prev_sig = '"';
      size_t j = skip_ws(content, i);
      // A key lacking its colon is left alone; anything else followed by a string on a new line lacks a comma.
      value_ended = j < n && content[j] == '"' && !may_be_key && has_newline(content, i, j);
      if (!value_ended) continue;
    } else if (c == '{' || c == '[') {
      stack.push_back(c);
      prev_sig = c;
      out.push_back(c);
      ++i;
      continue;
    } else if (c == '}' || c == ']') {
      if (!stack.empty()) stack.pop_back();
      prev_sig = c;
      out.push_back(c);
      ++i;
      size_t j = skip_ws(content, i);
      value_ended = !stack.empty() && j < n && starts_value(content[j]);
      if (!value_ended) continue;
    } else if (detail::is_alpha(c) || detail::is_digit(c) || c == '-') {
      size_t j = i;
      while (j < n && (detail::is_ident_char(content[j]) || content[j] == '.' || content[j] == '-' || content[j] == '+')) ++j;
      std::string tok = content.substr(i, j - i);
      bool after_value_slot = prev_sig == ':' || prev_sig == '[' || prev_sig == ',';
      out += tok;
      i = j;
      prev_sig = tok.back();
      size_t k = skip_ws(content, i);
      value_ended = after_value_slot && is_scalar_token(tok) && k < n && content[k] == '"' && has_newline(content, i, k);
      if (!value_ended) continue;
    } else {
      if (!is_space(c)) prev_sig = c;
      out.push_back(c);
      ++i;
      continue;
    }

    // value_ended: insert the comma right after the value.
    out.push_back(',');
    prev_sig = ',';
    ++inserted;
  }

  SanitizerResult r;
  r.changed = inserted > 0;
  r.content = r.changed ? std::move(out) : content;
  if (r.changed) {
    r.description = "Inserted missing commas";
    r.diagnostics.push_back("Inserted " + std::to_string(inserted) + " missing comma(s) between elements");
    detail::cap_diagnostics(r.diagnostics, config.max_diagnostics_per_stage);
  }
  return r;
}

SanitizerResult remove_trailing_commas(const std::string& content, const SanitizerConfig& config) {
  // Remove commas immediately before } or ] (ignoring whitespace), while skipping string literals.
  std::string out;
  out.reserve(content.size());
  bool in_str = false;
  bool escape = false;
  size_t dropped = 0;

  for (size_t i = 0; i < content.size(); ++i) {
    char c = content[i];
    if (in_str) {
      out.push_back(c);
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_str = false;
      }
      continue;
    }

    if (c == '"') {
      in_str = true;
      out.push_back(c);
      continue;
    }

    if (c == ',') {
      size_t j = skip_ws(content, i + 1);
      if (j < content.size() && (content[j] == '}' || content[j] == ']' || content[j] == ',')) {
        ++dropped;
        continue;
      }
    }

    out.push_back(c);
  }

  SanitizerResult r;
  r.changed = dropped > 0;
  r.content = r.changed ? std::move(out) : content;
  if (r.changed) {
    r.description = "Removed trailing commas";
    r.diagnostics.push_back("Removed " + std::to_string(dropped) + " trailing or duplicated comma(s)");
    detail::cap_diagnostics(r.diagnostics, config.max_diagnostics_per_stage);
  }
  return r;
}

// ---------------- Truncated structures ----------------

namespace {

const char* literal_completion(const std::string& tail) {
  static const char* const kLiterals[] = {"true", "false", "null"};
  for (const char* lit : kLiterals) {
    std::string l(lit);
    if (!tail.empty() && tail.size() < l.size() && l.compare(0, tail.size(), tail) == 0) return lit;
  }
  return nullptr;
}

}  // namespace

SanitizerResult close_truncated_structures(const std::string& content, const SanitizerConfig& config) {
  SanitizerResult r;

  // Pass 1: repair mismatched and surplus closers.
  std::string s;
  s.reserve(content.size() + 16);
  std::string stack;
  bool in_str = false;
  bool escape = false;
  size_t mismatched = 0;
  size_t surplus = 0;
  // Closers from here on are only surplus candidates when nothing but closers follows.
  size_t closer_tail = content.size();
  while (closer_tail > 0 && std::string("}] \t\r\n").find(content[closer_tail - 1]) != std::string::npos) --closer_tail;
  for (size_t i = 0; i < content.size(); ++i) {
    char c = content[i];
    if (in_str) {
      s.push_back(c);
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_str = false;
      }
      continue;
    }
    if (c == '"') {
      in_str = true;
    } else if (c == '{' || c == '[') {
      stack.push_back(c);
      if (stack.size() > config.max_nesting_depth) {
        r.content = content;
        r.diagnostics.push_back("Nesting deeper than " + std::to_string(config.max_nesting_depth) +
                                " levels; structure left unchanged");
        return r;
      }
    } else if (c == '}' || c == ']') {
      if (stack.empty()) {
        if (i >= closer_tail) {
          ++surplus;
          continue;
        }
      } else {
        char expected = stack.back() == '{' ? '}' : ']';
        if (c != expected) {
          c = expected;
          ++mismatched;
        }
        stack.pop_back();
      }
    }
    s.push_back(c);
  }

  if (mismatched) r.diagnostics.push_back("Fixed " + std::to_string(mismatched) + " mismatched closing delimiter(s)");
  if (surplus) r.diagnostics.push_back("Removed " + std::to_string(surplus) + " surplus closing delimiter(s)");

  // Pass 2: complete the tail.
  if (in_str) {
    size_t slashes = 0;
    while (slashes < s.size() && s[s.size() - 1 - slashes] == '\\') ++slashes;
    if (slashes % 2 == 1) s.pop_back();
    s.push_back('"');
    r.diagnostics.push_back("Closed unterminated string");
  }

  if (!stack.empty()) {
    while (!s.empty() && is_space(s.back())) s.pop_back();
    size_t last = s.empty() ? std::string::npos : s.size() - 1;

    if (last != std::string::npos && s[last] == ',') {
      s.pop_back();
      r.diagnostics.push_back("Removed dangling comma before truncation point");
    } else if (last != std::string::npos && s[last] == ':') {
      s += " null";
      r.diagnostics.push_back("Completed dangling property with null");
    } else if (last != std::string::npos && s[last] == '"' && stack.back() == '{') {
      StringContextMap strings(s);
      size_t open = last;
      // Find the opening quote of the final string.
      while (open > 0) {
        --open;
        if (s[open] == '"' && !strings.in_string(open)) break;
      }
      size_t before = detail::prev_non_ws(s, open);
      if (before != std::string::npos && (s[before] == ',' || s[before] == '{')) {
        // The final string is a property name with no value.
        size_t cut = s[before] == ',' ? before : before + 1;
        if (s.size() - cut <= config.truncation_safety_buffer) {
          s.erase(cut);
          r.diagnostics.push_back("Removed dangling property name at truncation point");
        } else {
          s += ": null";
          r.diagnostics.push_back("Completed dangling property with null");
        }
      }
    } else if (last != std::string::npos) {
      size_t tok_start = last + 1;
      while (tok_start > 0 && (detail::is_alpha(s[tok_start - 1]) || detail::is_digit(s[tok_start - 1]) ||
                               s[tok_start - 1] == '.' || s[tok_start - 1] == '-' || s[tok_start - 1] == '+')) {
        --tok_start;
      }
      std::string tok = s.substr(tok_start);
      if (const char* lit = literal_completion(tok)) {
        s.replace(tok_start, std::string::npos, lit);
        r.diagnostics.push_back("Completed truncated literal '" + tok + "'");
      } else if (!tok.empty() && tok.size() <= config.truncation_safety_buffer &&
                 (tok[0] == '-' || detail::is_digit(tok[0]))) {
        size_t keep = tok.size();
        while (keep > 0 && std::string(".-+eE").find(tok[keep - 1]) != std::string::npos) --keep;
        if (keep < tok.size()) {
          s.erase(tok_start + keep);
          r.diagnostics.push_back("Trimmed truncated number '" + tok + "'");
        }
      }
      // Trimming may expose a dangling separator.
      while (!s.empty() && is_space(s.back())) s.pop_back();
      if (!s.empty() && s.back() == ',') {
        s.pop_back();
      } else if (!s.empty() && s.back() == ':') {
        s += " null";
      }
    }

    std::string closers;
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) closers.push_back(*it == '{' ? '}' : ']');
    s += closers;
    r.diagnostics.push_back("Closed " + std::to_string(stack.size()) + " unclosed structure(s) with '" + closers + "'");
  }

  r.changed = s != content;
  r.content = r.changed ? std::move(s) : content;
  if (r.changed) {
    r.description = "Completed truncated structures";
    detail::cap_diagnostics(r.diagnostics, config.max_diagnostics_per_stage);
  } else {
    r.diagnostics.clear();
  }
  return r;
}

}  // namespace completion_repair
