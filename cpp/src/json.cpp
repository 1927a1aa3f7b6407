#include "internal.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <unordered_map>

namespace completion_repair {

// ---------------- Json helpers ----------------

bool Json::is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
bool Json::is_bool() const { return std::holds_alternative<bool>(value); }
bool Json::is_number() const { return std::holds_alternative<double>(value); }
bool Json::is_string() const { return std::holds_alternative<std::string>(value); }
bool Json::is_array() const { return std::holds_alternative<JsonArray>(value); }
bool Json::is_object() const { return std::holds_alternative<JsonObject>(value); }

const bool& Json::as_bool() const { return std::get<bool>(value); }
const double& Json::as_number() const { return std::get<double>(value); }
const std::string& Json::as_string() const { return std::get<std::string>(value); }
const JsonArray& Json::as_array() const { return std::get<JsonArray>(value); }
const JsonObject& Json::as_object() const { return std::get<JsonObject>(value); }

JsonArray& Json::as_array() { return std::get<JsonArray>(value); }
JsonObject& Json::as_object() { return std::get<JsonObject>(value); }

JsonObject::iterator JsonObject::find(const std::string& key) {
  return std::find_if(items_.begin(), items_.end(), [&](const value_type& kv) { return kv.first == key; });
}

JsonObject::const_iterator JsonObject::find(const std::string& key) const {
  return std::find_if(items_.begin(), items_.end(), [&](const value_type& kv) { return kv.first == key; });
}

Json& JsonObject::at(const std::string& key) {
  auto it = find(key);
  if (it == items_.end()) throw std::out_of_range("JsonObject::at: missing key " + key);
  return it->second;
}

const Json& JsonObject::at(const std::string& key) const {
  auto it = find(key);
  if (it == items_.end()) throw std::out_of_range("JsonObject::at: missing key " + key);
  return it->second;
}

Json& JsonObject::operator[](const std::string& key) {
  auto it = find(key);
  if (it != items_.end()) return it->second;
  items_.emplace_back(key, Json());
  return items_.back().second;
}

std::pair<JsonObject::iterator, bool> JsonObject::emplace(std::string key, Json value) {
  auto it = find(key);
  if (it != items_.end()) return {it, false};
  items_.emplace_back(std::move(key), std::move(value));
  return {items_.end() - 1, true};
}

size_t JsonObject::erase(const std::string& key) {
  auto it = find(key);
  if (it == items_.end()) return 0;
  items_.erase(it);
  return 1;
}

bool JsonObject::rename(const std::string& from, const std::string& to) {
  if (from == to || contains(to)) return false;
  auto it = find(from);
  if (it == items_.end()) return false;
  it->first = to;
  return true;
}

// ---------------- shared text helpers ----------------

namespace detail {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim_copy(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::ostringstream oss;
          oss << "\\u";
          oss.setf(std::ios::hex, std::ios::basefield);
          oss.width(4);
          oss.fill('0');
          oss << (static_cast<int>(static_cast<unsigned char>(c)));
          out += oss.str();
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains_name(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

size_t skip_ws(const std::string& s, size_t i) {
  while (i < s.size() && is_space(s[i])) ++i;
  return i;
}

size_t prev_non_ws(const std::string& s, size_t i) {
  while (i > 0) {
    --i;
    if (!is_space(s[i])) return i;
  }
  return std::string::npos;
}

size_t string_end(const std::string& s, size_t open_quote) {
  bool escape = false;
  for (size_t i = open_quote + 1; i < s.size(); ++i) {
    char c = s[i];
    if (escape) {
      escape = false;
    } else if (c == '\\') {
      escape = true;
    } else if (c == '"') {
      return i + 1;
    }
  }
  return std::string::npos;
}

void cap_diagnostics(std::vector<std::string>& diagnostics, size_t cap) {
  if (diagnostics.size() <= cap) return;
  size_t extra = diagnostics.size() - cap;
  diagnostics.resize(cap);
  diagnostics.push_back("... and " + std::to_string(extra) + " more");
}

SanitizerResult unchanged(const std::string& content) {
  SanitizerResult r;
  r.content = content;
  return r;
}

}  // namespace detail

using detail::is_digit;
using detail::is_space;

std::string dumps_json(const Json& value) {
  if (value.is_null()) return "null";
  if (value.is_bool()) return value.as_bool() ? "true" : "false";
  if (value.is_number()) {
    double n = value.as_number();
    if (std::isfinite(n)) {
      // Prefer integer formatting when exact.
      double intpart;
      if (std::modf(n, &intpart) == 0.0 && std::fabs(n) < 1e17) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(0);
        oss << n;
        return oss.str();
      }
      std::ostringstream oss;
      oss.precision(15);
      oss << n;
      return oss.str();
    }
    return "null";
  }
  if (value.is_string()) return "\"" + detail::json_escape(value.as_string()) + "\"";
  if (value.is_array()) {
    std::string out = "[";
    const auto& arr = value.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",";
      out += dumps_json(arr[i]);
    }
    out += "]";
    return out;
  }
  const auto& obj = value.as_object();
  std::string out = "{";
  bool first = true;
  for (const auto& kv : obj) {
    if (!first) out += ",";
    first = false;
    out += "\"" + detail::json_escape(kv.first) + "\":" + dumps_json(kv.second);
  }
  out += "}";
  return out;
}

bool json_equals(const Json& a, const Json& b) {
  if (a.value.index() != b.value.index()) return false;
  if (a.is_null()) return true;
  if (a.is_bool()) return a.as_bool() == b.as_bool();
  if (a.is_number()) return a.as_number() == b.as_number();
  if (a.is_string()) return a.as_string() == b.as_string();
  if (a.is_array()) {
    const auto& x = a.as_array();
    const auto& y = b.as_array();
    if (x.size() != y.size()) return false;
    for (size_t i = 0; i < x.size(); ++i) {
      if (!json_equals(x[i], y[i])) return false;
    }
    return true;
  }
  // Objects compare as unordered mappings.
  const auto& x = a.as_object();
  const auto& y = b.as_object();
  if (x.size() != y.size()) return false;
  for (const auto& kv : x) {
    auto it = y.find(kv.first);
    if (it == y.end() || !json_equals(kv.second, it->second)) return false;
  }
  return true;
}

// ---------------- strict JSON parser ----------------

namespace {

constexpr size_t kMaxParseDepth = 512;

struct ParseFailure {
  std::string message;
  size_t offset;
};

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  size_t depth{0};

  explicit Parser(const std::string& in) : s(in) {}

  void skip_ws() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const { throw ParseFailure{msg, i}; }

  bool consume(char c) {
    skip_ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  Json parse_value() {
    skip_ws();
    if (i >= s.size()) fail("unexpected end of input");
    char c = s[i];
    if (c == '{') return parse_object();
    if (c == '[') return parse_array();
    if (c == '"') return Json(parse_string());
    if (c == 't') return parse_literal("true", Json(true));
    if (c == 'f') return parse_literal("false", Json(false));
    if (c == 'n') return parse_literal("null", Json(nullptr));
    if (c == '-' || is_digit(c)) return Json(parse_number());
    fail(std::string("unexpected character '") + c + "'");
  }

  void enter() {
    if (++depth > kMaxParseDepth) fail("nesting too deep");
  }

  Json parse_object() {
    enter();
    ++i;
    std::vector<JsonObject::value_type> items;
    if (consume('}')) {
      --depth;
      return Json(JsonObject());
    }
    // Key -> position in `items`; a repeated key overwrites in place.
    std::unordered_map<std::string, size_t> index;
    while (true) {
      skip_ws();
      if (i >= s.size()) fail("unterminated object");
      if (s[i] != '"') fail("expected string key");
      std::string key = parse_string();
      if (!consume(':')) fail("expected ':' after key");
      Json val = parse_value();
      auto seen = index.find(key);
      if (seen != index.end()) {
        items[seen->second].second = std::move(val);
      } else {
        index.emplace(key, items.size());
        items.emplace_back(std::move(key), std::move(val));
      }
      if (consume('}')) break;
      if (!consume(',')) fail(i >= s.size() ? "unterminated object" : "expected ',' or '}'");
    }
    --depth;
    return Json(JsonObject(std::move(items)));
  }

  Json parse_array() {
    enter();
    ++i;
    JsonArray arr;
    if (consume(']')) {
      --depth;
      return Json(std::move(arr));
    }
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      if (!consume(',')) fail(i >= s.size() ? "unterminated array" : "expected ',' or ']'");
    }
    --depth;
    return Json(std::move(arr));
  }

  uint32_t parse_hex4() {
    if (i + 4 > s.size()) fail("bad unicode escape");
    uint32_t v = 0;
    for (int k = 0; k < 4; ++k) {
      char h = s[i++];
      v <<= 4;
      if (h >= '0' && h <= '9') {
        v |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        v |= static_cast<uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        v |= static_cast<uint32_t>(h - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
    }
    return v;
  }

  std::string parse_string() {
    ++i;  // opening quote
    std::string out;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        --i;
        fail("control character in string");
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= s.size()) fail("unterminated string");
      char e = s[i++];
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          uint32_t cp = parse_hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            size_t save = i;
            i += 2;
            uint32_t lo = parse_hex4();
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            } else {
              i = save;
            }
          }
          // Unpaired surrogate halves have no UTF-8 encoding.
          if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;
          append_utf8(out, cp);
          break;
        }
        default:
          --i;
          fail(std::string("invalid escape '\\") + e + "'");
      }
    }
    fail("unterminated string");
  }

  double parse_number() {
    size_t start = i;
    if (s[i] == '-') ++i;
    if (i >= s.size() || !is_digit(s[i])) fail("invalid number");
    if (s[i] == '0') {
      ++i;
    } else {
      while (i < s.size() && is_digit(s[i])) ++i;
    }
    if (i < s.size() && s[i] == '.') {
      ++i;
      if (i >= s.size() || !is_digit(s[i])) fail("invalid number");
      while (i < s.size() && is_digit(s[i])) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !is_digit(s[i])) fail("invalid number");
      while (i < s.size() && is_digit(s[i])) ++i;
    }
    std::string num = s.substr(start, i - start);
    return std::strtod(num.c_str(), nullptr);
  }

  Json parse_literal(const char* word, Json value) {
    std::string w(word);
    if (s.compare(i, w.size(), w) != 0) fail("invalid literal");
    i += w.size();
    return value;
  }
};

}  // namespace

JsonParseResult try_parse_json(const std::string& text) {
  JsonParseResult r;
  Parser p(text);
  try {
    Json v = p.parse_value();
    p.skip_ws();
    if (p.i != text.size()) {
      r.error = "unexpected trailing data";
      r.error_offset = p.i;
      return r;
    }
    r.value = std::move(v);
  } catch (const ParseFailure& f) {
    r.error = f.message;
    r.error_offset = f.offset;
  }
  return r;
}

Json parse_json(const std::string& text) {
  JsonParseResult r = try_parse_json(text);
  if (!r.value) {
    throw ValidationError("JSON parse error at offset " + std::to_string(r.error_offset) + ": " + r.error, "$", "parse");
  }
  return std::move(*r.value);
}

}  // namespace completion_repair
