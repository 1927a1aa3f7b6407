#include "internal.hpp"

#include <algorithm>

namespace completion_repair {

bool is_in_string_at(size_t position, const std::string& content) {
  bool in_str = false;
  bool escape = false;
  size_t limit = std::min(position, content.size());
  for (size_t i = 0; i < limit; ++i) {
    char c = content[i];
    if (in_str) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_str = false;
      }
    } else if (c == '"') {
      in_str = true;
    }
  }
  return in_str;
}

StringContextMap::StringContextMap(const std::string& content) : flags_(content.size() + 1, false) {
  bool in_str = false;
  bool escape = false;
  for (size_t i = 0; i < content.size(); ++i) {
    flags_[i] = in_str;
    char c = content[i];
    if (in_str) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_str = false;
      }
    } else if (c == '"') {
      in_str = true;
    }
  }
  flags_[content.size()] = in_str;
  ends_in_string_ = in_str;
}

bool StringContextMap::in_string(size_t position) const {
  if (position >= flags_.size()) return ends_in_string_;
  return flags_[position];
}

// Walks backwards from `index`, skipping closed containers, and reports the innermost
// unclosed opener inside the window ('\0' when none is found).
static char enclosing_container(size_t index, const std::string& content, size_t lookback) {
  size_t limit = std::min(index, content.size());
  size_t floor = limit > lookback ? limit - lookback : 0;
  int braces = 0;
  int brackets = 0;
  bool in_str = false;
  for (size_t i = limit; i > floor; --i) {
    char c = content[i - 1];
    if (c == '"') {
      size_t slashes = 0;
      size_t j = i - 1;
      while (j > floor && content[j - 1] == '\\') {
        ++slashes;
        --j;
      }
      if (slashes % 2 == 0) in_str = !in_str;
      continue;
    }
    if (in_str) continue;
    switch (c) {
      case '}': ++braces; break;
      case ']': ++brackets; break;
      case '{':
        if (braces == 0) return '{';
        --braces;
        break;
      case '[':
        if (brackets == 0) return '[';
        --brackets;
        break;
      default: break;
    }
  }
  return '\0';
}

bool is_in_array_context(size_t index, const std::string& content, size_t lookback) {
  return enclosing_container(index, content, lookback) == '[';
}

bool is_in_object_context(size_t index, const std::string& content, size_t lookback) {
  return enclosing_container(index, content, lookback) == '{';
}

std::optional<size_t> find_json_value_end(const std::string& content, size_t start) {
  size_t i = detail::skip_ws(content, start);
  if (i >= content.size()) return std::nullopt;

  char first = content[i];
  if (first == '"') {
    size_t end = detail::string_end(content, i);
    if (end == std::string::npos) return std::nullopt;
    return end;
  }

  if (first == '{' || first == '[') {
    std::string stack;
    for (; i < content.size(); ++i) {
      char c = content[i];
      if (c == '"') {
        size_t end = detail::string_end(content, i);
        if (end == std::string::npos) return std::nullopt;
        i = end - 1;
        continue;
      }
      if (c == '{' || c == '[') {
        stack.push_back(c);
      } else if (c == '}' || c == ']') {
        if (stack.empty()) return std::nullopt;
        stack.pop_back();
        if (stack.empty()) return i + 1;
      }
    }
    return std::nullopt;
  }

  // Bare scalar: runs to the next delimiter.
  while (i < content.size()) {
    char c = content[i];
    if (c == ',' || c == '}' || c == ']' || c == '\n' || c == '\r') break;
    ++i;
  }
  while (i > start && detail::is_space(content[i - 1])) --i;
  return i;
}

StructureState scan_structure(const std::string& content) {
  StructureState st;
  bool escape = false;
  for (char c : content) {
    if (st.in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        st.in_string = false;
      }
      continue;
    }
    if (c == '"') {
      st.in_string = true;
    } else if (c == '{' || c == '[') {
      st.open.push_back(c);
    } else if ((c == '}' || c == ']') && !st.open.empty()) {
      st.open.pop_back();
    }
  }
  return st;
}

}  // namespace completion_repair
