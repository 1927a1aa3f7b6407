#pragma once

#include "completion_repair.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace completion_repair {
namespace detail {

inline bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
inline bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
inline bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
inline bool is_ident_start(char c) { return is_alpha(c) || c == '_' || c == '$'; }
inline bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

std::string to_lower(std::string s);
std::string trim_copy(const std::string& s);
std::string json_escape(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
bool contains_name(const std::vector<std::string>& names, const std::string& name);

// Index of the first non-whitespace character at or after `i` (s.size() if none).
size_t skip_ws(const std::string& s, size_t i);
// Index of the last non-whitespace character before `i`, or npos.
size_t prev_non_ws(const std::string& s, size_t i);

// Offset just past the closing quote of the string opening at `open_quote`, or npos if unterminated.
size_t string_end(const std::string& s, size_t open_quote);

// Keeps the first `cap` diagnostics and summarizes the rest in one trailing entry.
void cap_diagnostics(std::vector<std::string>& diagnostics, size_t cap);

SanitizerResult unchanged(const std::string& content);

// Prose detection shared by the commentary rules.
bool looks_like_prose(const std::string& text);
bool looks_like_filename(const std::string& text);

}  // namespace detail
}  // namespace completion_repair
