#include "completion_repair.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace completion_repair;

static void test_is_in_string_at_basic() {
  const std::string s = "{\"a\": \"b, c\", \"d\": 1}";
  assert(!is_in_string_at(0, s));
  assert(is_in_string_at(2, s));    // inside "a"
  assert(!is_in_string_at(4, s));   // at the colon
  assert(is_in_string_at(8, s));    // the comma inside "b, c"
  assert(!is_in_string_at(12, s));  // the comma after "b, c"
}

static void test_is_in_string_at_escapes() {
  const std::string s = "{\"a\": \"x\\\"y\", \"b\": 2}";
  // The escaped quote does not close the string.
  assert(is_in_string_at(s.find('y'), s));
  assert(!is_in_string_at(s.find("\"b\""), s));

  const std::string slashes = "[\"a\\\\\", 1]";
  // "a\\" ends at the quote after the escaped backslash.
  assert(!is_in_string_at(slashes.find(','), slashes));
}

static void test_string_context_map_matches_scan() {
  const std::string s = "{\"k\\\"ey\": [\"v1\", \"v\\\\2\"], \"open\": \"unterminated";
  StringContextMap map(s);
  for (size_t i = 0; i <= s.size(); ++i) {
    assert(map.in_string(i) == is_in_string_at(i, s));
  }
  assert(map.ends_in_string());
  assert(!StringContextMap("{\"a\":1}").ends_in_string());
}

static void test_array_and_object_context() {
  const std::string s = "{\"items\": [\"a\", {\"k\": 1}, \"b\"], \"x\": {\"y\": [1]}}";
  assert(is_in_array_context(s.find("\"b\""), s));
  assert(is_in_object_context(s.find("\"k\""), s));
  assert(is_in_object_context(s.find("\"x\""), s));
  // A bracket inside a string does not open an array.
  const std::string t = "{\"a\": \"[not\", \"b\": 1}";
  assert(is_in_object_context(t.find("\"b\""), t));
  assert(!is_in_array_context(t.find("\"b\""), t));
}

static void test_context_lookback_window() {
  std::string s = "[" + std::string(600, ' ') + "\"x\"";
  assert(!is_in_array_context(s.size(), s, 500));
  assert(is_in_array_context(s.size(), s, 700));
}

static void test_find_json_value_end() {
  const std::string s = "{\"a\": {\"b\": \"}\"}, \"c\": [1, [2]], \"d\": 12 , \"e\": \"x\"}";
  size_t a = s.find(':') + 1;
  auto end_a = find_json_value_end(s, a);
  assert(end_a && s.substr(*end_a, 1) == ",");

  size_t c = s.find("\"c\"") + 4;
  auto end_c = find_json_value_end(s, c);
  assert(end_c && s.substr(c, *end_c - c) == " [1, [2]]");

  size_t d = s.find("\"d\"") + 4;
  auto end_d = find_json_value_end(s, d);
  assert(end_d && s.substr(d, *end_d - d) == " 12");

  assert(!find_json_value_end("{\"a\": [1, 2", 6));
  assert(!find_json_value_end("\"open", 0));
}

static void test_scan_structure() {
  auto st = scan_structure("{\"a\": [1, {\"b\": \"]}");
  assert(st.open == "{[{");
  assert(st.in_string);

  auto closed = scan_structure("{\"a\": [1]}");
  assert(closed.open.empty());
  assert(!closed.in_string);
}

int main() {
  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("is_in_string_at_basic", test_is_in_string_at_basic);
    run("is_in_string_at_escapes", test_is_in_string_at_escapes);
    run("string_context_map_matches_scan", test_string_context_map_matches_scan);
    run("array_and_object_context", test_array_and_object_context);
    run("context_lookback_window", test_context_lookback_window);
    run("find_json_value_end", test_find_json_value_end);
    run("scan_structure", test_scan_structure);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
