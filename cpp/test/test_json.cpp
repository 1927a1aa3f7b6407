#include "completion_repair.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace completion_repair;

static void test_parse_strict_document() {
  auto r = try_parse_json(" {\"name\": \"Ada\", \"tags\": [\"x\", 1, true, null], \"n\": -1.5e2} ");
  assert(r.value);
  const auto& obj = r.value->as_object();
  assert(obj.at("name").as_string() == "Ada");
  assert(obj.at("tags").as_array().size() == 4);
  assert(obj.at("tags").as_array()[3].is_null());
  assert(obj.at("n").as_number() == -150.0);
}

static void test_parse_rejects_lenient_input() {
  assert(!try_parse_json("{\"a\":1,}").value);
  assert(!try_parse_json("{a:1}").value);
  assert(!try_parse_json("{'a':1}").value);
  assert(!try_parse_json("[01]").value);
  assert(!try_parse_json("{\"a\":\"line\nbreak\"}").value);
  assert(!try_parse_json("").value);

  auto r = try_parse_json("{\"a\":1} trailing");
  assert(!r.value);
  assert(r.error_offset == 8);
}

static void test_parse_duplicate_keys_last_wins() {
  Json v = parse_json("{\"a\":1,\"b\":2,\"a\":3}");
  const auto& obj = v.as_object();
  assert(obj.size() == 2);
  assert(obj.at("a").as_number() == 3);
  // First occurrence keeps its position.
  assert(obj.begin()->first == "a");
}

static void test_parse_unicode_escapes() {
  Json v = parse_json("\"\\u00e9\\ud83d\\ude00\"");
  assert(v.as_string() == "\xC3\xA9\xF0\x9F\x98\x80");
}

static void test_parse_lone_surrogates_replaced() {
  assert(parse_json("\"a\\ud800b\"").as_string() == "a\xEF\xBF\xBD" "b");
  assert(parse_json("\"\\udc00\"").as_string() == "\xEF\xBF\xBD");
  // A high half followed by a non-low escape keeps the second escape.
  assert(parse_json("\"\\ud800\\u0041\"").as_string() == "\xEF\xBF\xBD" "A");
}

static void test_parse_wide_object() {
  std::string doc = "{";
  for (int k = 0; k < 20000; ++k) {
    if (k) doc += ",";
    doc += "\"k" + std::to_string(k) + "\":" + std::to_string(k);
  }
  doc += ",\"k7\":-1}";
  Json v = parse_json(doc);
  const auto& obj = v.as_object();
  assert(obj.size() == 20000);
  assert(obj.begin()->first == "k0");
  assert(obj.at("k19999").as_number() == 19999);
  assert(obj.at("k7").as_number() == -1);
}

static void test_parse_json_throws_parse_kind() {
  try {
    (void)parse_json("{\"a\":");
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.kind == "parse");
    assert(std::string(e.what()).find("offset") != std::string::npos);
  }
}

static void test_parse_depth_limit() {
  std::string deep(2000, '[');
  deep += std::string(2000, ']');
  auto r = try_parse_json(deep);
  assert(!r.value);
  assert(!r.error.empty());
}

static void test_dumps_json_roundtrip() {
  JsonObject o{{"b", 1}, {"a", JsonArray{Json(1.5), Json("x\"y"), Json(nullptr)}}};
  assert(dumps_json(Json(o)) == "{\"b\":1,\"a\":[1.5,\"x\\\"y\",null]}");
  assert(json_equals(parse_json(dumps_json(Json(o))), Json(o)));
}

static void test_json_equals_ignores_key_order() {
  assert(json_equals(parse_json("{\"a\":1,\"b\":[1,2]}"), parse_json("{\"b\":[1,2],\"a\":1}")));
  assert(!json_equals(parse_json("[1,2]"), parse_json("[2,1]")));
  assert(!json_equals(Json(1), Json("1")));
}

static void test_object_rename_keeps_position() {
  JsonObject o{{"x", 1}, {"name_", 2}, {"z", 3}};
  assert(o.rename("name_", "name"));
  assert(!o.rename("missing", "q"));
  assert(!o.rename("x", "z"));
  auto it = o.begin();
  ++it;
  assert(it->first == "name");
  assert(o.erase("x") == 1);
  assert(o.size() == 2);
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
    run("parse_strict_document", test_parse_strict_document);
    run("parse_rejects_lenient_input", test_parse_rejects_lenient_input);
    run("parse_duplicate_keys_last_wins", test_parse_duplicate_keys_last_wins);
    run("parse_unicode_escapes", test_parse_unicode_escapes);
    run("parse_lone_surrogates_replaced", test_parse_lone_surrogates_replaced);
    run("parse_wide_object", test_parse_wide_object);
    run("parse_json_throws_parse_kind", test_parse_json_throws_parse_kind);
    run("parse_depth_limit", test_parse_depth_limit);
    run("dumps_json_roundtrip", test_dumps_json_roundtrip);
    run("json_equals_ignores_key_order", test_json_equals_ignores_key_order);
    run("object_rename_keeps_position", test_object_rename_keeps_position);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
