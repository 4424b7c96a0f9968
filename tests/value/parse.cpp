#include <cassert>
#include <iostream>
#include "avroinfer/value.hpp"

using namespace avroinfer;

void test_keeps_key_order() {
  std::cout << "test_keeps_key_order...\n";
  auto v = parse_document(R"({"zeta":1,"alpha":2,"mid":3})");
  assert(v.is_object());
  const auto& obj = v.as_object();
  assert(obj.size() == 3);
  assert(obj[0].first == "zeta");
  assert(obj[1].first == "alpha");
  assert(obj[2].first == "mid");
  std::cout << "  [PASS]\n";
}

void test_duplicate_keys_last_wins() {
  std::cout << "test_duplicate_keys_last_wins...\n";
  auto v = parse_document(R"({"a":1,"a":"x"})");
  const auto& obj = v.as_object();
  assert(obj.size() == 1);
  assert(obj[0].second.is_string());
  std::cout << "  [PASS]\n";
}

void test_number_lexemes() {
  std::cout << "test_number_lexemes...\n";
  auto v = parse_document(R"([12, -7, 1e16, 11.5, 1202021022234434333333444444444444444444443333, 18446744073709551615])");
  const auto& arr = v.as_array();
  assert(arr[0].as_number().integral && arr[0].as_number().lexeme == "12");
  assert(arr[1].as_number().integral && arr[1].as_number().lexeme == "-7");
  assert(!arr[2].as_number().integral);
  assert(!arr[3].as_number().integral);
  // Too wide for 64 bits, still integral
  assert(arr[4].as_number().integral);
  assert(arr[4].as_number().lexeme == "1202021022234434333333444444444444444444443333");
  assert(arr[5].as_number().integral);
  assert(arr[5].as_number().lexeme == "18446744073709551615");
  std::cout << "  [PASS]\n";
}

void test_invalid_text() {
  std::cout << "test_invalid_text...\n";
  auto r = try_parse_document("{\"a\": }");
  assert(!r.ok());
  assert(r.error().kind == ErrorKind::Parse);

  auto trailing = try_parse_document("{\"a\": 1} extra");
  assert(!trailing.ok());

  auto comma = try_parse_document("{\"a\": 1,}");
  assert(!comma.ok());
  assert(comma.error().kind == ErrorKind::Parse);
  auto array_comma = try_parse_document("{\"a\": [1, 2,]}");
  assert(!array_comma.ok());
  assert(array_comma.error().kind == ErrorKind::Parse);

  bool threw = false;
  try { parse_document("[1, 2"); } catch (const ParseError&) { threw = true; }
  assert(threw);
  std::cout << "  [PASS]\n";
}

void test_depth_limit() {
  std::cout << "test_depth_limit...\n";
  assert(try_parse_document("[[[1]]]", 3).ok());
  auto r = try_parse_document("[[[[1]]]]", 3);
  assert(!r.ok());
  assert(r.error().kind == ErrorKind::DepthLimit);

  bool threw = false;
  try { parse_document(R"({"a":{"b":{"c":{}}}})", 2); } catch (const DepthLimitError&) { threw = true; }
  assert(threw);
  std::cout << "  [PASS]\n";
}

void test_from_json() {
  std::cout << "test_from_json...\n";
  Json j = {{"i", 5}, {"d", 2.5}, {"s", "x"}, {"n", nullptr}, {"a", Json::array({true})}};
  auto v = from_json(j);
  assert(v.is_object());
  for (const auto& [key, child] : v.as_object()) {
    if (key == "i") assert(child.as_number().integral && child.as_number().lexeme == "5");
    if (key == "d") assert(!child.as_number().integral);
    if (key == "s") assert(child.is_string());
    if (key == "n") assert(child.is_null());
    if (key == "a") assert(child.is_array() && child.as_array()[0].is_boolean());
  }
  auto deep = try_from_json(Json::parse("[[[[0]]]]"), 2);
  assert(!deep.ok() && deep.error().kind == ErrorKind::DepthLimit);
  std::cout << "  [PASS]\n";
}

void test_read_messages() {
  std::cout << "test_read_messages...\n";
  auto many = read_messages(R"([{"A" : 12}, {"A" : 12}, {"B" : 12.5}])");
  assert(many.size() == 3);
  assert(many[2].as_object()[0].first == "B");
  auto one = read_messages(R"({"A": [1, 2]})");
  assert(one.size() == 1);
  assert(one[0].is_object());
  std::cout << "  [PASS]\n";
}

int main() {
  std::cout << "=== ParsedValue ===\n";
  test_keeps_key_order();
  test_duplicate_keys_last_wins();
  test_number_lexemes();
  test_invalid_text();
  test_depth_limit();
  test_from_json();
  test_read_messages();
  std::cout << "\n[OK] All parse tests passed! (7 tests)\n";
  return 0;
}
