#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "avroinfer/aggregator.hpp"

using namespace avroinfer;

static DeriveOptions quiet(Mode mode) {
  DeriveOptions options;
  options.mode = mode;
  options.log_sink = nullptr;
  return options;
}

static std::string make_message(int i, const std::string& extra) {
  std::string message = "{\"String\": \"" + std::to_string(i * 100) + "\", \"Integer\": " +
                        std::to_string(i) + ", \"Boolean\": " + (i % 2 == 0 ? "true" : "false");
  if (!extra.empty()) message += ", " + extra;
  return message + "}";
}

// Three shapes over seven messages: indices 0,3,6 carry "Long", 2,5 carry "Bool2"
static std::vector<std::string> seven_messages() {
  std::vector<std::string> out;
  for (int i = 0; i < 7; ++i) {
    if (i % 3 == 0) out.push_back(make_message(i, "\"Long\": " + std::to_string(i * 121202212)));
    else if (i % 3 == 2) out.push_back(make_message(i, "\"Bool2\": false"));
    else out.push_back(make_message(i, ""));
  }
  return out;
}

void test_identical_messages_single_group() {
  std::cout << "test_identical_messages_single_group...\n";
  std::vector<std::string> messages;
  for (int i = 0; i < 10; ++i) messages.push_back(make_message(i, ""));
  auto out = derive_multiple(messages, quiet(Mode::Strict));
  assert(out.size() == 1);
  assert(out[0].dump() ==
         R"({"schema":{"type":"record","name":"Record","fields":[{"name":"Boolean","type":"boolean"},{"name":"Integer","type":"int"},{"name":"String","type":"string"}]},"messagesMatched":[0,1,2,3,4,5,6,7,8,9],"numMessagesMatched":10})");
  std::cout << "  [PASS]\n";
}

void test_ranked_groups_strict() {
  std::cout << "test_ranked_groups_strict...\n";
  auto out = derive_multiple(seven_messages(), quiet(Mode::Strict));
  assert(out.size() == 3);
  assert(out[0].dump() ==
         R"({"schema":{"type":"record","name":"Record","fields":[{"name":"Boolean","type":"boolean"},{"name":"Integer","type":"int"},{"name":"Long","type":"int"},{"name":"String","type":"string"}]},"messagesMatched":[0,3,6],"numMessagesMatched":3})");
  assert(out[1].dump() ==
         R"({"schema":{"type":"record","name":"Record","fields":[{"name":"Boolean","type":"boolean"},{"name":"Integer","type":"int"},{"name":"String","type":"string"}]},"messagesMatched":[1,4],"numMessagesMatched":2})");
  assert(out[2].dump() ==
         R"({"schema":{"type":"record","name":"Record","fields":[{"name":"Bool2","type":"boolean"},{"name":"Boolean","type":"boolean"},{"name":"Integer","type":"int"},{"name":"String","type":"string"}]},"messagesMatched":[2,5],"numMessagesMatched":2})");
  std::cout << "  [PASS]\n";
}

void test_top_group_lenient() {
  std::cout << "test_top_group_lenient...\n";
  auto strict = derive_multiple(seven_messages(), quiet(Mode::Strict));
  auto lenient = derive_multiple(seven_messages(), quiet(Mode::Lenient));
  assert(lenient.size() == 1);
  assert(lenient[0].size() == 1);
  assert(lenient[0]["schema"] == strict[0]["schema"]);
  std::cout << "  [PASS]\n";
}

void test_max_groups_limit() {
  std::cout << "test_max_groups_limit...\n";
  auto options = quiet(Mode::Strict);
  options.max_groups = 2;
  assert(derive_multiple(seven_messages(), options).size() == 2);
  options.max_groups = 0;
  assert(derive_multiple(seven_messages(), options).size() == 1);

  Aggregator aggregator(quiet(Mode::Strict));
  std::vector<Result<ParsedValue>> docs;
  for (const auto& m : seven_messages()) docs.push_back(try_parse_document(m));
  docs.push_back(try_parse_document(R"({"other": 1})"));
  // rank() keeps every group; only the rendered output is capped
  assert(aggregator.rank(docs).size() == 4);
  assert(aggregator.try_aggregate(docs).value().size() == 3);
  std::cout << "  [PASS]\n";
}

void test_equal_counts_rank_by_first_member() {
  std::cout << "test_equal_counts_rank_by_first_member...\n";
  std::vector<std::string> messages = {R"({"b": "x"})", R"({"a": 1})", R"({"a": 2})", R"({"b": "y"})"};
  auto out = derive_multiple(messages, quiet(Mode::Strict));
  assert(out.size() == 2);
  assert(out[0]["messagesMatched"] == OrderedJson::array({0, 3}));
  assert(out[1]["messagesMatched"] == OrderedJson::array({1, 2}));
  std::cout << "  [PASS]\n";
}

void test_no_schema_derived() {
  std::cout << "test_no_schema_derived...\n";
  std::vector<std::string> messages = {R"({"String": "John Smith", "Arr": [1.5, true]})"};
  bool threw = false;
  try {
    derive_multiple(messages, quiet(Mode::Strict));
  } catch (const NoSchemaDerivedError& e) {
    threw = true;
    assert(e.kind() == ErrorKind::NoSchemaDerived);
  }
  assert(threw);

  auto lenient = derive_multiple(messages, quiet(Mode::Lenient));
  assert(lenient.size() == 1);
  assert(lenient[0].dump() ==
         R"({"schema":{"type":"record","name":"Record","fields":[{"name":"Arr","type":{"type":"array","items":"double"}},{"name":"String","type":"string"}]}})");

  // A failing document is only unmatched once another succeeds
  messages.push_back(R"({"String": "John", "Float": 1e16})");
  auto strict = derive_multiple(messages, quiet(Mode::Strict));
  assert(strict.size() == 1);
  assert(strict[0].dump() ==
         R"({"schema":{"type":"record","name":"Record","fields":[{"name":"Float","type":"double"},{"name":"String","type":"string"}]},"messagesMatched":[1],"numMessagesMatched":1})");

  // Both derive leniently with one member each; the earlier one wins
  lenient = derive_multiple(messages, quiet(Mode::Lenient));
  assert(lenient[0]["schema"]["fields"][0]["name"] == "Arr");

  threw = false;
  try {
    derive_multiple(std::vector<std::string>{}, quiet(Mode::Lenient));
  } catch (const NoSchemaDerivedError&) {
    threw = true;
  }
  assert(threw);
  std::cout << "  [PASS]\n";
}

void test_numeric_widening_folds_groups() {
  std::cout << "test_numeric_widening_folds_groups...\n";
  std::vector<std::string> messages = {
      R"({"name": "J", "Age": 13, "Date": 151109, "arr": [12, 45, 56]})",
      R"({"arr": [4.5], "Date": 151109, "Age": 13, "name": "J"})",
      R"({"Age": 13, "name": "J", "arr": [2121212], "Date": 151109})"};
  auto out = derive_multiple(messages, quiet(Mode::Strict));
  assert(out.size() == 1);
  assert(out[0].dump() ==
         R"({"schema":{"type":"record","name":"Record","fields":[{"name":"Age","type":"int"},{"name":"Date","type":"int"},{"name":"arr","type":{"type":"array","items":"double"}},{"name":"name","type":"string"}]},"messagesMatched":[0,1,2],"numMessagesMatched":3})");

  std::vector<std::string> nested = {
      R"({"J": {"name": "J", "Age": 13, "Date": 151109, "arr": [12, 45, 56]}})",
      R"({"J": {"arr": [1.4], "Date": 151109, "Age": 13, "name": "J"}})",
      R"({"J": {"Age": 13, "name": "J", "arr": [12, 45, 56], "Date": 151109}})"};
  out = derive_multiple(nested, quiet(Mode::Strict));
  assert(out.size() == 1);
  assert(out[0]["numMessagesMatched"] == 3);
  assert(out[0]["schema"]["fields"][0]["type"]["fields"][2]["type"]["items"] == "double");

  // Null is a shape of its own, not a narrower numeric
  out = derive_multiple(std::vector<std::string>{R"({"a": null})", R"({"a": 1})"}, quiet(Mode::Strict));
  assert(out.size() == 2);
  std::cout << "  [PASS]\n";
}

void test_unparsable_messages_unmatched() {
  std::cout << "test_unparsable_messages_unmatched...\n";
  std::vector<std::string> warnings;
  auto options = quiet(Mode::Strict);
  options.log_level = LogLevel::Warning;
  options.log_sink = [&warnings](LogLevel level, const std::string& message, const std::string& logger) {
    assert(logger == "avroinfer.aggregator");
    if (level == LogLevel::Warning) warnings.push_back(message);
  };
  std::vector<std::string> messages = {R"({"a": 1})", "{not json", R"([1, 2])", R"({"a": 2})"};
  auto out = derive_multiple(messages, options);
  assert(out.size() == 1);
  assert(out[0]["messagesMatched"] == OrderedJson::array({0, 3}));
  assert(warnings.size() == 2);
  assert(warnings[0].find("message 1") != std::string::npos);
  assert(warnings[0].find("ParseError") != std::string::npos);
  assert(warnings[1].find("InvalidStructureError") != std::string::npos);
  std::cout << "  [PASS]\n";
}

void test_parsed_value_overload() {
  std::cout << "test_parsed_value_overload...\n";
  auto docs = read_messages(R"([{"A": 12}, {"A": 12}, {"B": 12.5}])");
  assert(docs.size() == 3);
  auto out = derive_multiple(docs, quiet(Mode::Strict));
  assert(out.size() == 2);
  assert(out[0]["messagesMatched"] == OrderedJson::array({0, 1}));
  assert(out[1]["schema"]["fields"][0]["type"] == "double");
  std::cout << "  [PASS]\n";
}

int main() {
  std::cout << "=== Batch aggregation ===\n";
  test_identical_messages_single_group();
  test_ranked_groups_strict();
  test_top_group_lenient();
  test_max_groups_limit();
  test_equal_counts_rank_by_first_member();
  test_no_schema_derived();
  test_numeric_widening_folds_groups();
  test_unparsable_messages_unmatched();
  test_parsed_value_overload();
  std::cout << "\n[OK] All batch tests passed! (9 tests)\n";
  return 0;
}
