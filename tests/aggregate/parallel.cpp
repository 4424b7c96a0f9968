#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "avroinfer/aggregator.hpp"

using namespace avroinfer;

static std::vector<std::string> mixed_batch(int count) {
  std::vector<std::string> out;
  for (int i = 0; i < count; ++i) {
    switch (i % 5) {
    case 0: out.push_back("{\"id\": " + std::to_string(i) + ", \"v\": [1, 2]}"); break;
    case 1: out.push_back("{\"id\": " + std::to_string(i) + ", \"v\": [0.5]}"); break;
    case 2: out.push_back("{\"id\": " + std::to_string(i) + ", \"tag\": \"t\"}"); break;
    case 3: out.push_back("{\"id\": " + std::to_string(i) + ", \"v\": [1.5, true]}"); break;
    default: out.push_back("{\"nested\": {\"id\": " + std::to_string(i * 1000000000LL) + "}}"); break;
    }
  }
  return out;
}

void test_workers_match_sequential() {
  std::cout << "test_workers_match_sequential...\n";
  auto messages = mixed_batch(103);
  for (auto mode : {Mode::Strict, Mode::Lenient}) {
    DeriveOptions sequential;
    sequential.mode = mode;
    sequential.log_sink = nullptr;
    DeriveOptions parallel = sequential;
    parallel.workers = 4;
    auto a = derive_multiple(messages, sequential);
    auto b = derive_multiple(messages, parallel);
    assert(a == b);
  }
  std::cout << "  [PASS]\n";
}

void test_more_workers_than_messages() {
  std::cout << "test_more_workers_than_messages...\n";
  DeriveOptions options;
  options.workers = 16;
  options.log_sink = nullptr;
  auto out = derive_multiple(mixed_batch(3), options);
  assert(out.size() == 2);
  assert(out[0]["messagesMatched"] == OrderedJson::array({0, 1}));
  assert(out[1]["messagesMatched"] == OrderedJson::array({2}));
  std::cout << "  [PASS]\n";
}

void test_rank_keeps_source_indices() {
  std::cout << "test_rank_keeps_source_indices...\n";
  DeriveOptions options;
  options.workers = 3;
  options.log_sink = nullptr;
  std::vector<Result<ParsedValue>> docs;
  for (const auto& m : mixed_batch(20)) docs.push_back(try_parse_document(m));
  auto groups = Aggregator(options).rank(docs);
  std::size_t total = 0;
  for (const auto& g : groups) {
    for (std::size_t i = 1; i < g.messages.size(); ++i) assert(g.messages[i - 1] < g.messages[i]);
    total += g.count();
  }
  // Shape 3 of every five mixes double and boolean, unmatched in strict mode
  assert(total == 16);
  std::cout << "  [PASS]\n";
}

int main() {
  std::cout << "=== Parallel aggregation ===\n";
  test_workers_match_sequential();
  test_more_workers_than_messages();
  test_rank_keeps_source_indices();
  std::cout << "\n[OK] All parallel tests passed! (3 tests)\n";
  return 0;
}
