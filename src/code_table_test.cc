#include "code_table.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

namespace huffman {
namespace {

CodeTable codes_of(const std::vector<uint8_t>& data) {
  InputBuffer buffer(data.data(), data.size());
  auto        root = build_tree(count_frequencies(&buffer));
  return make_code_table(*root);
}

bool is_prefix(const Code& prefix, const Code& code) {
  return prefix.size() <= code.size() && std::equal(prefix.begin(), prefix.end(), code.begin());
}

void expect_prefix_free(const CodeTable& table) {
  for (size_t a = 0; a < kAlphabetSize; ++a) {
    if (table[a].empty()) continue;
    for (size_t b = 0; b < kAlphabetSize; ++b) {
      if (a == b || table[b].empty()) continue;
      EXPECT_FALSE(is_prefix(table[a], table[b])) << "code of " << a << " prefixes " << b;
    }
  }
}

TEST(CodeTableTest, ThreeLeafCodes) {
  CodeTable table = codes_of({65, 65, 65, 66});

  EXPECT_EQ(table[65], (Code{true}));
  EXPECT_EQ(table[66], (Code{false, false}));
  EXPECT_EQ(table[kPseudoEof], (Code{false, true}));

  for (size_t symbol = 0; symbol < kAlphabetSize; ++symbol) {
    if (symbol == 65 || symbol == 66 || symbol == kPseudoEof) continue;
    EXPECT_TRUE(table[symbol].empty()) << "symbol " << symbol;
  }
}

TEST(CodeTableTest, EmptyInputCodes) {
  CodeTable table = codes_of({});

  EXPECT_EQ(table[0], (Code{false}));
  EXPECT_EQ(table[kPseudoEof], (Code{true}));
}

TEST(CodeTableTest, PrefixFreeSmallAlphabet) {
  expect_prefix_free(codes_of({1, 2, 2, 3, 3, 3, 4, 4, 4, 4, 5, 5, 5, 5, 5}));
  expect_prefix_free(codes_of({'a', 'b', 'r', 'a', 'c', 'a', 'd', 'a', 'b', 'r', 'a'}));
}

TEST(CodeTableTest, PrefixFreeSkewedCounts) {
  // Fibonacci counts give the deepest possible tree for their symbol count.
  std::vector<uint8_t> data;
  size_t               previous = 1;
  size_t               current  = 1;
  for (uint8_t symbol = 0; symbol < 16; ++symbol) {
    data.insert(data.end(), current, symbol);
    size_t next = previous + current;
    previous    = current;
    current     = next;
  }

  CodeTable table = codes_of(data);
  expect_prefix_free(table);

  size_t longest = 0;
  for (const auto& code : table) {
    longest = std::max(longest, code.size());
  }
  EXPECT_EQ(longest, 16);
}

TEST(CodeTableTest, EveryPresentSymbolHasCode) {
  std::vector<uint8_t> data;
  for (int i = 0; i < 256; ++i) {
    data.insert(data.end(), i % 7 + 1, static_cast<uint8_t>(i));
  }

  CodeTable table = codes_of(data);
  expect_prefix_free(table);

  // Kraft equality holds for a full binary tree.
  double kraft_sum = 0;
  for (const auto& code : table) {
    ASSERT_FALSE(code.empty());
    ASSERT_LE(code.size(), kMaxCodeLength);
    kraft_sum += 1.0 / static_cast<double>(1ULL << std::min<size_t>(code.size(), 63));
  }
  EXPECT_DOUBLE_EQ(kraft_sum, 1.0);
}

TEST(CodeTableTest, FrequentSymbolsGetShorterCodes) {
  std::vector<uint8_t> data(100, 'x');
  data.insert(data.end(), 10, 'y');
  data.push_back('z');

  CodeTable table = codes_of(data);

  EXPECT_LT(table['x'].size(), table['y'].size());
  EXPECT_LE(table['y'].size(), table['z'].size());
}

}  // namespace
}  // namespace huffman
