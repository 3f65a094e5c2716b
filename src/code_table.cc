#include "code_table.hh"

namespace huffman {
namespace {

// Recursion depth is bounded by the alphabet size.
void collect_codes(const Node& node, Code& path, CodeTable& table) {
  if (node.is_leaf()) {
    table[node.symbol] = path;
    return;
  }

  path.push_back(false);
  collect_codes(*node.left, path, table);
  path.back() = true;
  collect_codes(*node.right, path, table);
  path.pop_back();
}

}  // namespace

CodeTable make_code_table(const Node& root) {
  CodeTable table;
  Code      path;
  path.reserve(kMaxCodeLength);
  collect_codes(root, path, table);
  return table;
}

}  // namespace huffman
