#include "tree_header.hh"

#include <cstdint>
#include <utility>

namespace huffman {
namespace {

constexpr uint32_t kInternalNodeBit = 0;
constexpr uint32_t kLeafNodeBit     = 1;

Status read_bits(InputBuffer* source, size_t data_bits, uint32_t& out) {
  Status status = source->read_bits(data_bits, out);
  if (status == Status::UnexpectedEof) return Status::TruncatedHeader;
  return status;
}

Status read_node(InputBuffer* source, size_t depth, std::unique_ptr<Node>& out) {
  if (depth > kMaxCodeLength) {
    return Status::MalformedTree;
  }

  uint32_t node_bit;
  TRY(read_bits(source, 1, node_bit));

  if (node_bit == kLeafNodeBit) {
    uint32_t symbol;
    TRY(read_bits(source, kBitsPerLeaf, symbol));
    if (symbol > kPseudoEof) {
      return Status::MalformedTree;
    }
    out = Node::make_leaf(static_cast<uint16_t>(symbol), 0);
    return Status::Ok;
  }

  std::unique_ptr<Node> left;
  std::unique_ptr<Node> right;
  TRY(read_node(source, depth + 1, left));
  TRY(read_node(source, depth + 1, right));
  out = Node::make_internal(std::move(left), std::move(right));
  return Status::Ok;
}

}  // namespace

Status write_tree(const Node& root, OutputBuffer* target) {
  if (root.is_leaf()) {
    TRY(target->write_bits(1, kLeafNodeBit));
    return target->write_bits(kBitsPerLeaf, root.symbol);
  }

  TRY(target->write_bits(1, kInternalNodeBit));
  TRY(write_tree(*root.left, target));
  return write_tree(*root.right, target);
}

Status read_tree(InputBuffer* source, std::unique_ptr<Node>& out) {
  return read_node(source, 0, out);
}

}  // namespace huffman
