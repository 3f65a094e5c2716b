#include "huffman_decoder.hh"

#include <cstdint>
#include <utility>

#include "tree_header.hh"

namespace huffman {

Status HuffmanDecoder::read_tree(InputBuffer* source) {
  root_.reset();
  decoded_symbols_ = 0;

  std::unique_ptr<Node> root;
  TRY(huffman::read_tree(source, root));

  // No bit leads anywhere from a lone leaf.
  if (root->is_leaf()) {
    return Status::MalformedTree;
  }

  root_ = std::move(root);
  return Status::Ok;
}

Status HuffmanDecoder::decode(InputBuffer* source, OutputBuffer* target) {
  if (!root_) {
    return Status::MalformedTree;
  }

  const Node* current = root_.get();
  while (true) {
    uint32_t bit;
    Status   status = source->read_bits(1, bit);
    if (status == Status::UnexpectedEof) return Status::TruncatedPayload;
    TRY(status);

    current = (bit == 0) ? current->left.get() : current->right.get();
    if (!current->is_leaf()) {
      continue;
    }

    if (current->symbol == kPseudoEof) {
      return Status::Ok;
    }

    TRY(target->write_bits(kBitsPerWord, current->symbol));
    decoded_symbols_++;
    current = root_.get();
  }
}

}  // namespace huffman
