#pragma once

#include <cstdint>
#include <memory>

#include "error.hh"
#include "huffman_tree.hh"
#include "mmap_buffer.hh"
#include "output_buffer.hh"

namespace huffman {

class HuffmanDecoder {
 public:
  /// Reads the tree header. Must precede decode().
  Status read_tree(InputBuffer* source);
  /// Decodes symbols into `target` until the end-of-file symbol is reached.
  Status decode(InputBuffer* source, OutputBuffer* target);

  const Node* root() const {
    return root_.get();
  }

  uint64_t decoded_symbols() const {
    return decoded_symbols_;
  }

 private:
  std::unique_ptr<Node> root_;
  uint64_t              decoded_symbols_{};
};

}  // namespace huffman
