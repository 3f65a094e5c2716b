#pragma once

#include <cstdint>
#include <memory>

#include "code_table.hh"
#include "error.hh"
#include "huffman_tree.hh"
#include "mmap_buffer.hh"
#include "output_buffer.hh"

namespace huffman {

class HuffmanEncoder {
 public:
  /// First pass: counts symbols from `source` and builds the tree and code table.
  void build(InputBuffer* source);
  /// Builds the tree and code table from known symbol counts.
  void build(const FrequencyTable& counts);
  /// Writes the tree header.
  Status write_tree(OutputBuffer* target) const;
  /// Second pass: writes the code of every symbol in `source`, then the end-of-file code.
  Status encode(InputBuffer* source, OutputBuffer* target) const;

  const FrequencyTable& counts() const {
    return counts_;
  }

  const CodeTable& codes() const {
    return codes_;
  }

  const Node* root() const {
    return root_.get();
  }

 private:
  FrequencyTable        counts_{};
  std::unique_ptr<Node> root_;
  CodeTable             codes_;
};

}  // namespace huffman
