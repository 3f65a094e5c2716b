#include "huffman_encoder.hh"

#include <algorithm>
#include <cstdint>

#include "tree_header.hh"

namespace huffman {
namespace {

// Codes may be longer than a single write allows, so they go out in 32-bit pieces.
Status write_code(const Code& code, OutputBuffer* target) {
  size_t position = 0;
  while (position < code.size()) {
    size_t   chunk = std::min<size_t>(32, code.size() - position);
    uint32_t bits  = 0;
    for (size_t i = 0; i < chunk; ++i) {
      bits = (bits << 1) | (code[position + i] ? 1 : 0);
    }
    TRY(target->write_bits(chunk, bits));
    position += chunk;
  }
  return Status::Ok;
}

}  // namespace

void HuffmanEncoder::build(InputBuffer* source) {
  build(count_frequencies(source));
}

void HuffmanEncoder::build(const FrequencyTable& counts) {
  counts_ = counts;
  root_   = build_tree(counts_);
  codes_  = make_code_table(*root_);
}

Status HuffmanEncoder::write_tree(OutputBuffer* target) const {
  return huffman::write_tree(*root_, target);
}

Status HuffmanEncoder::encode(InputBuffer* source, OutputBuffer* target) const {
  uint32_t symbol;
  while (true) {
    Status status = source->read_bits(kBitsPerWord, symbol);
    if (status == Status::UnexpectedEof) break;
    TRY(status);
    TRY(write_code(codes_[symbol], target));
  }

  return write_code(codes_[kPseudoEof], target);
}

}  // namespace huffman
