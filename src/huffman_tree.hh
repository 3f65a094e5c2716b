#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "mmap_buffer.hh"

namespace huffman {

/// Bits per input symbol.
constexpr size_t kBitsPerWord = 8;
/// Bits per tree header leaf value, enough for the end-of-file symbol.
constexpr size_t kBitsPerLeaf = kBitsPerWord + 1;
/// Number of byte values.
constexpr uint16_t kByteAlphabetSize = 1 << kBitsPerWord;
/// Pseudo end-of-file symbol. Never occurs in the input; terminates the payload.
constexpr uint16_t kPseudoEof = kByteAlphabetSize;
/// Byte values plus the end-of-file symbol.
constexpr size_t kAlphabetSize = kByteAlphabetSize + 1;
/// Longest possible code, reached by a fully skewed tree over the whole alphabet.
constexpr size_t kMaxCodeLength = kAlphabetSize - 1;

using FrequencyTable = std::array<uint64_t, kAlphabetSize>;

/**
 * @brief Node of a Huffman code tree.
 *
 * A leaf has no children and holds a symbol. An internal node has both children; its symbol is
 * meaningless. Weight is the sum of the leaf counts below; trees read back from a header carry
 * zero weights.
 */
struct Node {
  uint16_t              symbol{};
  uint64_t              weight{};
  std::unique_ptr<Node> left;
  std::unique_ptr<Node> right;

  bool is_leaf() const {
    return !left && !right;
  }

  static std::unique_ptr<Node> make_leaf(uint16_t symbol, uint64_t weight);
  static std::unique_ptr<Node> make_internal(
      std::unique_ptr<Node> left, std::unique_ptr<Node> right);
};

/**
 * @brief Counts byte occurrences from the current position to the end of the source.
 *
 * The end-of-file symbol is always counted once.
 */
FrequencyTable count_frequencies(InputBuffer* source);

/**
 * @brief Builds the Huffman tree for the given counts.
 *
 * Nodes of equal weight leave the queue in the order they entered it: leaves in symbol order
 * first, merged nodes in order of creation. The first node taken becomes the left child.
 * If fewer than two symbols are present, a zero-weight leaf for the smallest absent symbol is
 * added so that every code is at least one bit long.
 */
std::unique_ptr<Node> build_tree(const FrequencyTable& counts);

/// Number of leaves below (and including) `node`.
size_t count_leaves(const Node& node);

}  // namespace huffman
