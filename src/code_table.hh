#pragma once

#include <array>
#include <vector>

#include "huffman_tree.hh"

namespace huffman {

/// Bits of a code in path order; `false` steps to the left child, `true` to the right one.
using Code = std::vector<bool>;

/// Code for every symbol. Symbols that are not in the tree have an empty code.
using CodeTable = std::array<Code, kAlphabetSize>;

/**
 * @brief Derives the code of every leaf from its path from the root.
 * @param root Root of a tree with at least two leaves.
 */
CodeTable make_code_table(const Node& root);

}  // namespace huffman
