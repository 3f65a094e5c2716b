#pragma once

#include <memory>

#include "error.hh"
#include "huffman_tree.hh"
#include "mmap_buffer.hh"
#include "output_buffer.hh"

namespace huffman {

/**
 * @brief Writes the tree shape in preorder.
 *
 * An internal node is a single 0 bit followed by its left and right subtrees. A leaf is a single
 * 1 bit followed by its symbol in kBitsPerLeaf bits.
 *
 * @param root The tree to write.
 * @param target The stream to write to.
 * @return Status of the first failed write, or Ok.
 */
Status write_tree(const Node& root, OutputBuffer* target);

/**
 * @brief Reads a tree written by write_tree().
 *
 * @param source The stream positioned at the first header bit.
 * @param out Receives the tree root on success.
 * @return TruncatedHeader if the stream ends before the tree is complete, MalformedTree if a leaf
 * value is not a valid symbol or the tree is deeper than any code could be.
 */
Status read_tree(InputBuffer* source, std::unique_ptr<Node>& out);

}  // namespace huffman
