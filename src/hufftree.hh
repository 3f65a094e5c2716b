#pragma once

#include <cstddef>
#include <cstdint>

#include "error.hh"
#include "mmap_buffer.hh"
#include "output_buffer.hh"

namespace huffman {

/// Identifies a stream written by compress(): Huffman payload preceded by its tree.
constexpr uint32_t kHuffNumber = 0xface8200;
constexpr uint32_t kHuffTree   = kHuffNumber | 1;
constexpr size_t   kBitsPerInt = 32;

constexpr int kDebugLow  = 1;
constexpr int kDebugHigh = 4;

struct Options {
  /// Diagnostics on stderr. 0 is silent, kDebugLow reports totals, kDebugHigh every symbol.
  int debug_level{};
};

/**
 * @brief Compresses `source` from its first bit into `target`, then closes `target`.
 *
 * Reads the source twice: once to count symbols, once to encode them.
 */
Status compress(InputBuffer* source, OutputBuffer* target, const Options& options = {});

/**
 * @brief Decompresses `source` into `target`, then closes `target`.
 *
 * Fails with NotHuffFile, TruncatedHeader, MalformedTree or TruncatedPayload on malformed input.
 * Bytes decoded before the failure stay written.
 */
Status decompress(InputBuffer* source, OutputBuffer* target, const Options& options = {});

}  // namespace huffman

enum class Action : uint8_t { Compress, Decompress };

Status process_file(
    const char* input_path, const char* output_path, Action action,
    const huffman::Options& options);
