#include "hufftree.hh"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

#include "huffman_decoder.hh"
#include "huffman_encoder.hh"

namespace huffman {
namespace {

std::string code_to_string(const Code& code) {
  std::string result;
  result.reserve(code.size());
  for (bool bit : code) {
    result.push_back(bit ? '1' : '0');
  }
  return result;
}

void report_leaves(const Node& node, size_t depth) {
  if (node.is_leaf()) {
    std::fprintf(stderr, "  leaf %3u depth %zu\n", static_cast<unsigned>(node.symbol), depth);
    return;
  }
  report_leaves(*node.left, depth + 1);
  report_leaves(*node.right, depth + 1);
}

Status compress_stream(InputBuffer* source, OutputBuffer* target, const Options& options) {
  HuffmanEncoder encoder;

  source->rewind();
  encoder.build(source);

  if (options.debug_level >= kDebugHigh) {
    std::fprintf(stderr, "symbol    count code\n");
    for (size_t symbol = 0; symbol < kAlphabetSize; ++symbol) {
      if (encoder.counts()[symbol] == 0) continue;
      std::fprintf(stderr, "%6zu %8" PRIu64 " %s\n", symbol, encoder.counts()[symbol],
          code_to_string(encoder.codes()[symbol]).c_str());
    }
  }

  TRY(target->write_bits(kBitsPerInt, kHuffTree));
  TRY(encoder.write_tree(target));
  size_t header_bits = target->bits_written();

  source->rewind();
  TRY(encoder.encode(source, target));

  if (options.debug_level >= kDebugLow) {
    std::fprintf(stderr, "compress: %zu leaves, read %zu bits, wrote %zu bits (header %zu)\n",
        count_leaves(*encoder.root()), source->bits_read(), target->bits_written(), header_bits);
  }

  return Status::Ok;
}

Status decompress_stream(InputBuffer* source, OutputBuffer* target, const Options& options) {
  uint32_t magic;
  Status   status = source->read_bits(kBitsPerInt, magic);
  if (status == Status::UnexpectedEof || (status == Status::Ok && magic != kHuffTree)) {
    return Status::NotHuffFile;
  }
  TRY(status);

  HuffmanDecoder decoder;
  TRY(decoder.read_tree(source));

  if (options.debug_level >= kDebugLow) {
    std::fprintf(stderr, "decompress: tree with %zu leaves in %zu header bits\n",
        count_leaves(*decoder.root()), source->bits_read() - kBitsPerInt);
  }
  if (options.debug_level >= kDebugHigh) {
    report_leaves(*decoder.root(), 0);
  }

  TRY(decoder.decode(source, target));

  if (options.debug_level >= kDebugLow) {
    std::fprintf(stderr, "decompress: read %zu bits, wrote %" PRIu64 " bytes\n",
        source->bits_read(), decoder.decoded_symbols());
  }

  return Status::Ok;
}

}  // namespace

Status compress(InputBuffer* source, OutputBuffer* target, const Options& options) {
  Status status       = compress_stream(source, target, options);
  Status close_status = target->close();
  return status != Status::Ok ? status : close_status;
}

Status decompress(InputBuffer* source, OutputBuffer* target, const Options& options) {
  Status status       = decompress_stream(source, target, options);
  Status close_status = target->close();
  return status != Status::Ok ? status : close_status;
}

}  // namespace huffman

Status process_file(
    const char* input_path, const char* output_path, Action action,
    const huffman::Options& options) {
  std::unique_ptr<MmapInputBuffer> mapped;
  TRY(MmapInputBuffer::for_file(input_path, mapped));

  // Opening the output truncates it, so it must not be the mapped input.
  std::error_code ec;
  if (std::filesystem::equivalent(input_path, output_path, ec)) {
    return Status::SameFile;
  }

  std::unique_ptr<FileOutputBuffer> output;
  TRY(FileOutputBuffer::for_file(output_path, output));

  InputBuffer input = mapped->get();

  switch (action) {
  case Action::Compress:
    return huffman::compress(&input, output.get(), options);

  case Action::Decompress:
    return huffman::decompress(&input, output.get(), options);
  }

  return Status::Ok;
}
