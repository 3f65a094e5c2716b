#include <unistd.h>

#include <cstdio>
#include <string>
#include <string_view>

#include "hufftree.hh"

namespace {

constexpr std::string_view kCompressedSuffix   = ".hf";
constexpr std::string_view kDecompressedSuffix = ".uhf";

std::string default_output_path(std::string_view input, Action action) {
  std::string result(input);
  if (action == Action::Compress) {
    result.append(kCompressedSuffix);
  } else if (result.ends_with(kCompressedSuffix)) {
    result.resize(result.size() - kCompressedSuffix.size());
  } else {
    result.append(kDecompressedSuffix);
  }
  return result;
}

void print_usage() {
  std::puts("Usage: hufftree [-c][-d][-v][-o output] [file...]");
  std::puts("\t-c : compress (default)");
  std::puts("\t-d : decompress");
  std::puts("\t-v : more diagnostics, repeat for more");
  std::puts("\t-o : output file, single input only");
}

}  // namespace

auto main(int argc, char** argv) -> int {
  int              result      = 0;
  Action           action      = Action::Compress;
  const char*      output_path = nullptr;
  huffman::Options options;

  while (true) {
    int option = getopt(argc, argv, "cdvo:");
    if (option == -1) {
      break;
    }

    switch (option) {
    case 'c':  // (c)ompress
      action = Action::Compress;
      break;
    case 'd':  // (d)ecompress
      action = Action::Decompress;
      break;
    case 'v':  // (v)erbose
      options.debug_level++;
      break;
    case 'o':  // (o)utput
      output_path = optarg;
      break;
    case '?':  // unknown option
    default:
      result = 2;
      break;
    }
  }

  if (result != 0 || optind >= argc || (output_path != nullptr && argc - optind > 1)) {
    print_usage();
    return 2;
  }

  for (; optind < argc; optind++) {
    const char* input_path = argv[optind];
    std::string target =
        output_path != nullptr ? output_path : default_output_path(input_path, action);

    std::printf("%s \"%s\" to \"%s\"...\n",
        action == Action::Compress ? "Compressing" : "Decompressing", input_path, target.c_str());

    Status status = process_file(input_path, target.c_str(), action, options);
    if (status != Status::Ok) {
      std::string message(format_status(status));
      std::fprintf(stderr, "\"%s\": %s\n", input_path, message.c_str());
      result = 1;
    }
  }

  return result;
}
