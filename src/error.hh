#pragma once

#include <string_view>

/**
 * @brief Represents the status of an operation.
 */
enum class Status {
  Ok = 0,            ///< Success.
  OutOfRange,        ///< Requested bit width is out of range.
  UnexpectedEof,     ///< Not enough bits left in the stream.
  StreamClosed,      ///< Attempted to write to a closed stream.
  FileOpenError,     ///< Failed to open file.
  FileMapError,      ///< Failed to memory map file.
  FileCreateError,   ///< Failed to create file.
  FileWriteError,    ///< Failed to write to file.
  SameFile,          ///< Input and output name the same file.
  NotHuffFile,       ///< Magic number mismatch.
  TruncatedHeader,   ///< Tree header ended before the tree was complete.
  MalformedTree,     ///< Tree header describes a tree that cannot be decoded.
  TruncatedPayload,  ///< Payload ended before the end-of-file symbol.
};

/**
 * @brief Executes an expression and returns its Status if not Ok.
 * @param expr Expression returning a Status.
 */
#define TRY(expr)                                                                                  \
  do {                                                                                             \
    Status _status = (expr);                                                                       \
    if (_status != Status::Ok) {                                                                   \
      return _status;                                                                              \
    }                                                                                              \
  } while (0)

std::string_view format_status(Status status);

/**
 * @brief Tells whether the status reports a malformed compressed stream.
 */
bool is_format_error(Status status);
