#include "error.hh"

std::string_view format_status(Status status) {
  switch (status) {
  case Status::Ok:
    return "Ok";
  case Status::OutOfRange:
    return "Out of range";
  case Status::UnexpectedEof:
    return "Unexpected end of file";
  case Status::StreamClosed:
    return "Stream closed";
  case Status::FileOpenError:
    return "File open error";
  case Status::FileMapError:
    return "File map error";
  case Status::FileCreateError:
    return "File create error";
  case Status::FileWriteError:
    return "File write error";
  case Status::SameFile:
    return "Input and output are the same file";
  case Status::NotHuffFile:
    return "Not a Huffman compressed file";
  case Status::TruncatedHeader:
    return "Truncated tree header";
  case Status::MalformedTree:
    return "Malformed tree header";
  case Status::TruncatedPayload:
    return "Truncated payload, no end-of-file symbol";
  default:
    return "Unknown error";
  }
}

bool is_format_error(Status status) {
  switch (status) {
  case Status::NotHuffFile:
  case Status::TruncatedHeader:
  case Status::MalformedTree:
  case Status::TruncatedPayload:
    return true;
  default:
    return false;
  }
}
