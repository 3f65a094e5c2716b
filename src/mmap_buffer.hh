#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "error.hh"

/// Read-only bit stream over a block of memory.
/// Bits are read MSB-first from each byte, any number from 0 to 32 per call.
class InputBuffer {
 public:
  constexpr InputBuffer() = default;
  constexpr InputBuffer(const uint8_t* data, size_t size) : data_{data}, filesize_{size} {}

  /// Reads `data_bits_requested` bits into `out`. Returns UnexpectedEof and consumes nothing
  /// if fewer bits remain.
  Status read_bits(size_t data_bits_requested, uint32_t& out);
  Status peek_bits(size_t data_bits_requested, uint32_t& out) const;

  /// Moves the read position back to the first bit.
  void rewind() {
    bit_position_ = 0;
  }

  size_t available_bits() const {
    return filesize_ * 8 - bit_position_;
  }

  size_t bits_read() const {
    return bit_position_;
  }

  size_t size() const {
    return filesize_;
  }

  bool is_eof() const;

 private:
  const uint8_t* data_{};
  size_t         filesize_{};
  size_t         bit_position_{};
};


class MmapInputBuffer {
 public:
  static Status for_file(const char* filepath, std::unique_ptr<MmapInputBuffer>& out);
  ~MmapInputBuffer();

  InputBuffer get() const;

 private:
#ifdef _WIN32
  void* file_handle_{};
  void* mapping_handle_{};
#else
  int fd_{-1};
#endif
  size_t         filesize_{};
  const uint8_t* data_{};
};
