#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <span>
#include <vector>

#include "error.hh"

/// Write-only bit stream.
/// Bits are packed MSB-first into bytes, which are handed to `write_bytes()` in batches.
class OutputBuffer {
 public:
  virtual ~OutputBuffer() = default;

  /// Writes the low `data_bits` bits of `value`, most significant first. Up to 32 bits per call.
  Status write_bits(size_t data_bits, uint32_t value);

  /// Pads the last byte with zero bits, flushes everything and releases the underlying resource.
  /// Closing more than once is a no-op.
  Status close();

  bool is_closed() const {
    return closed_;
  }

  size_t bits_written() const {
    return bits_written_;
  }

 protected:
  virtual Status write_bytes(std::span<const uint8_t> bytes) = 0;
  virtual Status release() {
    return Status::Ok;
  }

 private:
  Status flush();

  std::vector<uint8_t> pending_;
  uint8_t              data_bits_{};
  size_t               data_bits_filled_{};
  size_t               bits_written_{};
  bool                 closed_{};
};


class MemoryOutputBuffer : public OutputBuffer {
 public:
  const std::vector<uint8_t>& data() const {
    return data_;
  }

 protected:
  Status write_bytes(std::span<const uint8_t> bytes) override;

 private:
  std::vector<uint8_t> data_;
};


class FileOutputBuffer : public OutputBuffer {
 public:
  static Status for_file(const char* filepath, std::unique_ptr<FileOutputBuffer>& out);

 protected:
  Status write_bytes(std::span<const uint8_t> bytes) override;
  Status release() override;

 private:
  std::unique_ptr<FILE, decltype(&std::fclose)> file_{nullptr, &std::fclose};
};
