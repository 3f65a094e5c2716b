#include "output_buffer.hh"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <utility>

namespace {
// Pending bytes are handed over once this many are collected.
constexpr size_t kFlushThreshold = 65536;
}  // namespace

Status OutputBuffer::write_bits(size_t data_bits, uint32_t value) {
  if (closed_) {
    return Status::StreamClosed;
  }

  if (data_bits > 32) {
    return Status::OutOfRange;
  }

  for (size_t bit = data_bits; bit > 0; --bit) {
    data_bits_ = static_cast<uint8_t>((data_bits_ << 1) | ((value >> (bit - 1)) & 1));
    if (++data_bits_filled_ == 8) {
      pending_.push_back(data_bits_);
      data_bits_        = 0;
      data_bits_filled_ = 0;
    }
  }
  bits_written_ += data_bits;

  if (pending_.size() >= kFlushThreshold) {
    TRY(flush());
  }

  return Status::Ok;
}

Status OutputBuffer::flush() {
  if (pending_.empty()) {
    return Status::Ok;
  }

  Status status = write_bytes(pending_);
  pending_.clear();
  return status;
}

Status OutputBuffer::close() {
  if (closed_) {
    return Status::Ok;
  }
  closed_ = true;

  // Pad the last byte with zeros.
  if (data_bits_filled_ > 0) {
    pending_.push_back(static_cast<uint8_t>(data_bits_ << (8 - data_bits_filled_)));
    data_bits_        = 0;
    data_bits_filled_ = 0;
  }

  // Release even if the flush failed, but report the first error.
  Status flush_status   = flush();
  Status release_status = release();
  return flush_status != Status::Ok ? flush_status : release_status;
}

Status MemoryOutputBuffer::write_bytes(std::span<const uint8_t> bytes) {
  data_.insert(data_.end(), bytes.begin(), bytes.end());
  return Status::Ok;
}

Status FileOutputBuffer::for_file(const char* filepath, std::unique_ptr<FileOutputBuffer>& out) {
  std::unique_ptr<FILE, decltype(&std::fclose)> file(std::fopen(filepath, "wbe"), &std::fclose);
  if (!file) {
    return Status::FileCreateError;
  }

  out        = std::make_unique<FileOutputBuffer>();
  out->file_ = std::move(file);
  return Status::Ok;
}

Status FileOutputBuffer::write_bytes(std::span<const uint8_t> bytes) {
  if (!file_) {
    return Status::FileWriteError;
  }

  if (std::fwrite(bytes.data(), 1, bytes.size(), file_.get()) != bytes.size()) {
    return Status::FileWriteError;
  }
  return Status::Ok;
}

Status FileOutputBuffer::release() {
  FILE* file = file_.release();
  if (file == nullptr) {
    return Status::Ok;
  }

  if (std::fclose(file) != 0) {
    return Status::FileWriteError;
  }
  return Status::Ok;
}
