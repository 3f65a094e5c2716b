// Input buffer stream that uses mmap-ed file to retrieve content. Read-only.
// Allows the caller to read any arbitrary number of bits (up to 32) in a single call.
// Tracks current read position internally and can be rewound to the first bit.
#include "mmap_buffer.hh"

#ifdef _WIN32
#  include <windows.h>
#else
#  include <fcntl.h>
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <unistd.h>
#endif

#include <algorithm>
#include <cstdint>
#include <memory>

#ifdef _WIN32

Status MmapInputBuffer::for_file(const char* filepath, std::unique_ptr<MmapInputBuffer>& out) {
  HANDLE file_handle =
      CreateFileA(filepath, GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                  FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file_handle == INVALID_HANDLE_VALUE) return Status::FileOpenError;

  LARGE_INTEGER file_size;
  if (GetFileSizeEx(file_handle, &file_size) == FALSE) {
    CloseHandle(file_handle);
    return Status::FileOpenError;
  }

  size_t filesize = static_cast<size_t>(file_size.QuadPart);

  // Empty files cannot be mapped.
  if (filesize == 0) {
    out               = std::make_unique<MmapInputBuffer>();
    out->file_handle_ = file_handle;
    return Status::Ok;
  }

  HANDLE mapping_handle =
      CreateFileMappingA(file_handle, nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (mapping_handle == nullptr) {
    CloseHandle(file_handle);
    return Status::FileMapError;
  }

  const uint8_t* data =
      static_cast<const uint8_t*>(MapViewOfFile(mapping_handle, FILE_MAP_READ, 0, 0, 0));
  if (data == nullptr) {
    CloseHandle(mapping_handle);
    CloseHandle(file_handle);
    return Status::FileMapError;
  }

  out                  = std::make_unique<MmapInputBuffer>();
  out->file_handle_    = file_handle;
  out->mapping_handle_ = mapping_handle;
  out->data_           = data;
  out->filesize_       = filesize;

  return Status::Ok;
}

MmapInputBuffer::~MmapInputBuffer() {
  if (data_ != nullptr) UnmapViewOfFile(data_);
  if (mapping_handle_ != nullptr) CloseHandle(mapping_handle_);
  if (file_handle_ != nullptr) CloseHandle(file_handle_);
}

#else

Status MmapInputBuffer::for_file(const char* filepath, std::unique_ptr<MmapInputBuffer>& out) {
  int file_desc = open(filepath, O_RDONLY | O_CLOEXEC);
  if (file_desc == -1) return Status::FileOpenError;

  struct stat stat_buffer;
  if (fstat(file_desc, &stat_buffer) == -1) {
    close(file_desc);
    return Status::FileOpenError;
  }

  size_t filesize = stat_buffer.st_size;

  // Empty files cannot be mapped.
  if (filesize == 0) {
    out      = std::make_unique<MmapInputBuffer>();
    out->fd_ = file_desc;
    return Status::Ok;
  }

  uint8_t* data =
      static_cast<uint8_t*>(mmap(nullptr, filesize, PROT_READ, MAP_PRIVATE, file_desc, 0));
  if (data == MAP_FAILED) {
    close(file_desc);
    return Status::FileMapError;
  }

  out            = std::make_unique<MmapInputBuffer>();
  out->fd_       = file_desc;
  out->data_     = data;
  out->filesize_ = filesize;

  return Status::Ok;
}

MmapInputBuffer::~MmapInputBuffer() {
  if (data_ != nullptr) munmap(const_cast<uint8_t*>(data_), filesize_);
  if (fd_ != -1) close(fd_);
}

#endif

InputBuffer MmapInputBuffer::get() const {
  return InputBuffer(data_, filesize_);
}

Status InputBuffer::peek_bits(size_t data_bits_requested, uint32_t& out) const {
  if (data_bits_requested > 32) {
    return Status::OutOfRange;
  }

  if (available_bits() < data_bits_requested) {
    return Status::UnexpectedEof;
  }

  uint64_t result    = 0;
  size_t   position  = bit_position_;
  size_t   remaining = data_bits_requested;

  // Take as many bits as possible from each byte, MSB first.
  while (remaining > 0) {
    size_t  bit_offset = position & 7;
    size_t  chunk      = std::min(remaining, 8 - bit_offset);
    uint8_t byte       = data_[position >> 3];

    result = (result << chunk) | ((byte >> (8 - bit_offset - chunk)) & ((1U << chunk) - 1));
    position += chunk;
    remaining -= chunk;
  }

  out = static_cast<uint32_t>(result);
  return Status::Ok;
}

Status InputBuffer::read_bits(size_t data_bits_requested, uint32_t& out) {
  TRY(peek_bits(data_bits_requested, out));
  // Consume bits.
  bit_position_ += data_bits_requested;

  return Status::Ok;
}

bool InputBuffer::is_eof() const {
  return available_bits() == 0;
}
