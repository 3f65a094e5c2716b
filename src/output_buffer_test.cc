#include "output_buffer.hh"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "mmap_buffer.hh"

namespace {

TEST(OutputBufferTest, WritesMsbFirst) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.write_bits(4, 0x1), Status::Ok);
  EXPECT_EQ(buffer.write_bits(4, 0x2), Status::Ok);
  EXPECT_EQ(buffer.write_bits(12, 0x345), Status::Ok);
  EXPECT_EQ(buffer.write_bits(4, 0x6), Status::Ok);
  EXPECT_EQ(buffer.close(), Status::Ok);

  EXPECT_EQ(buffer.data(), (std::vector<uint8_t>{0x12, 0x34, 0x56}));
  EXPECT_EQ(buffer.bits_written(), 24);
}

TEST(OutputBufferTest, WritesFullWord) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.write_bits(32, 0xFACE8201U), Status::Ok);
  EXPECT_EQ(buffer.close(), Status::Ok);

  EXPECT_EQ(buffer.data(), (std::vector<uint8_t>{0xFA, 0xCE, 0x82, 0x01}));
}

TEST(OutputBufferTest, IgnoresBitsAboveWidth) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.write_bits(4, 0xFFF5), Status::Ok);
  EXPECT_EQ(buffer.write_bits(4, 0xA), Status::Ok);
  EXPECT_EQ(buffer.close(), Status::Ok);

  EXPECT_EQ(buffer.data(), (std::vector<uint8_t>{0x5A}));
}

TEST(OutputBufferTest, CloseZeroPadsLastByte) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.write_bits(3, 0b101), Status::Ok);
  EXPECT_EQ(buffer.write_bits(9, 0b111111111), Status::Ok);
  EXPECT_EQ(buffer.close(), Status::Ok);

  EXPECT_EQ(buffer.data(), (std::vector<uint8_t>{0b10111111, 0b11110000}));
  EXPECT_EQ(buffer.bits_written(), 12);
}

TEST(OutputBufferTest, NothingWrittenBeforeClose) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.write_bits(16, 0xBEEF), Status::Ok);
  EXPECT_TRUE(buffer.data().empty());
  EXPECT_EQ(buffer.close(), Status::Ok);
  EXPECT_EQ(buffer.data().size(), 2);
}

TEST(OutputBufferTest, EmptyCloseWritesNothing) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.close(), Status::Ok);
  EXPECT_TRUE(buffer.is_closed());
  EXPECT_TRUE(buffer.data().empty());
}

TEST(OutputBufferTest, WriteAfterClose) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.write_bits(8, 0x42), Status::Ok);
  EXPECT_EQ(buffer.close(), Status::Ok);
  EXPECT_EQ(buffer.write_bits(8, 0x43), Status::StreamClosed);
  EXPECT_EQ(buffer.close(), Status::Ok);

  EXPECT_EQ(buffer.data(), (std::vector<uint8_t>{0x42}));
}

TEST(OutputBufferTest, WriteMoreThan32) {
  MemoryOutputBuffer buffer;

  EXPECT_EQ(buffer.write_bits(33, 0), Status::OutOfRange);
  EXPECT_EQ(buffer.bits_written(), 0);
}

TEST(OutputBufferTest, LargeOutputFlushesInBatches) {
  MemoryOutputBuffer buffer;

  for (uint32_t i = 0; i < 100000; ++i) {
    ASSERT_EQ(buffer.write_bits(8, i & 0xFF), Status::Ok);
  }
  EXPECT_FALSE(buffer.data().empty());
  EXPECT_EQ(buffer.close(), Status::Ok);

  ASSERT_EQ(buffer.data().size(), 100000);
  for (uint32_t i = 0; i < 100000; ++i) {
    ASSERT_EQ(buffer.data()[i], i & 0xFF);
  }
}

TEST(FileOutputBufferTest, WritesFile) {
  std::string filename = ::testing::TempDir() + "output_buffer_test.bin";

  std::unique_ptr<FileOutputBuffer> output;
  ASSERT_EQ(FileOutputBuffer::for_file(filename.c_str(), output), Status::Ok);
  EXPECT_EQ(output->write_bits(8, 0xAB), Status::Ok);
  EXPECT_EQ(output->write_bits(4, 0xC), Status::Ok);
  EXPECT_EQ(output->close(), Status::Ok);

  std::unique_ptr<MmapInputBuffer> mapped;
  ASSERT_EQ(MmapInputBuffer::for_file(filename.c_str(), mapped), Status::Ok);
  InputBuffer input = mapped->get();
  uint32_t    value;
  ASSERT_EQ(input.size(), 2);
  EXPECT_EQ(input.read_bits(16, value), Status::Ok);
  EXPECT_EQ(value, 0xABC0);

  std::remove(filename.c_str());
}

TEST(FileOutputBufferTest, CannotCreate) {
  std::unique_ptr<FileOutputBuffer> output;
  EXPECT_EQ(FileOutputBuffer::for_file("/nonexistent/hufftree/output", output),
      Status::FileCreateError);
  EXPECT_EQ(output, nullptr);
}

}  // namespace
