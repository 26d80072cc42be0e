#include "test_support.h"

#include "vnb/resources/storage/vnb/vnb_byte_io.h"

#include <gtest/gtest.h>

namespace vnb {
namespace {

using test::bytesOf;

TEST(VnbByteIoTest, WritesScalarsLittleEndian) {
  VnbByteWriter writer;
  writer.writeU8(0x01);
  writer.writeU16(0x0302);
  writer.writeU32(0x07060504u);
  writer.writeI32(-2);
  writer.writeF32(1.0f);

  EXPECT_EQ(std::vector<std::byte>(writer.bytes().begin(), writer.bytes().end()),
            bytesOf({0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0xFE, 0xFF,
                     0xFF, 0xFF, 0x00, 0x00, 0x80, 0x3F}));
}

TEST(VnbByteIoTest, ReadsBackScalars) {
  const std::vector<std::byte> bytes =
      bytesOf({0x2A, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xFF, 0xFF, 0xFF,
               0xFF, 0x00, 0x00, 0x00, 0x40});
  VnbByteReader reader(bytes);

  uint8_t u8 = 0;
  uint16_t u16 = 0;
  uint32_t u32 = 0;
  int32_t i32 = 0;
  float f32 = 0.0f;
  ASSERT_TRUE(reader.readU8(u8));
  ASSERT_TRUE(reader.readU16(u16));
  ASSERT_TRUE(reader.readU32(u32));
  ASSERT_TRUE(reader.readI32(i32));
  ASSERT_TRUE(reader.readF32(f32));
  EXPECT_EQ(u8, 0x2A);
  EXPECT_EQ(u16, 0x1234);
  EXPECT_EQ(u32, 0x12345678u);
  EXPECT_EQ(i32, -1);
  EXPECT_EQ(f32, 2.0f);
  EXPECT_TRUE(reader.atEnd());
}

TEST(VnbByteIoTest, FailedReadLeavesCursorInPlace) {
  const std::vector<std::byte> bytes = bytesOf({0x01, 0x02, 0x03});
  VnbByteReader reader(bytes);

  uint32_t value = 0;
  EXPECT_FALSE(reader.readU32(value));
  EXPECT_EQ(reader.offset(), 0u);

  uint16_t half = 0;
  ASSERT_TRUE(reader.readU16(half));
  EXPECT_EQ(half, 0x0201);
  EXPECT_EQ(reader.remaining(), 1u);
}

TEST(VnbByteIoTest, LengthPrefixedStringAcceptsMaximumLength) {
  const std::string text(65535, 'a');
  VnbByteWriter writer;
  auto result = writer.writeLengthPrefixedUtf8(text);
  ASSERT_TRUE(result.hasValue());
  ASSERT_EQ(writer.size(), 2u + 65535u);
  EXPECT_EQ(writer.bytes()[0], std::byte{0xFF});
  EXPECT_EQ(writer.bytes()[1], std::byte{0xFF});

  VnbByteReader reader(writer.bytes());
  std::string decoded;
  ASSERT_TRUE(reader.readLengthPrefixedUtf8(decoded));
  EXPECT_EQ(decoded, text);
}

TEST(VnbByteIoTest, LengthPrefixedStringRejectsOverlongText) {
  const std::string text(65536, 'a');
  VnbByteWriter writer;
  auto result = writer.writeLengthPrefixedUtf8(text);
  ASSERT_TRUE(result.hasError());
  EXPECT_TRUE(result.error().is(VnbErrorCode::StringTooLong));
  EXPECT_EQ(writer.size(), 0u);
}

TEST(VnbByteIoTest, Utf8BytesAreCountedNotCharacters) {
  const std::string text = "\xC3\xA9t\xC3\xA9"; // "été"
  VnbByteWriter writer;
  ASSERT_TRUE(writer.writeLengthPrefixedUtf8(text).hasValue());
  EXPECT_EQ(writer.bytes()[0], std::byte{5});
}

TEST(VnbByteIoTest, TruncatedStringPayloadFails) {
  const std::vector<std::byte> bytes = bytesOf({0x04, 0x00, 'a', 'b'});
  VnbByteReader reader(bytes);
  std::string decoded;
  EXPECT_FALSE(reader.readLengthPrefixedUtf8(decoded));
  EXPECT_EQ(reader.offset(), 0u);
}

TEST(VnbByteIoTest, BulkReaderChecksBudgetBeforeAllocating) {
  const std::vector<std::byte> bytes(16, std::byte{0});
  VnbByteReader reader(bytes);

  std::vector<float> floats;
  EXPECT_FALSE(reader.readFloatArray(uint64_t{1} << 60u, floats));
  EXPECT_TRUE(floats.empty());
  EXPECT_FALSE(reader.readFloatArray(5, floats));
  EXPECT_TRUE(floats.empty());

  ASSERT_TRUE(reader.readFloatArray(4, floats));
  EXPECT_EQ(floats.size(), 4u);
  EXPECT_TRUE(reader.atEnd());
}

TEST(VnbByteIoTest, ArrayWritersEmitNoFraming) {
  VnbByteWriter writer;
  const std::vector<uint16_t> shorts = {1, 2};
  const std::vector<uint32_t> ints = {3};
  writer.writeU16Array(shorts);
  writer.writeU32Array(ints);
  writer.writeFloatArray(std::span<const float>());
  EXPECT_EQ(std::vector<std::byte>(writer.bytes().begin(), writer.bytes().end()),
            bytesOf({0x01, 0x00, 0x02, 0x00, 0x03, 0x00, 0x00, 0x00}));
}

TEST(VnbByteIoTest, CheckedArithmeticDetectsOverflow) {
  uint64_t out = 0;
  EXPECT_FALSE(checkedMulToU64(uint64_t{1} << 40u, uint64_t{1} << 30u, out));
  EXPECT_TRUE(checkedMulToU64(0, std::numeric_limits<uint64_t>::max(), out));
  EXPECT_EQ(out, 0u);
  EXPECT_FALSE(
      checkedAddToU64(std::numeric_limits<uint64_t>::max(), 1, out));
  EXPECT_TRUE(checkedAddToU64(2, 3, out));
  EXPECT_EQ(out, 5u);
}

} // namespace
} // namespace vnb
