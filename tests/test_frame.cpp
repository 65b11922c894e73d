#include <gtest/gtest.h>

#include "esphome/core/helpers.h"
#include "grobro_frame.h"

namespace esphome {
namespace grobro {

TEST(FrameTest, Crc16Modbus) {
  const std::string check = "123456789";
  EXPECT_EQ(crc16(reinterpret_cast<const uint8_t *>(check.data()), static_cast<uint16_t>(check.size())), 0x4B37);
}

TEST(FrameTest, ScrambleKeepsHeader) {
  std::vector<uint8_t> frame = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0A, 0x0B};
  std::vector<uint8_t> expected = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x4F, 0x7B, 0x65, 0x7C};
  EXPECT_EQ(scramble(frame), expected);
}

TEST(FrameTest, ScrambleShortFrameUnchanged) {
  std::vector<uint8_t> frame = {0x00, 0x01, 0x00, 0x07, 0x00, 0x10};
  EXPECT_EQ(scramble(frame), frame);
}

TEST(FrameTest, ScrambleIsInvolution) {
  std::vector<uint8_t> frame;
  for (int i = 0; i < 64; i++)
    frame.push_back(static_cast<uint8_t>(i * 7));
  EXPECT_EQ(descramble(scramble(frame)), frame);
}

TEST(FrameTest, AppendCrcIsBigEndian) {
  std::vector<uint8_t> data = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
  auto framed = append_crc(data);
  ASSERT_EQ(framed.size(), data.size() + 2);
  EXPECT_EQ(framed[9], 0x4B);
  EXPECT_EQ(framed[10], 0x37);
  EXPECT_TRUE(verify_crc(framed));
}

TEST(FrameTest, VerifyCrcDetectsCorruption) {
  std::vector<uint8_t> data = {0x00, 0x01, 0x00, 0x07, 0x00, 0x04, 0x01, 0x05, 0xAA, 0xBB};
  auto framed = append_crc(data);
  framed[8] ^= 0x01;
  EXPECT_FALSE(verify_crc(framed));
  EXPECT_FALSE(verify_crc({0x01}));
}

TEST(FrameTest, WrapUnwrapRoundTrip) {
  std::vector<uint8_t> message = {0x00, 0x01, 0x00, 0x07, 0x00, 0x06, 0x01, 0x05,
                                  'Q',  'M',  'N',  '0',  '0',  '0'};
  auto wire = wrap_frame(message);
  ASSERT_EQ(wire.size(), message.size() + 2);

  ChecksumStatus status = ChecksumStatus::MISSING;
  auto unwrapped = unwrap_frame(wire, CrcPolicy::STRICT, &status);
  ASSERT_TRUE(unwrapped.has_value());
  EXPECT_EQ(status, ChecksumStatus::OK);
  EXPECT_EQ(*unwrapped, message);
}

TEST(FrameTest, ChecksumMismatchFollowsPolicy) {
  std::vector<uint8_t> message = {0x00, 0x01, 0x00, 0x07, 0x00, 0x04, 0x01, 0x05, 0x10, 0x20};
  auto wire = wrap_frame(message);
  wire.back() ^= 0xFF;

  ChecksumStatus status = ChecksumStatus::OK;
  auto lenient = unwrap_frame(wire, CrcPolicy::LENIENT, &status);
  ASSERT_TRUE(lenient.has_value());
  EXPECT_EQ(status, ChecksumStatus::MISMATCH);
  EXPECT_EQ(*lenient, message);

  auto strict = unwrap_frame(wire, CrcPolicy::STRICT, &status);
  EXPECT_FALSE(strict.has_value());
  EXPECT_EQ(status, ChecksumStatus::MISMATCH);
}

TEST(FrameTest, UnwrapRejectsShortFrames) {
  ChecksumStatus status = ChecksumStatus::OK;
  std::vector<uint8_t> raw = {0x00, 0x01, 0x00, 0x07, 0x00, 0x00, 0x01, 0x05, 0x00};
  EXPECT_FALSE(unwrap_frame(raw, CrcPolicy::LENIENT, &status).has_value());
  EXPECT_EQ(status, ChecksumStatus::MISSING);
}

TEST(FrameTest, ReadAsciiTrimsPadding) {
  std::vector<uint8_t> data = {0x00, 'A', 'B', 0x00, 0x00, 0xFF, 'C'};
  EXPECT_EQ(read_ascii(data, 0, 5), "AB");
  EXPECT_EQ(read_ascii(data, 1, 6), std::string("AB\0\0C", 5));
  EXPECT_EQ(read_ascii(data, 10, 4), "");
}

TEST(FrameTest, PaddedAsciiHasFixedWidth) {
  std::vector<uint8_t> data;
  append_padded_ascii(data, "QMN", 5);
  append_padded_ascii(data, "TOOLONG", 3);
  std::vector<uint8_t> expected = {'Q', 'M', 'N', 0x00, 0x00, 'T', 'O', 'O'};
  EXPECT_EQ(data, expected);
}

TEST(FrameTest, BigEndianHelpers) {
  std::vector<uint8_t> data;
  append_uint16(data, 0x1234);
  append_uint16(data, 0xABCD);
  EXPECT_EQ(read_uint16(data, 0), 0x1234);
  EXPECT_EQ(read_uint32(data, 0), 0x1234ABCDu);
}

}  // namespace grobro
}  // namespace esphome
