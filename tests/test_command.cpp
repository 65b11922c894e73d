#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>

#include "grobro_command.h"
#include "grobro_constants.h"
#include "grobro_frame.h"
#include "grobro_modbus.h"

namespace esphome {
namespace grobro {

static const char *const NEO_ID = "QMN000ABC1D2E3FG";
static const char *const NOAH_ID = "0PVPF6JR21BT002R";

static std::vector<uint8_t> header(uint16_t msg_len, uint16_t type) {
  return {0x00, 0x01, 0x00, 0x07, static_cast<uint8_t>(msg_len >> 8), static_cast<uint8_t>(msg_len & 0xFF),
          static_cast<uint8_t>(type >> 8), static_cast<uint8_t>(type & 0xFF)};
}

static void append_id(std::vector<uint8_t> &data, const std::string &id, size_t width) {
  data.insert(data.end(), id.begin(), id.end());
  data.insert(data.end(), width - id.size(), 0x00);
}

TEST(CommandTest, ReadSingleRegisterLayout) {
  ReadSingleRegister command{NOAH_ID, 252};
  auto expected = header(36, 0x0105);
  append_id(expected, NOAH_ID, 30);
  expected.insert(expected.end(), {0x00, 0xFC, 0x00, 0xFC});
  EXPECT_EQ(command.build(), expected);

  auto parsed = ReadSingleRegister::parse(expected);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, command);
}

TEST(CommandTest, PresetSingleRegisterLayout) {
  PresetSingleRegister command{NOAH_ID, 252, 90};
  auto frame = command.build();
  ASSERT_EQ(frame.size(), SINGLE_REGISTER_FRAME_SIZE);
  EXPECT_EQ(read_uint16(frame, OFFSET_LENGTH), 36);
  EXPECT_EQ(frame[OFFSET_ADDRESS], 1);
  EXPECT_EQ(frame[OFFSET_FUNCTION], 6);
  EXPECT_EQ(read_uint16(frame, 38), 252);
  EXPECT_EQ(read_uint16(frame, 40), 90);

  auto parsed = PresetSingleRegister::parse(frame);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, command);
}

TEST(CommandTest, SingleRegisterParseChecksSizeAndFunction) {
  DecodeError error = DecodeError::NONE;
  auto frame = PresetSingleRegister{NOAH_ID, 1, 2}.build();

  EXPECT_FALSE(ReadSingleRegister::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);

  frame.resize(41);
  EXPECT_FALSE(PresetSingleRegister::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::MALFORMED_FRAME);
}

TEST(CommandTest, PresetMultipleRegisterLayout) {
  PresetMultipleRegister command{NOAH_ID, 300, 301, {0x00, 0x01, 0x00, 0x02}};
  auto frame = command.build();
  ASSERT_EQ(frame.size(), 46u);
  EXPECT_EQ(read_uint16(frame, OFFSET_LENGTH), 40);
  EXPECT_EQ(frame[OFFSET_FUNCTION], 16);

  auto parsed = PresetMultipleRegister::parse(frame);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, command);
}

TEST(CommandTest, NoahSlot1Power) {
  auto command = make_noah_slot1_power(NOAH_ID, 800);
  EXPECT_EQ(command.start, 254);
  EXPECT_EQ(command.end, 258);
  std::vector<uint8_t> values = {0x00, 0x00, 0x17, 0x3B, 0x00, 0x00, 0x03, 0x20, 0x00, 0x01};
  EXPECT_EQ(command.values, values);
  EXPECT_EQ(read_uint16(command.build(), OFFSET_LENGTH), 46);
}

TEST(CommandTest, NeoSetOutputPowerLimitLayout) {
  NeoSetOutputPowerLimit command{NEO_ID, 42};
  auto expected = header(36, 262);
  append_id(expected, NEO_ID, 16);
  expected.insert(expected.end(), 14, 0x00);
  expected.insert(expected.end(), {0x00, 0x03, 0x00, 0x2A});
  EXPECT_EQ(command.build(), expected);
}

TEST(CommandTest, NeoSetOutputPowerLimitSurvivesTheWire) {
  NeoSetOutputPowerLimit command{NEO_ID, 42};
  auto wire = wrap_frame(command.build());
  ASSERT_EQ(wire.size(), 44u);
  EXPECT_TRUE(verify_crc(wire));

  auto frame = unwrap_frame(wire, CrcPolicy::STRICT);
  ASSERT_TRUE(frame.has_value());
  auto parsed = NeoSetOutputPowerLimit::parse(*frame);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->device_id, NEO_ID);
  EXPECT_EQ(parsed->value, 42);
}

TEST(CommandTest, NeoReadOutputPowerLimitLayout) {
  NeoReadOutputPowerLimit command{NEO_ID};
  auto frame = command.build();
  ASSERT_EQ(frame.size(), 42u);
  EXPECT_EQ(read_uint16(frame, OFFSET_TYPE), 261);
  EXPECT_EQ(read_uint16(frame, 38), 3);
  EXPECT_EQ(read_uint16(frame, 40), 3);

  auto parsed = NeoReadOutputPowerLimit::parse(frame);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, command);
  EXPECT_FALSE(NeoSetOutputPowerLimit::parse(frame).has_value());
}

TEST(CommandTest, NeoOutputPowerLimitReport) {
  NeoOutputPowerLimit report{NEO_ID, 80};
  auto frame = report.build();
  ASSERT_EQ(frame.size(), NEO_POWER_LIMIT_REPORT_SIZE);
  EXPECT_EQ(read_uint16(frame, OFFSET_LENGTH), 38);

  auto parsed = NeoOutputPowerLimit::parse(frame);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, report);

  // The report validates as a single register read of register 3.
  auto message = ModbusMessage::parse(frame);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->function, ModbusFunction::READ_SINGLE_REGISTER);
  ASSERT_EQ(message->blocks.size(), 1u);
  EXPECT_EQ(message->blocks[0].start, 3);
}

TEST(CommandTest, NeoOutputPowerLimitRejectsOtherMarkers) {
  DecodeError error = DecodeError::NONE;
  auto frame = NeoOutputPowerLimit{NEO_ID, 0}.build();
  frame[41] = 2;
  EXPECT_FALSE(NeoOutputPowerLimit::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);

  auto command = NeoSetOutputPowerLimit{NEO_ID, 42}.build();
  EXPECT_FALSE(NeoOutputPowerLimit::parse(command, &error).has_value());
  EXPECT_EQ(error, DecodeError::MALFORMED_FRAME);
}

TEST(CommandTest, NoahSmartPowerLayout) {
  NoahSmartPower raise{NOAH_ID, 150};
  auto expected = header(42, 0x0110);
  append_id(expected, NOAH_ID, 16);
  expected.insert(expected.end(), 14, 0x00);
  expected.insert(expected.end(), {0x01, 0x36, 0x01, 0x38, 0x00, 0x00, 0x00, 0x96, 0x00, 0x01});
  EXPECT_EQ(raise.build(), expected);

  auto parsed = NoahSmartPower::parse(expected);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, raise);
}

TEST(CommandTest, NoahSmartPowerNegativeDiffSetsDown) {
  NoahSmartPower lower{NOAH_ID, -75};
  auto frame = lower.build();
  ASSERT_EQ(frame.size(), NOAH_SMART_POWER_SIZE);
  EXPECT_EQ(read_uint16(frame, 42), 75);
  EXPECT_EQ(read_uint16(frame, 44), 0);

  auto parsed = NoahSmartPower::parse(frame);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->power_diff, -75);
}

TEST(CommandTest, NoahSmartPowerChecksMarker) {
  auto frame = NoahSmartPower{NOAH_ID, 10}.build();
  frame[39] = 0x37;
  DecodeError error = DecodeError::NONE;
  EXPECT_FALSE(NoahSmartPower::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);
}

TEST(CommandTest, ReadSingleRegisterRejectsValueDifferentFromRegister) {
  auto frame = ReadSingleRegister{NEO_ID, 3}.build();
  frame[41] = 7;
  DecodeError error = DecodeError::NONE;
  EXPECT_FALSE(ReadSingleRegister::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);
}

TEST(CommandTest, RegisterFramesCheckHeaderWords) {
  DecodeError error = DecodeError::NONE;
  auto good = PresetSingleRegister{NOAH_ID, 252, 90}.build();

  auto longer = good;
  longer.push_back(0x00);
  EXPECT_FALSE(PresetSingleRegister::parse(longer, &error).has_value());
  EXPECT_EQ(error, DecodeError::MALFORMED_FRAME);

  auto counter = good;
  counter[1] = 2;
  EXPECT_FALSE(PresetSingleRegister::parse(counter, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);

  auto constant = good;
  constant[3] = 8;
  EXPECT_FALSE(PresetSingleRegister::parse(constant, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);

  auto length = good;
  length[5] = 37;
  EXPECT_FALSE(PresetSingleRegister::parse(length, &error).has_value());
  EXPECT_EQ(error, DecodeError::MALFORMED_FRAME);

  auto address = good;
  address[OFFSET_ADDRESS] = 2;
  EXPECT_FALSE(PresetSingleRegister::parse(address, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);
}

TEST(CommandTest, PresetMultipleRegisterLengthMustMatchValues) {
  auto frame = PresetMultipleRegister{NOAH_ID, 300, 301, {0x00, 0x01, 0x00, 0x02}}.build();
  frame.push_back(0x00);
  DecodeError error = DecodeError::NONE;
  EXPECT_FALSE(PresetMultipleRegister::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::MALFORMED_FRAME);
}

TEST(CommandTest, AcceptedFramesRebuildIdentically) {
  std::vector<std::vector<uint8_t>> frames = {
      ReadSingleRegister{NOAH_ID, 252}.build(),
      PresetSingleRegister{NOAH_ID, 252, 90}.build(),
      make_noah_slot1_power(NOAH_ID, 800).build(),
      NeoReadOutputPowerLimit{NEO_ID}.build(),
      NeoSetOutputPowerLimit{NEO_ID, 42}.build(),
      NeoOutputPowerLimit{NEO_ID, 80}.build(),
      NoahSmartPower{NOAH_ID, -75}.build(),
  };
  for (const auto &frame : frames) {
    if (auto cmd = ReadSingleRegister::parse(frame))
      EXPECT_EQ(cmd->build(), frame);
    if (auto cmd = PresetSingleRegister::parse(frame))
      EXPECT_EQ(cmd->build(), frame);
    if (auto cmd = PresetMultipleRegister::parse(frame))
      EXPECT_EQ(cmd->build(), frame);
    if (auto cmd = NeoReadOutputPowerLimit::parse(frame))
      EXPECT_EQ(cmd->build(), frame);
    if (auto cmd = NeoSetOutputPowerLimit::parse(frame))
      EXPECT_EQ(cmd->build(), frame);
    if (auto cmd = NeoOutputPowerLimit::parse(frame))
      EXPECT_EQ(cmd->build(), frame);
    if (auto cmd = NoahSmartPower::parse(frame))
      EXPECT_EQ(cmd->build(), frame);
  }
}

TEST(CommandTest, NeoReadOutputPowerLimitChecksBothMarkers) {
  auto frame = NeoReadOutputPowerLimit{NEO_ID}.build();
  frame[41] = 4;
  DecodeError error = DecodeError::NONE;
  EXPECT_FALSE(NeoReadOutputPowerLimit::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);
}

TEST(CommandTest, DeviceFramesRejectNonZeroPadding) {
  auto frame = NeoSetOutputPowerLimit{NEO_ID, 42}.build();
  frame[30] = 0x41;
  DecodeError error = DecodeError::NONE;
  EXPECT_FALSE(NeoSetOutputPowerLimit::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);
}

TEST(CommandTest, NoahSmartPowerRejectsBothDirections) {
  auto frame = NoahSmartPower{NOAH_ID, 10}.build();
  frame[43] = 5;
  DecodeError error = DecodeError::NONE;
  EXPECT_FALSE(NoahSmartPower::parse(frame, &error).has_value());
  EXPECT_EQ(error, DecodeError::NO_MATCH);

  frame = NoahSmartPower{NOAH_ID, 10}.build();
  frame[47] = 0;
  EXPECT_FALSE(NoahSmartPower::parse(frame, &error).has_value());
}

TEST(CommandTest, NoahSmartPowerClampsExtremeDiffs) {
  auto lowest = NoahSmartPower{NOAH_ID, INT32_MIN}.build();
  EXPECT_EQ(read_uint16(lowest, 42), 0xFFFF);
  EXPECT_EQ(read_uint16(lowest, 44), 0);

  auto highest = NoahSmartPower{NOAH_ID, INT32_MAX}.build();
  EXPECT_EQ(read_uint16(highest, 42), 0);
  EXPECT_EQ(read_uint16(highest, 44), 0xFFFF);
}

TEST(CommandTest, NumberStateConversions) {
  EXPECT_EQ(to_command_word(42.4f).value_or(0), 42);
  EXPECT_EQ(to_command_word(-5.0f).value_or(1), 0);
  EXPECT_EQ(to_command_word(1e9f).value_or(0), 0xFFFF);
  EXPECT_FALSE(to_command_word(NAN).has_value());

  EXPECT_EQ(to_power_diff(-75.0f).value_or(0), -75);
  EXPECT_EQ(to_power_diff(-1e12f).value_or(0), -65535);
  EXPECT_EQ(to_power_diff(1e12f).value_or(0), 65535);
  EXPECT_FALSE(to_power_diff(NAN).has_value());
}

TEST(CommandTest, VariantDispatch) {
  Command command = NoahSmartPower{NOAH_ID, 5};
  EXPECT_EQ(command_device_id(command), NOAH_ID);
  EXPECT_STREQ(command_name(command), "NoahSmartPower");
  EXPECT_EQ(build_command(command), NoahSmartPower({NOAH_ID, 5}).build());

  command = ReadSingleRegister{NEO_ID, 3};
  EXPECT_EQ(command_device_id(command), NEO_ID);
  EXPECT_STREQ(command_name(command), "ReadSingleRegister");
  EXPECT_EQ(build_command(command).size(), SINGLE_REGISTER_FRAME_SIZE);
}

}  // namespace grobro
}  // namespace esphome
