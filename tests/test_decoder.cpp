#include <gtest/gtest.h>

#include "grobro_command.h"
#include "grobro_decoder.h"
#include "grobro_frame.h"
#include "grobro_modbus.h"

namespace esphome {
namespace grobro {

static const char *const NEO_ID = "QMN000ABC1D2E3FG";
static const char *const TOPIC = "c/QMN000ABC1D2E3FG";

static RegisterDescriptor word_register(uint16_t register_no, double multiplier) {
  RegisterDescriptor descriptor;
  descriptor.position.register_no = register_no;
  descriptor.data_type = RegisterDataType::make_float(multiplier);
  return descriptor;
}

// Input register 1 is Ppv (x100), holding register 1 is the power limit.
static MessageDecoder make_decoder() {
  MessageDecoder decoder;
  decoder.set_device_id(NEO_ID);
  decoder.get_catalog().add_input_register("Ppv", word_register(1, 100.0));
  decoder.get_catalog().add_holding_register("power_limit", word_register(1, 1.0));
  return decoder;
}

static std::vector<uint8_t> register_payload(ModbusFunction function, uint16_t value) {
  ModbusMessage message;
  message.device_id = NEO_ID;
  message.function = function;
  if (function == ModbusFunction::READ_INPUT_REGISTER) {
    ModbusMetadata metadata;
    metadata.device_sn = NEO_ID;
    metadata.timestamp = Timestamp::parse({25, 6, 14, 15, 32, 1, 0}, 0);
    message.metadata = metadata;
  }
  ModbusBlock block;
  block.start = 0;
  block.end = 1;
  block.values = {0x00, 0x00, static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)};
  message.blocks.push_back(block);
  return wrap_frame(message.build());
}

TEST(DecoderTest, TopicDeviceId) {
  EXPECT_EQ(topic_device_id("c/QMN000ABC1D2E3FG"), "QMN000ABC1D2E3FG");
  EXPECT_EQ(topic_device_id("QMN000ABC1D2E3FG"), "QMN000ABC1D2E3FG");
}

TEST(DecoderTest, InputRegistersGoToInputEntities) {
  auto decoder = make_decoder();
  auto result = decoder.decode(TOPIC, register_payload(ModbusFunction::READ_INPUT_REGISTER, 5));
  EXPECT_EQ(result.outcome, DecodeOutcome::INPUT_REGISTERS);
  ASSERT_EQ(result.registers.size(), 1u);
  EXPECT_EQ(result.registers[0].name, "Ppv");
  EXPECT_DOUBLE_EQ(result.registers[0].value.number(), 500.0);
  EXPECT_EQ(result.timestamp.value_or(""), "2025-06-14T15:32:01");
}

TEST(DecoderTest, HoldingRegistersGoToHoldingEntities) {
  auto decoder = make_decoder();
  auto result = decoder.decode(TOPIC, register_payload(ModbusFunction::READ_HOLDING_REGISTER, 80));
  EXPECT_EQ(result.outcome, DecodeOutcome::HOLDING_REGISTERS);
  ASSERT_EQ(result.registers.size(), 1u);
  EXPECT_EQ(result.registers[0].name, "power_limit");
  EXPECT_DOUBLE_EQ(result.registers[0].value.number(), 80.0);
}

TEST(DecoderTest, SanityLimitDropsWholeMessage) {
  auto decoder = make_decoder();
  // 20000 * 100 is above the default Ppv limit of 1,000,000
  auto result = decoder.decode(TOPIC, register_payload(ModbusFunction::READ_INPUT_REGISTER, 20000));
  EXPECT_EQ(result.outcome, DecodeOutcome::DROPPED);
  EXPECT_TRUE(result.registers.empty());

  decoder.set_sanity_limit("Ppv", 5000000.0f);
  result = decoder.decode(TOPIC, register_payload(ModbusFunction::READ_INPUT_REGISTER, 20000));
  EXPECT_EQ(result.outcome, DecodeOutcome::INPUT_REGISTERS);
}

TEST(DecoderTest, SanityLimitLeavesHoldingReportsAlone) {
  auto decoder = make_decoder();
  decoder.set_sanity_limit("power_limit", 10.0f);
  auto result = decoder.decode(TOPIC, register_payload(ModbusFunction::READ_HOLDING_REGISTER, 80));
  EXPECT_EQ(result.outcome, DecodeOutcome::HOLDING_REGISTERS);
}

TEST(DecoderTest, FiltersDevices) {
  auto decoder = make_decoder();
  auto payload = register_payload(ModbusFunction::READ_INPUT_REGISTER, 5);

  auto unknown = decoder.decode("c/XYZ000ABC1D2E3FG", payload);
  EXPECT_EQ(unknown.outcome, DecodeOutcome::UNKNOWN_DEVICE);
  EXPECT_EQ(unknown.device_id, "XYZ000ABC1D2E3FG");

  auto other = decoder.decode("c/QMN999ZZZ1D2E3FG", payload);
  EXPECT_EQ(other.outcome, DecodeOutcome::IGNORED);
  EXPECT_TRUE(other.registers.empty());
}

TEST(DecoderTest, ChecksumPolicy) {
  auto decoder = make_decoder();
  auto payload = register_payload(ModbusFunction::READ_INPUT_REGISTER, 5);
  payload.back() ^= 0xFF;

  EXPECT_EQ(decoder.decode(TOPIC, payload).outcome, DecodeOutcome::INPUT_REGISTERS);

  decoder.set_crc_policy(CrcPolicy::STRICT);
  EXPECT_EQ(decoder.decode(TOPIC, payload).outcome, DecodeOutcome::DROPPED);
  EXPECT_EQ(decoder.decode(TOPIC, register_payload(ModbusFunction::READ_INPUT_REGISTER, 5)).outcome,
            DecodeOutcome::INPUT_REGISTERS);
}

TEST(DecoderTest, WriteEchoIsAnAck) {
  auto decoder = make_decoder();
  auto payload = wrap_frame(PresetSingleRegister{NEO_ID, 1, 50}.build());
  EXPECT_EQ(decoder.decode(TOPIC, payload).outcome, DecodeOutcome::WRITE_ACK);
}

TEST(DecoderTest, NeoPowerLimitReport) {
  auto decoder = make_decoder();
  auto result = decoder.decode(TOPIC, wrap_frame(NeoOutputPowerLimit{NEO_ID, 80}.build()));
  EXPECT_EQ(result.outcome, DecodeOutcome::HOLDING_REGISTERS);
  ASSERT_TRUE(result.power_limit.has_value());
  EXPECT_EQ(result.power_limit->value, 80);
}

TEST(DecoderTest, ReportTypeWithoutModbusHeaderIsUnhandled) {
  auto decoder = make_decoder();
  // type 323 in the length field, nothing that validates as a modbus header
  std::vector<uint8_t> frame = {0x00, 0x01, 0x00, 0x07, 0x01, 0x43, 0x01, 0x04};
  frame.resize(100, 0x00);
  EXPECT_EQ(decoder.decode(TOPIC, wrap_frame(frame)).outcome, DecodeOutcome::UNHANDLED);
}

TEST(DecoderTest, ConfigAnnouncement) {
  auto decoder = make_decoder();
  // type 340 in the length field, TLV block behind the preamble
  std::vector<uint8_t> frame = {0x00, 0x01, 0x00, 0x07, 0x01, 0x54, 0x01, 0x18};
  frame.resize(0x20, 0x00);
  std::string serial = NEO_ID;
  frame.insert(frame.end(), {0x00, 0x08, 0x00, static_cast<uint8_t>(serial.size())});
  frame.insert(frame.end(), serial.begin(), serial.end());

  auto result = decoder.decode(TOPIC, wrap_frame(frame));
  EXPECT_EQ(result.outcome, DecodeOutcome::CONFIG);
  EXPECT_EQ(result.config.device_id(), NEO_ID);
}

TEST(DecoderTest, ShortPayloadIsDropped) {
  auto decoder = make_decoder();
  EXPECT_EQ(decoder.decode(TOPIC, {0x00, 0x01, 0x00}).outcome, DecodeOutcome::DROPPED);
}

}  // namespace grobro
}  // namespace esphome
