// components/grobro/grobro_constants.h
#pragma once

#include <cstddef>
#include <cstdint>

namespace esphome {
namespace grobro {

// Every Growatt MQTT frame starts with an 8 byte cleartext header.
static const size_t HEADER_SIZE = 8;
static const size_t CRC_SIZE = 2;

// XOR mask applied to everything past the header
static const char SCRAMBLE_KEY[] = "Growatt";
static const size_t SCRAMBLE_KEY_LENGTH = 7;

// Second header word, constant on every frame seen so far
static const uint16_t PROTOCOL_CONSTANT = 7;
static const uint8_t MODBUS_ADDRESS = 1;

// Header field offsets
static const size_t OFFSET_COUNTER = 0;
static const size_t OFFSET_CONSTANT = 2;
static const size_t OFFSET_LENGTH = 4;
static const size_t OFFSET_TYPE = 6;
static const size_t OFFSET_ADDRESS = 6;
static const size_t OFFSET_FUNCTION = 7;

// msg_len counts everything after the length field
static const size_t LENGTH_FIELD_END = 6;

// Live message types (read at offset 4).
// NOAH=387 NEO=340,341
static const uint16_t LIVE_CONFIG_TYPES[] = {387, 340, 341};
static const uint16_t LIVE_MODBUS_TYPES[] = {323, 577};

// Replay message types (read at offset 6).
static const uint16_t REPLAY_CONFIG_TYPE = 281;
// NOAH=259,260 NEO=259,260,336
static const uint16_t REPLAY_MODBUS_TYPES[] = {259, 260, 336};

// TLV configuration block
static const size_t CONFIG_SCAN_START = 0x1C;
static const uint16_t CONFIG_MAX_VALUE_LENGTH = 512;
static const uint16_t CONFIG_MAX_SCAN_KEY = 1000;
static const uint16_t CONFIG_MAX_SCAN_LENGTH = 256;

// Register blocks
static const uint16_t MODBUS_MAX_REGISTERS = 512;
static const size_t MODBUS_BLOCK_HEADER_SIZE = 4;

// Live modbus framing: 8 byte header + 30 byte device id
static const size_t MODBUS_HEADER_SIZE = 38;
static const size_t DEVICE_ID_FIELD_SIZE = 30;
static const size_t METADATA_SERIAL_SIZE = 30;
static const size_t TIMESTAMP_SIZE = 7;
static const size_t METADATA_SIZE = METADATA_SERIAL_SIZE + TIMESTAMP_SIZE;

// Replay preamble
static const size_t REPLAY_DEVICE_ID_SIZE = 16;
static const size_t REPLAY_RESERVED_1_SIZE = 14;
static const size_t REPLAY_SERIAL_SIZE = 10;
static const size_t REPLAY_RESERVED_2_SIZE = 20;
static const size_t REPLAY_PREAMBLE_SIZE = HEADER_SIZE + REPLAY_DEVICE_ID_SIZE + REPLAY_RESERVED_1_SIZE +
                                           REPLAY_SERIAL_SIZE + REPLAY_RESERVED_2_SIZE + TIMESTAMP_SIZE;

// Command frames
static const size_t SINGLE_REGISTER_FRAME_SIZE = 42;
static const uint16_t SINGLE_REGISTER_MSG_LEN = 36;

// Device specific frames: 16 byte device id followed by 14 zero bytes
static const size_t SHORT_DEVICE_ID_SIZE = 16;
static const size_t SHORT_DEVICE_ID_PADDING = 14;

// NEO output power limit
static const uint16_t NEO_POWER_LIMIT_COMMAND_LEN = 36;
static const uint16_t NEO_POWER_LIMIT_REPORT_LEN = 38;
static const uint16_t NEO_POWER_LIMIT_READ_TYPE = 261;
static const uint16_t NEO_POWER_LIMIT_SET_TYPE = 262;
static const uint16_t NEO_POWER_LIMIT_MARKER = 3;
static const size_t NEO_POWER_LIMIT_REPORT_SIZE = 44;

// NOAH smart power
static const uint16_t NOAH_SMART_POWER_LEN = 42;
static const uint16_t NOAH_SMART_POWER_TYPE = 0x0110;
static const uint8_t NOAH_SMART_POWER_MARKER[] = {0x01, 0x36, 0x01, 0x38};
static const size_t NOAH_SMART_POWER_SIZE = 48;

// NOAH slot 1 power, written as one multiple register command
static const uint16_t NOAH_SLOT1_START = 254;
static const uint16_t NOAH_SLOT1_END = 258;

// Topics
static const char DEFAULT_SUBSCRIBE_TOPIC[] = "c/#";
static const char DEFAULT_COMMAND_TOPIC_PREFIX[] = "s/33/";

}  // namespace grobro
}  // namespace esphome
