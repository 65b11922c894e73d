// components/grobro/grobro_modbus.h
#pragma once

#include "grobro_constants.h"
#include "grobro_frame.h"
#include "grobro_registers.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace esphome {
namespace grobro {

enum class ModbusFunction : uint8_t {
  READ_HOLDING_REGISTER = 3,
  READ_INPUT_REGISTER = 4,
  READ_SINGLE_REGISTER = 5,
  PRESET_SINGLE_REGISTER = 6,
  PRESET_MULTIPLE_REGISTER = 16,
};

bool is_known_function(uint8_t function);
const char *modbus_function_to_string(ModbusFunction function);

// Contiguous run of 16 bit register values.
//
//   H      start register
//   H      end register (M = end - start + 1, 1 <= M <= 512)
//   M x H  register values
struct ModbusBlock {
  uint16_t start{0};
  uint16_t end{0};
  std::vector<uint8_t> values;

  uint16_t quantity() const { return this->end - this->start + 1; }
  // Bytes on the wire, header included.
  size_t size() const { return MODBUS_BLOCK_HEADER_SIZE + this->values.size(); }
  bool contains(uint16_t register_no) const { return register_no >= this->start && register_no <= this->end; }
  // Bytes at the position, empty when the register is not in this block or
  // the position runs past the values.
  std::vector<uint8_t> get_data(const RegisterPosition &position) const;

  // Fails on an out of range quantity and on a truncated value region.
  static std::optional<ModbusBlock> parse(const std::vector<uint8_t> &data, size_t offset,
                                          DecodeError *error = nullptr);
  std::vector<uint8_t> build() const;

  bool operator==(const ModbusBlock &other) const {
    return this->start == other.start && this->end == other.end && this->values == other.values;
  }
};

// 7 byte timestamp: YY MM DD HH MM SS ms, year counted from 2000.
struct Timestamp {
  uint8_t year{0};
  uint8_t month{0};
  uint8_t day{0};
  uint8_t hour{0};
  uint8_t minute{0};
  uint8_t second{0};
  uint8_t millis{0};

  bool is_valid() const;
  // 20YY-MM-DDTHH:MM:SS, nothing for an out of range timestamp.
  std::optional<std::string> to_iso() const;

  static Timestamp parse(const std::vector<uint8_t> &data, size_t offset);
  void build_into(std::vector<uint8_t> &data) const;

  bool operator==(const Timestamp &other) const;
};

struct BlockReading {
  ModbusBlock block;
  std::vector<DecodedRegister> registers;
  size_t next_offset{0};
};

// Parses one register block at offset and decodes every descriptor whose
// register falls inside it.
std::optional<BlockReading> parse_block(const std::vector<uint8_t> &data, size_t offset,
                                        const RegisterCatalog::RegisterMap &descriptors,
                                        DecodeError *error = nullptr);

// Register report in the replay framing (type at offset 6).
struct ReplayMessage {
  uint16_t msg_ctr{0};
  uint16_t unknown_1{0};
  uint16_t msg_length{0};
  uint16_t msg_type{0};
  std::string device_id;
  std::string device_sn;
  std::optional<std::string> timestamp;
  std::optional<BlockReading> modbus1;
  std::string modbus1_error;
  std::optional<BlockReading> modbus2;

  // Registers of both blocks in order.
  std::vector<DecodedRegister> registers() const;
};

// Fixed preamble followed by up to two register blocks. The second block is
// best effort. Fails only when the preamble itself is truncated.
std::optional<ReplayMessage> parse_modbus_message(const std::vector<uint8_t> &data,
                                                  const RegisterCatalog::RegisterMap &descriptors);

// Only present on READ_INPUT_REGISTER messages.
struct ModbusMetadata {
  std::string device_sn;
  Timestamp timestamp;

  // Nothing for an out of range timestamp, like ReplayMessage::timestamp.
  // The raw fields stay so that build() reproduces the frame.
  std::optional<std::string> iso_timestamp() const { return this->timestamp.to_iso(); }

  bool operator==(const ModbusMetadata &other) const {
    return this->device_sn == other.device_sn && this->timestamp == other.timestamp;
  }
};

// Register message in the live framing.
//
//   H    counter
//   H    constant 7
//   H    msg_len, bytes after this field
//   B    modbus address, 1 over MQTT
//   B    function
//   30s  NUL padded device id
//   [30s device serial + 7B timestamp]  READ_INPUT_REGISTER only
//   N    register blocks
struct ModbusMessage {
  uint16_t counter{1};
  std::string device_id;
  ModbusFunction function{ModbusFunction::READ_INPUT_REGISTER};
  std::optional<ModbusMetadata> metadata;
  std::vector<ModbusBlock> blocks;

  uint16_t msg_len() const;
  // Bytes of the first block holding the register, empty if none does.
  std::vector<uint8_t> get_data(const RegisterPosition &position) const;
  // Decodes every descriptor with a value in this message.
  std::vector<DecodedRegister> decode_registers(const RegisterCatalog::RegisterMap &descriptors) const;

  // True when the header is complete, msg_len matches the frame and the
  // function is known.
  static bool validate_header(const std::vector<uint8_t> &frame);
  static std::optional<ModbusMessage> parse(const std::vector<uint8_t> &frame, DecodeError *error = nullptr);
  std::vector<uint8_t> build() const;

  bool operator==(const ModbusMessage &other) const;
};

}  // namespace grobro
}  // namespace esphome
