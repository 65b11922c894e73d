#pragma once

#include "grobro_frame.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace esphome {
namespace grobro {

// Single register frames, 42 bytes:
//
//   H    1
//   H    7
//   H    msg_len 36
//   B    modbus address 1
//   B    function
//   30s  NUL padded device id
//   H    register
//   H    value (READ_SINGLE_REGISTER repeats the register)
//
// Parsers accept a frame only when build() of the result reproduces it.

struct ReadSingleRegister {
  std::string device_id;
  uint16_t register_no{0};

  std::vector<uint8_t> build() const;
  static std::optional<ReadSingleRegister> parse(const std::vector<uint8_t> &frame, DecodeError *error = nullptr);

  bool operator==(const ReadSingleRegister &other) const {
    return this->device_id == other.device_id && this->register_no == other.register_no;
  }
};

struct PresetSingleRegister {
  std::string device_id;
  uint16_t register_no{0};
  uint16_t value{0};

  std::vector<uint8_t> build() const;
  static std::optional<PresetSingleRegister> parse(const std::vector<uint8_t> &frame, DecodeError *error = nullptr);

  bool operator==(const PresetSingleRegister &other) const {
    return this->device_id == other.device_id && this->register_no == other.register_no &&
           this->value == other.value;
  }
};

// Same header as the single register frames, followed by start, end and the
// raw register values. msg_len = 36 + values.
struct PresetMultipleRegister {
  std::string device_id;
  uint16_t start{0};
  uint16_t end{0};
  std::vector<uint8_t> values;

  std::vector<uint8_t> build() const;
  static std::optional<PresetMultipleRegister> parse(const std::vector<uint8_t> &frame,
                                                     DecodeError *error = nullptr);

  bool operator==(const PresetMultipleRegister &other) const {
    return this->device_id == other.device_id && this->start == other.start && this->end == other.end &&
           this->values == other.values;
  }
};

// NEO frames carry a 16 byte device id followed by 14 zero bytes and the
// marker word 3. Type pairs (length, type): read 36/261, set 36/262,
// report 38/261.

struct NeoReadOutputPowerLimit {
  std::string device_id;

  std::vector<uint8_t> build() const;
  static std::optional<NeoReadOutputPowerLimit> parse(const std::vector<uint8_t> &frame,
                                                      DecodeError *error = nullptr);

  bool operator==(const NeoReadOutputPowerLimit &other) const { return this->device_id == other.device_id; }
};

struct NeoSetOutputPowerLimit {
  std::string device_id;
  uint16_t value{0};  // percent

  std::vector<uint8_t> build() const;
  static std::optional<NeoSetOutputPowerLimit> parse(const std::vector<uint8_t> &frame,
                                                     DecodeError *error = nullptr);

  bool operator==(const NeoSetOutputPowerLimit &other) const {
    return this->device_id == other.device_id && this->value == other.value;
  }
};

// Sent by the inverter in reply to NeoReadOutputPowerLimit, 44 bytes.
struct NeoOutputPowerLimit {
  std::string device_id;
  uint16_t value{0};

  std::vector<uint8_t> build() const;
  static std::optional<NeoOutputPowerLimit> parse(const std::vector<uint8_t> &frame, DecodeError *error = nullptr);

  bool operator==(const NeoOutputPowerLimit &other) const {
    return this->device_id == other.device_id && this->value == other.value;
  }
};

// NOAH smart power, 48 bytes: header 1/7/42/0x0110, 16 byte device id,
// 14 zero bytes, 01 36 01 38, set_down, set_up, 1.
// A positive diff raises the output (set_up), a negative one lowers it.
struct NoahSmartPower {
  std::string device_id;
  int32_t power_diff{0};

  std::vector<uint8_t> build() const;
  static std::optional<NoahSmartPower> parse(const std::vector<uint8_t> &frame, DecodeError *error = nullptr);

  bool operator==(const NoahSmartPower &other) const {
    return this->device_id == other.device_id && this->power_diff == other.power_diff;
  }
};

// NOAH slot 1 output power, written as registers 254..258.
PresetMultipleRegister make_noah_slot1_power(const std::string &device_id, uint16_t power);

// Number state to a 16 bit command argument, rounded and clamped.
// NaN gives nothing.
std::optional<uint16_t> to_command_word(float value);
// Number state to a NOAH power diff, clamped to what set_up/set_down carry.
std::optional<int32_t> to_power_diff(float value);

// Every command the hub can send to a device.
using Command = std::variant<ReadSingleRegister, PresetSingleRegister, PresetMultipleRegister,
                             NeoReadOutputPowerLimit, NeoSetOutputPowerLimit, NoahSmartPower>;

// Unscrambled frame of the command. Callers wrap it before sending.
std::vector<uint8_t> build_command(const Command &command);
const std::string &command_device_id(const Command &command);
const char *command_name(const Command &command);

}  // namespace grobro
}  // namespace esphome
