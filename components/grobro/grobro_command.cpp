#include "grobro_command.h"
#include "grobro_constants.h"
#include "grobro_modbus.h"

#include "esphome/core/log.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.command";

static const size_t OFFSET_REGISTER = HEADER_SIZE + DEVICE_ID_FIELD_SIZE;
static const size_t OFFSET_VALUE = OFFSET_REGISTER + 2;

static void set_error(DecodeError *error, DecodeError value) {
  if (error != nullptr)
    *error = value;
}

// 1, 7, msg_len, then either address/function or a device specific type word.
static void append_header(std::vector<uint8_t> &data, uint16_t msg_len, uint16_t type) {
  append_uint16(data, 1);
  append_uint16(data, PROTOCOL_CONSTANT);
  append_uint16(data, msg_len);
  append_uint16(data, type);
}

static void append_short_device_id(std::vector<uint8_t> &data, const std::string &device_id) {
  append_padded_ascii(data, device_id, SHORT_DEVICE_ID_SIZE);
  data.insert(data.end(), SHORT_DEVICE_ID_PADDING, 0x00);
}

static uint16_t function_type(ModbusFunction function) {
  return static_cast<uint16_t>((MODBUS_ADDRESS << 8) | static_cast<uint8_t>(function));
}

// Fixed header words every command frame carries: counter 1, constant 7 and
// a msg_len matching the frame size.
static bool check_frame_header(const std::vector<uint8_t> &frame, size_t min_size, size_t max_size, const char *name,
                               DecodeError *error) {
  if (frame.size() < min_size || frame.size() > max_size ||
      read_uint16(frame, OFFSET_LENGTH) != frame.size() - LENGTH_FIELD_END) {
    ESP_LOGV(TAG, "%s: bad frame size %u (msg_len %u)", name, (unsigned) frame.size(),
             frame.size() >= HEADER_SIZE ? read_uint16(frame, OFFSET_LENGTH) : 0);
    set_error(error, DecodeError::MALFORMED_FRAME);
    return false;
  }
  if (read_uint16(frame, OFFSET_COUNTER) != 1 || read_uint16(frame, OFFSET_CONSTANT) != PROTOCOL_CONSTANT) {
    ESP_LOGV(TAG, "%s: unexpected header %u/%u", name, read_uint16(frame, OFFSET_COUNTER),
             read_uint16(frame, OFFSET_CONSTANT));
    set_error(error, DecodeError::NO_MATCH);
    return false;
  }
  set_error(error, DecodeError::NONE);
  return true;
}

// Header, modbus address and function check shared by the register frames.
static bool check_register_frame(const std::vector<uint8_t> &frame, size_t max_size, ModbusFunction function,
                                 const char *name, DecodeError *error) {
  if (!check_frame_header(frame, SINGLE_REGISTER_FRAME_SIZE, max_size, name, error))
    return false;
  if (frame[OFFSET_ADDRESS] != MODBUS_ADDRESS || frame[OFFSET_FUNCTION] != static_cast<uint8_t>(function)) {
    ESP_LOGV(TAG, "%s: address %u function %u do not match", name, frame[OFFSET_ADDRESS], frame[OFFSET_FUNCTION]);
    set_error(error, DecodeError::NO_MATCH);
    return false;
  }
  return true;
}

// Header, type word and zero padding behind the 16 byte device id, shared by
// the device specific frames.
static bool check_typed_frame(const std::vector<uint8_t> &frame, size_t size, uint16_t type, const char *name,
                              DecodeError *error) {
  if (!check_frame_header(frame, size, size, name, error))
    return false;
  if (read_uint16(frame, OFFSET_TYPE) != type) {
    set_error(error, DecodeError::NO_MATCH);
    return false;
  }
  auto padding = frame.begin() + HEADER_SIZE + SHORT_DEVICE_ID_SIZE;
  if (std::any_of(padding, padding + SHORT_DEVICE_ID_PADDING, [](uint8_t b) { return b != 0; })) {
    ESP_LOGV(TAG, "%s: device id padding is not zero", name);
    set_error(error, DecodeError::NO_MATCH);
    return false;
  }
  return true;
}

std::vector<uint8_t> ReadSingleRegister::build() const {
  std::vector<uint8_t> data;
  data.reserve(SINGLE_REGISTER_FRAME_SIZE);
  append_header(data, SINGLE_REGISTER_MSG_LEN, function_type(ModbusFunction::READ_SINGLE_REGISTER));
  append_padded_ascii(data, this->device_id, DEVICE_ID_FIELD_SIZE);
  append_uint16(data, this->register_no);
  append_uint16(data, this->register_no);
  return data;
}

std::optional<ReadSingleRegister> ReadSingleRegister::parse(const std::vector<uint8_t> &frame, DecodeError *error) {
  if (!check_register_frame(frame, SINGLE_REGISTER_FRAME_SIZE, ModbusFunction::READ_SINGLE_REGISTER,
                            "ReadSingleRegister", error))
    return {};
  // A read repeats the register in the value word.
  if (read_uint16(frame, OFFSET_VALUE) != read_uint16(frame, OFFSET_REGISTER)) {
    ESP_LOGV(TAG, "ReadSingleRegister: value %u differs from register %u", read_uint16(frame, OFFSET_VALUE),
             read_uint16(frame, OFFSET_REGISTER));
    set_error(error, DecodeError::NO_MATCH);
    return {};
  }
  ReadSingleRegister command;
  command.device_id = read_ascii(frame, HEADER_SIZE, DEVICE_ID_FIELD_SIZE);
  command.register_no = read_uint16(frame, OFFSET_REGISTER);
  return command;
}

std::vector<uint8_t> PresetSingleRegister::build() const {
  std::vector<uint8_t> data;
  data.reserve(SINGLE_REGISTER_FRAME_SIZE);
  append_header(data, SINGLE_REGISTER_MSG_LEN, function_type(ModbusFunction::PRESET_SINGLE_REGISTER));
  append_padded_ascii(data, this->device_id, DEVICE_ID_FIELD_SIZE);
  append_uint16(data, this->register_no);
  append_uint16(data, this->value);
  return data;
}

std::optional<PresetSingleRegister> PresetSingleRegister::parse(const std::vector<uint8_t> &frame,
                                                                DecodeError *error) {
  if (!check_register_frame(frame, SINGLE_REGISTER_FRAME_SIZE, ModbusFunction::PRESET_SINGLE_REGISTER,
                            "PresetSingleRegister", error))
    return {};
  PresetSingleRegister command;
  command.device_id = read_ascii(frame, HEADER_SIZE, DEVICE_ID_FIELD_SIZE);
  command.register_no = read_uint16(frame, OFFSET_REGISTER);
  command.value = read_uint16(frame, OFFSET_VALUE);
  return command;
}

std::vector<uint8_t> PresetMultipleRegister::build() const {
  std::vector<uint8_t> data;
  data.reserve(SINGLE_REGISTER_FRAME_SIZE + this->values.size());
  append_header(data, static_cast<uint16_t>(SINGLE_REGISTER_MSG_LEN + this->values.size()),
                function_type(ModbusFunction::PRESET_MULTIPLE_REGISTER));
  append_padded_ascii(data, this->device_id, DEVICE_ID_FIELD_SIZE);
  append_uint16(data, this->start);
  append_uint16(data, this->end);
  data.insert(data.end(), this->values.begin(), this->values.end());
  return data;
}

std::optional<PresetMultipleRegister> PresetMultipleRegister::parse(const std::vector<uint8_t> &frame,
                                                                    DecodeError *error) {
  if (!check_register_frame(frame, SIZE_MAX, ModbusFunction::PRESET_MULTIPLE_REGISTER, "PresetMultipleRegister",
                            error))
    return {};
  PresetMultipleRegister command;
  command.device_id = read_ascii(frame, HEADER_SIZE, DEVICE_ID_FIELD_SIZE);
  command.start = read_uint16(frame, OFFSET_REGISTER);
  command.end = read_uint16(frame, OFFSET_VALUE);
  command.values.assign(frame.begin() + SINGLE_REGISTER_FRAME_SIZE, frame.end());
  return command;
}

std::vector<uint8_t> NeoReadOutputPowerLimit::build() const {
  std::vector<uint8_t> data;
  data.reserve(SINGLE_REGISTER_FRAME_SIZE);
  append_header(data, NEO_POWER_LIMIT_COMMAND_LEN, NEO_POWER_LIMIT_READ_TYPE);
  append_short_device_id(data, this->device_id);
  append_uint16(data, NEO_POWER_LIMIT_MARKER);
  append_uint16(data, NEO_POWER_LIMIT_MARKER);
  return data;
}

std::optional<NeoReadOutputPowerLimit> NeoReadOutputPowerLimit::parse(const std::vector<uint8_t> &frame,
                                                                      DecodeError *error) {
  if (!check_typed_frame(frame, SINGLE_REGISTER_FRAME_SIZE, NEO_POWER_LIMIT_READ_TYPE, "NeoReadOutputPowerLimit",
                         error))
    return {};
  if (read_uint16(frame, OFFSET_REGISTER) != NEO_POWER_LIMIT_MARKER ||
      read_uint16(frame, OFFSET_VALUE) != NEO_POWER_LIMIT_MARKER) {
    set_error(error, DecodeError::NO_MATCH);
    return {};
  }
  NeoReadOutputPowerLimit command;
  command.device_id = read_ascii(frame, HEADER_SIZE, SHORT_DEVICE_ID_SIZE);
  return command;
}

std::vector<uint8_t> NeoSetOutputPowerLimit::build() const {
  std::vector<uint8_t> data;
  data.reserve(SINGLE_REGISTER_FRAME_SIZE);
  append_header(data, NEO_POWER_LIMIT_COMMAND_LEN, NEO_POWER_LIMIT_SET_TYPE);
  append_short_device_id(data, this->device_id);
  append_uint16(data, NEO_POWER_LIMIT_MARKER);
  append_uint16(data, this->value);
  return data;
}

std::optional<NeoSetOutputPowerLimit> NeoSetOutputPowerLimit::parse(const std::vector<uint8_t> &frame,
                                                                    DecodeError *error) {
  if (!check_typed_frame(frame, SINGLE_REGISTER_FRAME_SIZE, NEO_POWER_LIMIT_SET_TYPE, "NeoSetOutputPowerLimit",
                         error))
    return {};
  if (read_uint16(frame, OFFSET_REGISTER) != NEO_POWER_LIMIT_MARKER) {
    set_error(error, DecodeError::NO_MATCH);
    return {};
  }
  NeoSetOutputPowerLimit command;
  command.device_id = read_ascii(frame, HEADER_SIZE, SHORT_DEVICE_ID_SIZE);
  command.value = read_uint16(frame, OFFSET_VALUE);
  return command;
}

std::vector<uint8_t> NeoOutputPowerLimit::build() const {
  std::vector<uint8_t> data;
  data.reserve(NEO_POWER_LIMIT_REPORT_SIZE);
  append_header(data, NEO_POWER_LIMIT_REPORT_LEN, NEO_POWER_LIMIT_READ_TYPE);
  append_short_device_id(data, this->device_id);
  append_uint16(data, NEO_POWER_LIMIT_MARKER);
  append_uint16(data, NEO_POWER_LIMIT_MARKER);
  append_uint16(data, this->value);
  return data;
}

std::optional<NeoOutputPowerLimit> NeoOutputPowerLimit::parse(const std::vector<uint8_t> &frame,
                                                              DecodeError *error) {
  if (!check_typed_frame(frame, NEO_POWER_LIMIT_REPORT_SIZE, NEO_POWER_LIMIT_READ_TYPE, "NeoOutputPowerLimit", error))
    return {};
  // The same type pair shows up with 2 and a zero value, that is not a limit.
  if (read_uint16(frame, OFFSET_REGISTER) != NEO_POWER_LIMIT_MARKER ||
      read_uint16(frame, OFFSET_VALUE) != NEO_POWER_LIMIT_MARKER) {
    ESP_LOGD(TAG, "NeoOutputPowerLimit: unexpected marker %u", read_uint16(frame, OFFSET_VALUE));
    set_error(error, DecodeError::NO_MATCH);
    return {};
  }
  NeoOutputPowerLimit report;
  report.device_id = read_ascii(frame, HEADER_SIZE, SHORT_DEVICE_ID_SIZE);
  report.value = read_uint16(frame, OFFSET_VALUE + 2);
  return report;
}

std::vector<uint8_t> NoahSmartPower::build() const {
  uint16_t set_up = 0;
  uint16_t set_down = 0;
  if (this->power_diff > 0) {
    set_up = static_cast<uint16_t>(std::min<int32_t>(this->power_diff, UINT16_MAX));
  } else {
    set_down = static_cast<uint16_t>(std::min<int64_t>(-static_cast<int64_t>(this->power_diff), UINT16_MAX));
  }

  std::vector<uint8_t> data;
  data.reserve(NOAH_SMART_POWER_SIZE);
  append_header(data, NOAH_SMART_POWER_LEN, NOAH_SMART_POWER_TYPE);
  append_short_device_id(data, this->device_id);
  data.insert(data.end(), std::begin(NOAH_SMART_POWER_MARKER), std::end(NOAH_SMART_POWER_MARKER));
  append_uint16(data, set_down);
  append_uint16(data, set_up);
  append_uint16(data, 1);
  return data;
}

std::optional<NoahSmartPower> NoahSmartPower::parse(const std::vector<uint8_t> &frame, DecodeError *error) {
  if (!check_typed_frame(frame, NOAH_SMART_POWER_SIZE, NOAH_SMART_POWER_TYPE, "NoahSmartPower", error))
    return {};
  if (!std::equal(std::begin(NOAH_SMART_POWER_MARKER), std::end(NOAH_SMART_POWER_MARKER),
                  frame.begin() + OFFSET_REGISTER)) {
    set_error(error, DecodeError::NO_MATCH);
    return {};
  }
  uint16_t set_down = read_uint16(frame, OFFSET_REGISTER + 4);
  uint16_t set_up = read_uint16(frame, OFFSET_REGISTER + 6);
  // Only one direction is set at a time, followed by the constant 1.
  if ((set_up != 0 && set_down != 0) || read_uint16(frame, OFFSET_REGISTER + 8) != 1) {
    ESP_LOGV(TAG, "NoahSmartPower: set_down %u set_up %u not a single diff", set_down, set_up);
    set_error(error, DecodeError::NO_MATCH);
    return {};
  }

  NoahSmartPower command;
  command.device_id = read_ascii(frame, HEADER_SIZE, SHORT_DEVICE_ID_SIZE);
  command.power_diff = set_up > 0 ? static_cast<int32_t>(set_up) : -static_cast<int32_t>(set_down);
  return command;
}

PresetMultipleRegister make_noah_slot1_power(const std::string &device_id, uint16_t power) {
  PresetMultipleRegister command;
  command.device_id = device_id;
  command.start = NOAH_SLOT1_START;
  command.end = NOAH_SLOT1_END;
  // start 00:00, end 23:59, power, enabled
  command.values = {0, 0, 23, 59};
  append_uint16(command.values, 0);
  append_uint16(command.values, power);
  append_uint16(command.values, 1);
  return command;
}

std::optional<uint16_t> to_command_word(float value) {
  if (std::isnan(value))
    return {};
  return static_cast<uint16_t>(std::clamp(std::round(value), 0.0f, static_cast<float>(UINT16_MAX)));
}

std::optional<int32_t> to_power_diff(float value) {
  if (std::isnan(value))
    return {};
  const float limit = static_cast<float>(UINT16_MAX);
  return static_cast<int32_t>(std::clamp(std::round(value), -limit, limit));
}

std::vector<uint8_t> build_command(const Command &command) {
  return std::visit([](const auto &cmd) { return cmd.build(); }, command);
}

const std::string &command_device_id(const Command &command) {
  return std::visit([](const auto &cmd) -> const std::string & { return cmd.device_id; }, command);
}

const char *command_name(const Command &command) {
  switch (command.index()) {
    case 0:
      return "ReadSingleRegister";
    case 1:
      return "PresetSingleRegister";
    case 2:
      return "PresetMultipleRegister";
    case 3:
      return "NeoReadOutputPowerLimit";
    case 4:
      return "NeoSetOutputPowerLimit";
    case 5:
      return "NoahSmartPower";
    default:
      return "Unknown";
  }
}

}  // namespace grobro
}  // namespace esphome
