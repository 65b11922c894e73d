#include "grobro_classifier.h"
#include "grobro_constants.h"
#include "grobro_frame.h"
#include "grobro_modbus.h"

#include "esphome/core/log.h"

#include <algorithm>
#include <iterator>

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.classifier";

const char *message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::MALFORMED:
      return "MALFORMED";
    case MessageType::CONFIG:
      return "CONFIG";
    case MessageType::MODBUS_REGISTERS:
      return "MODBUS_REGISTERS";
    case MessageType::MODBUS_COMMAND:
      return "MODBUS_COMMAND";
    case MessageType::UNKNOWN:
    default:
      return "UNKNOWN";
  }
}

template<size_t N> static bool contains_type(const uint16_t (&types)[N], uint16_t type) {
  return std::find(std::begin(types), std::end(types), type) != std::end(types);
}

MessageType classify_live(const std::vector<uint8_t> &frame) {
  if (frame.size() < HEADER_SIZE)
    return MessageType::MALFORMED;

  if (ModbusMessage::validate_header(frame)) {
    switch (static_cast<ModbusFunction>(frame[OFFSET_FUNCTION])) {
      case ModbusFunction::PRESET_SINGLE_REGISTER:
      case ModbusFunction::PRESET_MULTIPLE_REGISTER:
        return MessageType::MODBUS_COMMAND;
      default:
        return MessageType::MODBUS_REGISTERS;
    }
  }

  uint16_t msg_type = read_uint16(frame, OFFSET_LENGTH);
  if (contains_type(LIVE_MODBUS_TYPES, msg_type))
    return MessageType::MODBUS_REGISTERS;
  if (contains_type(LIVE_CONFIG_TYPES, msg_type))
    return MessageType::CONFIG;

  ESP_LOGV(TAG, "Unknown live message type %u", msg_type);
  return MessageType::UNKNOWN;
}

MessageType classify_replay(const std::vector<uint8_t> &frame) {
  if (frame.size() < HEADER_SIZE)
    return MessageType::MALFORMED;

  uint16_t counter = read_uint16(frame, OFFSET_COUNTER);
  uint16_t msg_type = read_uint16(frame, OFFSET_TYPE);
  if (msg_type == REPLAY_CONFIG_TYPE || counter == 0)
    return MessageType::CONFIG;
  if (contains_type(REPLAY_MODBUS_TYPES, msg_type))
    return MessageType::MODBUS_REGISTERS;

  ESP_LOGV(TAG, "Unknown replay message type %u", msg_type);
  return MessageType::UNKNOWN;
}

}  // namespace grobro
}  // namespace esphome
