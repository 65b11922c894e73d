#pragma once

#include <cstdint>
#include <vector>

namespace esphome {
namespace grobro {

enum class MessageType : uint8_t {
  MALFORMED,         // shorter than the header
  CONFIG,            // TLV configuration announcement
  MODBUS_REGISTERS,  // register report (functions 3, 4 and 5)
  MODBUS_COMMAND,    // echo of a write (functions 6 and 16)
  UNKNOWN,           // valid header, type not handled
};

const char *message_type_to_string(MessageType type);

// Frames received over MQTT. The type word sits at offset 4; a frame whose
// length field and function byte validate as a modbus message wins over the
// type table. A register report type without a valid modbus header still
// classifies as MODBUS_REGISTERS; MessageDecoder reports it as unhandled.
MessageType classify_live(const std::vector<uint8_t> &frame);

// Captured frames in the older framing. The type word sits at offset 6, a
// zero message counter marks a configuration dump.
MessageType classify_replay(const std::vector<uint8_t> &frame);

}  // namespace grobro
}  // namespace esphome
