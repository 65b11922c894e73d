#include "grobro_decoder.h"
#include "grobro_classifier.h"
#include "grobro_constants.h"

#include "esphome/core/helpers.h"
#include "esphome/core/log.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.decoder";

const char *decode_outcome_to_string(DecodeOutcome outcome) {
  switch (outcome) {
    case DecodeOutcome::IGNORED:
      return "IGNORED";
    case DecodeOutcome::UNKNOWN_DEVICE:
      return "UNKNOWN_DEVICE";
    case DecodeOutcome::DROPPED:
      return "DROPPED";
    case DecodeOutcome::INPUT_REGISTERS:
      return "INPUT_REGISTERS";
    case DecodeOutcome::HOLDING_REGISTERS:
      return "HOLDING_REGISTERS";
    case DecodeOutcome::WRITE_ACK:
      return "WRITE_ACK";
    case DecodeOutcome::CONFIG:
      return "CONFIG";
    case DecodeOutcome::UNHANDLED:
    default:
      return "UNHANDLED";
  }
}

std::string topic_device_id(const std::string &topic) { return topic.substr(topic.rfind('/') + 1); }

void MessageDecoder::set_device_id(const std::string &device_id) {
  this->device_id_ = device_id;
  this->catalog_ = RegisterCatalog(detect_device_family(device_id));
}

DecodedMessage MessageDecoder::decode(const std::string &topic, const std::vector<uint8_t> &payload) const {
  DecodedMessage result;
  result.device_id = topic_device_id(topic);

  if (detect_device_family(result.device_id) == DeviceFamily::UNKNOWN) {
    ESP_LOGW(TAG, "Dropping message from unrecognized device %s", result.device_id.c_str());
    result.outcome = DecodeOutcome::UNKNOWN_DEVICE;
    return result;
  }
  if (result.device_id != this->device_id_) {
    ESP_LOGV(TAG, "Ignoring message for %s", result.device_id.c_str());
    result.outcome = DecodeOutcome::IGNORED;
    return result;
  }

  auto frame = unwrap_frame(payload, this->crc_policy_);
  if (!frame.has_value()) {
    result.outcome = DecodeOutcome::DROPPED;
    return result;
  }
  ESP_LOGV(TAG, "Received %s: %s", topic.c_str(), format_hex_pretty(*frame).c_str());

  switch (classify_live(*frame)) {
    case MessageType::MODBUS_REGISTERS:
    case MessageType::MODBUS_COMMAND:
      this->decode_modbus_(*frame, result);
      break;
    case MessageType::CONFIG:
      result.config = parse_config(*frame, find_config_offset(*frame));
      result.outcome = DecodeOutcome::CONFIG;
      break;
    case MessageType::MALFORMED:
      ESP_LOGW(TAG, "Malformed frame from %s (%u bytes)", result.device_id.c_str(), (unsigned) frame->size());
      result.outcome = DecodeOutcome::DROPPED;
      break;
    case MessageType::UNKNOWN:
      ESP_LOGD(TAG, "Unknown message type %u from %s", read_uint16(*frame, OFFSET_LENGTH), result.device_id.c_str());
      result.outcome = DecodeOutcome::UNHANDLED;
      break;
  }
  return result;
}

void MessageDecoder::decode_modbus_(const std::vector<uint8_t> &frame, DecodedMessage &result) const {
  // Register report types also show up with layouts other than the modbus one.
  if (!ModbusMessage::validate_header(frame)) {
    ESP_LOGD(TAG, "Message type %u from %s has no modbus header, not handled", read_uint16(frame, OFFSET_LENGTH),
             result.device_id.c_str());
    result.outcome = DecodeOutcome::UNHANDLED;
    return;
  }

  DecodeError error = DecodeError::NONE;
  auto message = ModbusMessage::parse(frame, &error);
  if (!message.has_value()) {
    ESP_LOGW(TAG, "Dropping modbus message: %s", decode_error_to_string(error));
    result.outcome = DecodeOutcome::DROPPED;
    return;
  }
  ESP_LOGD(TAG, "Modbus %s from %s, %u blocks", modbus_function_to_string(message->function),
           message->device_id.c_str(), (unsigned) message->blocks.size());

  switch (message->function) {
    case ModbusFunction::READ_INPUT_REGISTER:
      if (message->metadata.has_value())
        result.timestamp = message->metadata->iso_timestamp();
      result.registers = message->decode_registers(this->catalog_.input_registers());
      if (this->exceeds_sanity_limit_(result.registers)) {
        result.registers.clear();
        result.outcome = DecodeOutcome::DROPPED;
        return;
      }
      result.outcome = DecodeOutcome::INPUT_REGISTERS;
      break;
    case ModbusFunction::READ_SINGLE_REGISTER:
      if (this->catalog_.get_family() == DeviceFamily::NEO)
        result.power_limit = NeoOutputPowerLimit::parse(frame);
      result.registers = message->decode_registers(this->catalog_.holding_registers());
      result.outcome = DecodeOutcome::HOLDING_REGISTERS;
      break;
    case ModbusFunction::READ_HOLDING_REGISTER:
      result.registers = message->decode_registers(this->catalog_.holding_registers());
      result.outcome = DecodeOutcome::HOLDING_REGISTERS;
      break;
    default:
      // Echo of a write; the new value arrives with the next holding report.
      result.outcome = DecodeOutcome::WRITE_ACK;
      break;
  }
}

bool MessageDecoder::exceeds_sanity_limit_(const std::vector<DecodedRegister> &registers) const {
  for (auto const &reg : registers) {
    auto it = this->sanity_limits_.find(reg.name);
    if (it == this->sanity_limits_.end() || reg.value.is_text())
      continue;
    if (reg.value.number() > it->second) {
      ESP_LOGD(TAG, "Dropping bad payload: %s = %s", reg.name.c_str(), reg.value.to_string().c_str());
      return true;
    }
  }
  return false;
}

}  // namespace grobro
}  // namespace esphome
