#include "grobro_modbus.h"
#include "grobro_constants.h"

#include "esphome/core/helpers.h"
#include "esphome/core/log.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.modbus";

bool is_known_function(uint8_t function) {
  switch (static_cast<ModbusFunction>(function)) {
    case ModbusFunction::READ_HOLDING_REGISTER:
    case ModbusFunction::READ_INPUT_REGISTER:
    case ModbusFunction::READ_SINGLE_REGISTER:
    case ModbusFunction::PRESET_SINGLE_REGISTER:
    case ModbusFunction::PRESET_MULTIPLE_REGISTER:
      return true;
    default:
      return false;
  }
}

const char *modbus_function_to_string(ModbusFunction function) {
  switch (function) {
    case ModbusFunction::READ_HOLDING_REGISTER:
      return "READ_HOLDING_REGISTER";
    case ModbusFunction::READ_INPUT_REGISTER:
      return "READ_INPUT_REGISTER";
    case ModbusFunction::READ_SINGLE_REGISTER:
      return "READ_SINGLE_REGISTER";
    case ModbusFunction::PRESET_SINGLE_REGISTER:
      return "PRESET_SINGLE_REGISTER";
    case ModbusFunction::PRESET_MULTIPLE_REGISTER:
      return "PRESET_MULTIPLE_REGISTER";
    default:
      return "UNKNOWN";
  }
}

static void set_error(DecodeError *error, DecodeError value) {
  if (error != nullptr)
    *error = value;
}

std::vector<uint8_t> ModbusBlock::get_data(const RegisterPosition &position) const {
  if (!this->contains(position.register_no))
    return {};
  size_t pos = static_cast<size_t>(position.register_no - this->start) * 2 + position.offset;
  if (pos + position.size > this->values.size())
    return {};
  return std::vector<uint8_t>(this->values.begin() + pos, this->values.begin() + pos + position.size);
}

std::optional<ModbusBlock> ModbusBlock::parse(const std::vector<uint8_t> &data, size_t offset, DecodeError *error) {
  if (offset + MODBUS_BLOCK_HEADER_SIZE > data.size()) {
    ESP_LOGW(TAG, "Register block header truncated at offset %u", (unsigned) offset);
    set_error(error, DecodeError::MALFORMED_FRAME);
    return {};
  }

  ModbusBlock block;
  block.start = read_uint16(data, offset);
  block.end = read_uint16(data, offset + 2);

  int qty = static_cast<int>(block.end) - static_cast<int>(block.start) + 1;
  if (qty < 1 || qty > MODBUS_MAX_REGISTERS) {
    ESP_LOGW(TAG, "Wrong register count: start=%u, end=%u, qty=%d", block.start, block.end, qty);
    set_error(error, DecodeError::MALFORMED_FRAME);
    return {};
  }

  size_t values_start = offset + MODBUS_BLOCK_HEADER_SIZE;
  size_t values_len = static_cast<size_t>(qty) * 2;
  if (values_start + values_len > data.size()) {
    ESP_LOGW(TAG, "Register block %u-%u truncated: need %u bytes, have %u", block.start, block.end,
             (unsigned) values_len, (unsigned) (data.size() - values_start));
    set_error(error, DecodeError::MALFORMED_FRAME);
    return {};
  }

  block.values.assign(data.begin() + values_start, data.begin() + values_start + values_len);
  set_error(error, DecodeError::NONE);
  return block;
}

std::vector<uint8_t> ModbusBlock::build() const {
  std::vector<uint8_t> data;
  data.reserve(this->size());
  append_uint16(data, this->start);
  append_uint16(data, this->end);
  data.insert(data.end(), this->values.begin(), this->values.end());
  return data;
}

static std::optional<DecodedRegister> decode_register(const std::string &name, const RegisterDescriptor &descriptor,
                                                      const std::vector<uint8_t> &raw) {
  auto value = descriptor.data_type.decode(raw);
  if (!value.has_value()) {
    ESP_LOGV(TAG, "Skipping %s (register %u)", name.c_str(), descriptor.position.register_no);
    return {};
  }
  DecodedRegister decoded;
  decoded.name = name;
  decoded.register_no = descriptor.position.register_no;
  decoded.unit = descriptor.display.unit;
  decoded.value = *value;
  return decoded;
}

bool Timestamp::is_valid() const {
  if (this->month < 1 || this->month > 12)
    return false;
  if (this->day < 1 || this->day > 31)
    return false;
  return this->hour < 24 && this->minute < 60 && this->second < 60;
}

std::optional<std::string> Timestamp::to_iso() const {
  if (!this->is_valid())
    return {};
  return str_sprintf("20%02u-%02u-%02uT%02u:%02u:%02u", this->year, this->month, this->day, this->hour,
                     this->minute, this->second);
}

Timestamp Timestamp::parse(const std::vector<uint8_t> &data, size_t offset) {
  Timestamp ts;
  ts.year = data[offset];
  ts.month = data[offset + 1];
  ts.day = data[offset + 2];
  ts.hour = data[offset + 3];
  ts.minute = data[offset + 4];
  ts.second = data[offset + 5];
  ts.millis = data[offset + 6];
  return ts;
}

void Timestamp::build_into(std::vector<uint8_t> &data) const {
  data.push_back(this->year);
  data.push_back(this->month);
  data.push_back(this->day);
  data.push_back(this->hour);
  data.push_back(this->minute);
  data.push_back(this->second);
  data.push_back(this->millis);
}

bool Timestamp::operator==(const Timestamp &other) const {
  return this->year == other.year && this->month == other.month && this->day == other.day &&
         this->hour == other.hour && this->minute == other.minute && this->second == other.second &&
         this->millis == other.millis;
}

std::optional<BlockReading> parse_block(const std::vector<uint8_t> &data, size_t offset,
                                        const RegisterCatalog::RegisterMap &descriptors, DecodeError *error) {
  auto block = ModbusBlock::parse(data, offset, error);
  if (!block.has_value())
    return {};

  BlockReading reading;
  for (auto const &[name, descriptor] : descriptors) {
    if (!block->contains(descriptor.position.register_no))
      continue;
    auto decoded = decode_register(name, descriptor, block->get_data(descriptor.position));
    if (decoded.has_value())
      reading.registers.push_back(*decoded);
  }
  reading.next_offset = offset + block->size();
  reading.block = std::move(*block);
  return reading;
}

std::vector<DecodedRegister> ReplayMessage::registers() const {
  std::vector<DecodedRegister> result;
  if (this->modbus1.has_value())
    result.insert(result.end(), this->modbus1->registers.begin(), this->modbus1->registers.end());
  if (this->modbus2.has_value())
    result.insert(result.end(), this->modbus2->registers.begin(), this->modbus2->registers.end());
  return result;
}

std::optional<ReplayMessage> parse_modbus_message(const std::vector<uint8_t> &data,
                                                  const RegisterCatalog::RegisterMap &descriptors) {
  if (data.size() < REPLAY_PREAMBLE_SIZE) {
    ESP_LOGW(TAG, "Register report too short: %u bytes", (unsigned) data.size());
    return {};
  }

  ReplayMessage message;
  size_t offset = 0;
  message.msg_ctr = read_uint16(data, offset);
  message.unknown_1 = read_uint16(data, offset + 2);
  message.msg_length = read_uint16(data, offset + 4);
  message.msg_type = read_uint16(data, offset + 6);
  offset += HEADER_SIZE;

  message.device_id = read_ascii(data, offset, REPLAY_DEVICE_ID_SIZE);
  offset += REPLAY_DEVICE_ID_SIZE + REPLAY_RESERVED_1_SIZE;

  message.device_sn = read_ascii(data, offset, REPLAY_SERIAL_SIZE);
  offset += REPLAY_SERIAL_SIZE + REPLAY_RESERVED_2_SIZE;

  message.timestamp = Timestamp::parse(data, offset).to_iso();
  offset += TIMESTAMP_SIZE;

  DecodeError error = DecodeError::NONE;
  message.modbus1 = parse_block(data, offset, descriptors, &error);
  if (!message.modbus1.has_value()) {
    message.modbus1_error = str_sprintf("%s at offset %u", decode_error_to_string(error), (unsigned) offset);
    ESP_LOGD(TAG, "First register block of %s unreadable: %s", message.device_id.c_str(),
             message.modbus1_error.c_str());
    return message;
  }

  offset = message.modbus1->next_offset;
  if (offset < data.size())
    message.modbus2 = parse_block(data, offset, descriptors);

  return message;
}

uint16_t ModbusMessage::msg_len() const {
  // Function word and device id count towards the length, the rest of the
  // header does not.
  size_t len = MODBUS_HEADER_SIZE - LENGTH_FIELD_END;
  if (this->metadata.has_value())
    len += METADATA_SIZE;
  for (auto const &block : this->blocks)
    len += block.size();
  return static_cast<uint16_t>(len);
}

std::vector<uint8_t> ModbusMessage::get_data(const RegisterPosition &position) const {
  for (auto const &block : this->blocks) {
    if (block.contains(position.register_no))
      return block.get_data(position);
  }
  return {};
}

std::vector<DecodedRegister> ModbusMessage::decode_registers(const RegisterCatalog::RegisterMap &descriptors) const {
  std::vector<DecodedRegister> registers;
  for (auto const &[name, descriptor] : descriptors) {
    auto decoded = decode_register(name, descriptor, this->get_data(descriptor.position));
    if (decoded.has_value())
      registers.push_back(*decoded);
  }
  return registers;
}

bool ModbusMessage::validate_header(const std::vector<uint8_t> &frame) {
  if (frame.size() < MODBUS_HEADER_SIZE)
    return false;
  if (read_uint16(frame, OFFSET_LENGTH) != frame.size() - LENGTH_FIELD_END)
    return false;
  return is_known_function(frame[OFFSET_FUNCTION]);
}

std::optional<ModbusMessage> ModbusMessage::parse(const std::vector<uint8_t> &frame, DecodeError *error) {
  if (frame.size() < MODBUS_HEADER_SIZE) {
    ESP_LOGW(TAG, "Modbus message too short: %u bytes", (unsigned) frame.size());
    set_error(error, DecodeError::MALFORMED_FRAME);
    return {};
  }

  uint16_t msg_len = read_uint16(frame, OFFSET_LENGTH);
  if (msg_len != frame.size() - LENGTH_FIELD_END) {
    ESP_LOGD(TAG, "Length field %u does not match frame of %u bytes", msg_len, (unsigned) frame.size());
    set_error(error, DecodeError::MALFORMED_FRAME);
    return {};
  }

  ModbusMessage message;
  message.counter = read_uint16(frame, OFFSET_COUNTER);
  message.device_id = read_ascii(frame, HEADER_SIZE, DEVICE_ID_FIELD_SIZE);

  uint8_t function = frame[OFFSET_FUNCTION];
  if (!is_known_function(function)) {
    ESP_LOGI(TAG, "Unknown modbus function for %s: %u", message.device_id.c_str(), function);
    set_error(error, DecodeError::UNKNOWN_FUNCTION);
    return {};
  }
  message.function = static_cast<ModbusFunction>(function);

  size_t offset = MODBUS_HEADER_SIZE;
  if (message.function == ModbusFunction::READ_INPUT_REGISTER) {
    if (offset + METADATA_SIZE > frame.size()) {
      ESP_LOGW(TAG, "Metadata of %s truncated", message.device_id.c_str());
      set_error(error, DecodeError::MALFORMED_FRAME);
      return {};
    }
    ModbusMetadata metadata;
    metadata.device_sn = read_ascii(frame, offset, METADATA_SERIAL_SIZE);
    metadata.timestamp = Timestamp::parse(frame, offset + METADATA_SERIAL_SIZE);
    message.metadata = metadata;
    offset += METADATA_SIZE;
  }

  while (frame.size() > offset + MODBUS_BLOCK_HEADER_SIZE) {
    auto block = ModbusBlock::parse(frame, offset);
    if (!block.has_value()) {
      ESP_LOGW(TAG, "Stopping at bad register block, keeping %u blocks", (unsigned) message.blocks.size());
      break;
    }
    offset += block->size();
    message.blocks.push_back(std::move(*block));
  }

  set_error(error, DecodeError::NONE);
  return message;
}

std::vector<uint8_t> ModbusMessage::build() const {
  std::vector<uint8_t> data;
  append_uint16(data, this->counter);
  append_uint16(data, PROTOCOL_CONSTANT);
  append_uint16(data, this->msg_len());
  data.push_back(MODBUS_ADDRESS);
  data.push_back(static_cast<uint8_t>(this->function));
  append_padded_ascii(data, this->device_id, DEVICE_ID_FIELD_SIZE);
  if (this->metadata.has_value()) {
    append_padded_ascii(data, this->metadata->device_sn, METADATA_SERIAL_SIZE);
    this->metadata->timestamp.build_into(data);
  }
  for (auto const &block : this->blocks) {
    auto bytes = block.build();
    data.insert(data.end(), bytes.begin(), bytes.end());
  }
  return data;
}

bool ModbusMessage::operator==(const ModbusMessage &other) const {
  return this->counter == other.counter && this->device_id == other.device_id && this->function == other.function &&
         this->metadata == other.metadata && this->blocks == other.blocks;
}

}  // namespace grobro
}  // namespace esphome
