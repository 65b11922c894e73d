#include "grobro_registers.h"
#include "grobro_frame.h"

#include "esphome/core/helpers.h"
#include "esphome/core/log.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.registers";

DeviceFamily detect_device_family(const std::string &device_id) {
  if (str_startswith(device_id, "QMN"))
    return DeviceFamily::NEO;
  if (str_startswith(device_id, "0PVP"))
    return DeviceFamily::NOAH;
  if (str_startswith(device_id, "0HVR"))
    return DeviceFamily::NEXA;
  return DeviceFamily::UNKNOWN;
}

const char *device_family_to_string(DeviceFamily family) {
  switch (family) {
    case DeviceFamily::NEO:
      return "NEO";
    case DeviceFamily::NOAH:
      return "NOAH";
    case DeviceFamily::NEXA:
      return "NEXA";
    default:
      return "UNKNOWN";
  }
}

RegisterValue RegisterValue::from_number(double value) {
  RegisterValue result;
  result.number_ = value;
  return result;
}

RegisterValue RegisterValue::from_text(const std::string &text) {
  RegisterValue result;
  result.is_text_ = true;
  result.text_ = text;
  return result;
}

std::string RegisterValue::to_string() const {
  if (this->is_text_)
    return this->text_;
  return value_accuracy_to_string(static_cast<float>(this->number_), 3);
}

bool RegisterValue::operator==(const RegisterValue &other) const {
  if (this->is_text_ != other.is_text_)
    return false;
  if (this->is_text_)
    return this->text_ == other.text_;
  return this->number_ == other.number_;
}

RegisterDataType RegisterDataType::make_float(double multiplier, double delta) {
  RegisterDataType type;
  type.kind_ = RegisterKind::FLOAT;
  type.multiplier_ = multiplier;
  type.delta_ = delta;
  return type;
}

RegisterDataType RegisterDataType::make_enum(EnumKind enum_kind, const std::map<int64_t, std::string> &values) {
  RegisterDataType type;
  type.kind_ = RegisterKind::ENUM;
  type.enum_kind_ = enum_kind;
  type.enum_values_ = values;
  return type;
}

RegisterDataType RegisterDataType::make_string() {
  RegisterDataType type;
  type.kind_ = RegisterKind::STRING;
  return type;
}

std::optional<RegisterValue> RegisterDataType::decode(const std::vector<uint8_t> &raw) const {
  if (raw.empty())
    return {};

  if (this->kind_ == RegisterKind::STRING)
    return RegisterValue::from_text(read_ascii(raw, 0, raw.size()));

  uint32_t value;
  switch (raw.size()) {
    case 1:
      value = raw[0];
      break;
    case 2:
      value = read_uint16(raw, 0);
      break;
    case 4:
      value = read_uint32(raw, 0);
      break;
    default:
      ESP_LOGV(TAG, "Unsupported register width: %u bytes", (unsigned) raw.size());
      return {};
  }

  if (this->kind_ == RegisterKind::FLOAT) {
    double scaled = value * this->multiplier_ + this->delta_;
    return RegisterValue::from_number(std::round(scaled * 1000.0) / 1000.0);
  }

  // TODO: decode BITFIELD enums once the bit layouts of the flag registers are known
  if (this->enum_kind_ == EnumKind::BITFIELD)
    return {};
  if (this->enum_values_.count(static_cast<int64_t>(value)) == 0)
    return {};
  return RegisterValue::from_number(value);
}

std::string RegisterDataType::enum_label(int64_t code) const {
  auto it = this->enum_values_.find(code);
  if (it == this->enum_values_.end())
    return "";
  return it->second;
}

void RegisterCatalog::add_input_register(const std::string &name, const RegisterDescriptor &descriptor) {
  if (this->input_registers_.count(name) != 0)
    ESP_LOGW(TAG, "Input register '%s' defined twice, keeping the last one", name.c_str());
  this->input_registers_[name] = descriptor;
}

void RegisterCatalog::add_holding_register(const std::string &name, const RegisterDescriptor &descriptor) {
  if (this->holding_registers_.count(name) != 0)
    ESP_LOGW(TAG, "Holding register '%s' defined twice, keeping the last one", name.c_str());
  this->holding_registers_[name] = descriptor;
}

const RegisterDescriptor *RegisterCatalog::find_input(const std::string &name) const {
  auto it = this->input_registers_.find(name);
  if (it == this->input_registers_.end())
    return nullptr;
  return &it->second;
}

const RegisterDescriptor *RegisterCatalog::find_holding(const std::string &name) const {
  auto it = this->holding_registers_.find(name);
  if (it == this->holding_registers_.end())
    return nullptr;
  return &it->second;
}

const RegisterDescriptor *RegisterCatalog::find_holding_by_register(uint16_t register_no) const {
  for (auto const &entry : this->holding_registers_) {
    if (entry.second.position.register_no == register_no)
      return &entry.second;
  }
  return nullptr;
}

}  // namespace grobro
}  // namespace esphome
