#include "grobro_entity.h"

#include <cmath>

namespace esphome {
namespace grobro {

RegisterDataType GrobroRegisterBinding::get_data_type() const {
  if (this->string_)
    return RegisterDataType::make_string();
  if (this->bitfield_)
    return RegisterDataType::make_enum(EnumKind::BITFIELD, this->enum_values_);
  if (!this->enum_values_.empty())
    return RegisterDataType::make_enum(EnumKind::INT_MAP, this->enum_values_);
  return RegisterDataType::make_float(this->multiplier_, this->delta_);
}

RegisterDescriptor GrobroRegisterBinding::build_descriptor(const std::string &name, const char *entity_type) const {
  RegisterDescriptor descriptor;
  descriptor.position = this->position_;
  descriptor.data_type = this->get_data_type();
  descriptor.display.name = name;
  descriptor.display.entity_type = entity_type;
  return descriptor;
}

std::optional<uint16_t> GrobroRegisterBinding::to_raw(float value) const {
  if (this->multiplier_ == 0.0f || std::isnan(value))
    return {};
  float raw = std::round((value - this->delta_) / this->multiplier_);
  if (raw < 0.0f || raw > 65535.0f)
    return {};
  return static_cast<uint16_t>(raw);
}

}  // namespace grobro
}  // namespace esphome
